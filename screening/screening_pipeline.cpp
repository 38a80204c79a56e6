#include "screening/screening_pipeline.h"

#include "net/cancellation_token.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "upstream/completion_client.h"

#include <chrono>
#include <string>

namespace promptgate {

namespace {

constexpr const char* kFailClosedDetail = "Detection error - failing closed for security";

}  // namespace

const char* PipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::kScreenPii:
      return "screen_pii";
    case PipelineState::kScreenInjection:
      return "screen_injection";
    case PipelineState::kInvokeModel:
      return "invoke_model";
    case PipelineState::kComplete:
      return "complete";
    case PipelineState::kBlockedPii:
      return "blocked_pii";
    case PipelineState::kBlockedInjection:
      return "blocked_injection";
    case PipelineState::kUpstreamError:
      return "upstream_error";
  }
  return "unknown";
}

bool IsTerminal(PipelineState state) {
  return state == PipelineState::kComplete ||
         state == PipelineState::kBlockedPii ||
         state == PipelineState::kBlockedInjection ||
         state == PipelineState::kUpstreamError;
}

ScreeningPipeline::ScreeningPipeline(const SensitiveDataDetector& pii,
                                     const InjectionDetector& injection,
                                     CompletionClient& completion,
                                     CompletionClient* classifier,
                                     AuditLogger* audit,
                                     MetricsRegistry* metrics,
                                     std::size_t max_prompt_chars)
    : pii_(pii),
      injection_(injection),
      completion_(completion),
      classifier_(classifier),
      audit_(audit),
      metrics_(metrics),
      max_prompt_chars_(max_prompt_chars) {}

ScreeningVerdict ScreeningPipeline::ScreenPii(const std::string& text) const {
  if (text.size() > max_prompt_chars_) {
    log::Warn("pipeline", "Prompt over the screenable length (blocking)",
              "chars=" + std::to_string(text.size()) +
                  " limit=" + std::to_string(max_prompt_chars_));
    if (metrics_) {
      metrics_->RecordDetectorFault("length");
    }
    return ScreeningVerdict::Block(
        VerdictCategory::kPii, "Prompt exceeds " + std::to_string(max_prompt_chars_) +
                                   " characters - failing closed for security");
  }
  std::vector<DetectedEntity> entities;
  try {
    entities = pii_.Scan(text);
  } catch (const std::exception& ex) {
    log::Error("pipeline", "PII detector fault (blocking)", ex.what());
    if (metrics_) {
      metrics_->RecordDetectorFault("pii");
    }
    return ScreeningVerdict::Block(VerdictCategory::kPii, kFailClosedDetail);
  }
  if (entities.empty()) {
    return ScreeningVerdict::Pass();
  }
  if (metrics_) {
    for (const auto& entity : entities) {
      metrics_->RecordPiiEntity(EntityTypeName(entity.entity_type));
    }
  }
  return ScreeningVerdict::Block(VerdictCategory::kPii, SummarizeEntities(entities));
}

ScreeningVerdict ScreeningPipeline::ScreenInjection(
    const std::string& text, const CancellationToken* cancel) const {
  InjectionResult result;
  try {
    result = injection_.IsJailbreakAttempt(text, classifier_, cancel);
  } catch (const RequestCancelled&) {
    throw;
  } catch (const std::exception& ex) {
    log::Error("pipeline", "Injection detector fault (blocking)", ex.what());
    if (metrics_) {
      metrics_->RecordDetectorFault("injection");
      metrics_->RecordInjection(InjectionTierName(InjectionTier::kFault));
    }
    return ScreeningVerdict::Block(VerdictCategory::kInjection, kFailClosedDetail);
  }
  if (!result.blocked) {
    return ScreeningVerdict::Pass();
  }
  if (metrics_) {
    metrics_->RecordInjection(InjectionTierName(result.tier));
    if (result.tier == InjectionTier::kFault) {
      metrics_->RecordDetectorFault("injection");
    }
  }
  return ScreeningVerdict::Block(VerdictCategory::kInjection, result.method);
}

ScreeningVerdict ScreeningPipeline::Screen(const std::string& text,
                                           const CancellationToken* cancel) const {
  if (cancel) {
    cancel->ThrowIfCancelled("PII screening");
  }
  auto verdict = ScreenPii(text);
  if (verdict.blocked) {
    return verdict;
  }
  if (cancel) {
    cancel->ThrowIfCancelled("injection screening");
  }
  return ScreenInjection(text, cancel);
}

std::string ScreeningPipeline::Complete(const std::string& prompt,
                                        const CancellationToken* cancel) {
  if (cancel) {
    cancel->ThrowIfCancelled("model invocation");
  }
  return completion_.Complete(prompt, cancel);
}

void ScreeningPipeline::Audit(PipelineState state, const std::string& client_ip,
                              const std::string& text) const {
  if (!audit_) {
    return;
  }
  switch (state) {
    case PipelineState::kBlockedPii:
      audit_->LogPiiDetection(client_ip, text);
      break;
    case PipelineState::kBlockedInjection:
      audit_->LogInjectionDetection(client_ip, text);
      break;
    case PipelineState::kComplete:
      audit_->LogSafeRequest(client_ip, text);
      break;
    case PipelineState::kUpstreamError:
      audit_->LogUpstreamError(client_ip, text);
      break;
    default:
      break;
  }
}

PipelineOutcome ScreeningPipeline::Process(const std::string& text,
                                           const std::string& client_ip,
                                           const CancellationToken* cancel) {
  auto started = std::chrono::steady_clock::now();
  PipelineOutcome outcome;
  try {
    outcome.state = PipelineState::kScreenPii;
    if (cancel) {
      cancel->ThrowIfCancelled("PII screening");
    }
    outcome.verdict = ScreenPii(text);
    if (outcome.verdict.blocked) {
      outcome.state = PipelineState::kBlockedPii;
    } else {
      outcome.state = PipelineState::kScreenInjection;
      if (cancel) {
        cancel->ThrowIfCancelled("injection screening");
      }
      outcome.verdict = ScreenInjection(text, cancel);
      if (outcome.verdict.blocked) {
        outcome.state = PipelineState::kBlockedInjection;
      } else {
        outcome.state = PipelineState::kInvokeModel;
        outcome.response = Complete(text, cancel);
        outcome.state = PipelineState::kComplete;
      }
    }
  } catch (const RequestCancelled& ex) {
    log::Warn("pipeline", "Request cancelled",
              std::string("stage=") + PipelineStateName(outcome.state) + " " + ex.what());
    outcome.state = PipelineState::kUpstreamError;
    outcome.response.clear();
  } catch (const std::exception& ex) {
    log::Error("pipeline", "Model invocation failed", ex.what());
    outcome.state = PipelineState::kUpstreamError;
    outcome.response.clear();
  }

  if (outcome.verdict.blocked) {
    log::Info("pipeline", "Request blocked",
              std::string("category=") + VerdictCategoryName(outcome.verdict.category) +
                  " detail=" + outcome.verdict.detail);
  }
  Audit(outcome.state, client_ip, text);
  if (metrics_) {
    metrics_->RecordRequest(PipelineStateName(outcome.state));
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started);
    metrics_->RecordLatency(elapsed.count());
  }
  return outcome;
}

}  // namespace promptgate
