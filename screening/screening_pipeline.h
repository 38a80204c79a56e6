#pragma once

#include "screening/detected_entity.h"
#include "screening/detector.h"

#include <string>

namespace promptgate {

class AuditLogger;
class CancellationToken;
class CompletionClient;
class MetricsRegistry;

enum class PipelineState {
  kScreenPii,
  kScreenInjection,
  kInvokeModel,
  kComplete,
  kBlockedPii,
  kBlockedInjection,
  kUpstreamError,
};

// Lower-case label, also used as the metrics outcome.
const char* PipelineStateName(PipelineState state);

bool IsTerminal(PipelineState state);

struct PipelineOutcome {
  PipelineState state{PipelineState::kScreenPii};
  ScreeningVerdict verdict;
  std::string response;
};

// Runs a request through the PII gate, the injection gate and, only when
// both pass, the completion client. A positive detection ends the request;
// a detector that throws is treated as a positive detection.
//
// Text longer than `max_prompt_chars` is blocked at the PII gate without
// being scanned.
//
// Collaborators are borrowed and must outlive the pipeline. `classifier`,
// `audit` and `metrics` may be null.
class ScreeningPipeline {
 public:
  ScreeningPipeline(const SensitiveDataDetector& pii,
                    const InjectionDetector& injection,
                    CompletionClient& completion,
                    CompletionClient* classifier = nullptr,
                    AuditLogger* audit = nullptr,
                    MetricsRegistry* metrics = nullptr,
                    std::size_t max_prompt_chars = kMaxScreenableChars);

  // Both gates, no model call. RequestCancelled propagates.
  ScreeningVerdict Screen(const std::string& text,
                          const CancellationToken* cancel = nullptr) const;

  // Model call only. Throws UpstreamExhaustedError or RequestCancelled.
  std::string Complete(const std::string& prompt,
                       const CancellationToken* cancel = nullptr);

  // Full state machine, with audit entry and metrics. Never throws for
  // detector or upstream failures.
  PipelineOutcome Process(const std::string& text,
                          const std::string& client_ip,
                          const CancellationToken* cancel = nullptr);

 private:
  ScreeningVerdict ScreenPii(const std::string& text) const;
  ScreeningVerdict ScreenInjection(const std::string& text,
                                   const CancellationToken* cancel) const;
  void Audit(PipelineState state, const std::string& client_ip,
             const std::string& text) const;

  const SensitiveDataDetector& pii_;
  const InjectionDetector& injection_;
  CompletionClient& completion_;
  CompletionClient* classifier_;
  AuditLogger* audit_;
  MetricsRegistry* metrics_;
  std::size_t max_prompt_chars_;
};

}  // namespace promptgate
