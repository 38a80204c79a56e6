#include "upstream/resilient_completion_client.h"

#include "net/cancellation_token.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "upstream/upstream_error.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

namespace promptgate {

namespace {
std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(start, end - start + 1);
}
}  // namespace

bool TokenBackoffSleeper::Sleep(std::chrono::milliseconds delay,
                                const CancellationToken* cancel) {
  if (cancel) {
    return cancel->WaitFor(delay);
  }
  std::this_thread::sleep_for(delay);
  return true;
}

ResilientCompletionClient::ResilientCompletionClient(UpstreamModelApi& api,
                                                     CompletionPolicy policy,
                                                     BackoffSleeper* sleeper,
                                                     MetricsRegistry* metrics)
    : api_(api),
      policy_(std::move(policy)),
      sleeper_(sleeper ? sleeper : &default_sleeper_),
      metrics_(metrics) {
  if (policy_.max_retries < 1) {
    throw std::invalid_argument("max_retries must be at least 1");
  }
  if (policy_.preferred_model.empty()) {
    throw std::invalid_argument("preferred_model must not be empty");
  }
  ordered_models_.push_back(policy_.preferred_model);
  for (const auto& model : policy_.fallback_models) {
    if (!model.empty() &&
        std::find(ordered_models_.begin(), ordered_models_.end(), model) ==
            ordered_models_.end()) {
      ordered_models_.push_back(model);
    }
  }
  preferred_model_ = policy_.preferred_model;
}

std::string ResilientCompletionClient::PreferredModel() const {
  std::lock_guard<std::mutex> lock(preferred_mutex_);
  return preferred_model_;
}

std::vector<std::string> ResilientCompletionClient::CandidateList() const {
  auto preferred = PreferredModel();
  std::vector<std::string> candidates;
  candidates.reserve(ordered_models_.size() + 1);
  candidates.push_back(preferred);
  for (const auto& model : ordered_models_) {
    if (model != preferred) {
      candidates.push_back(model);
    }
  }
  return candidates;
}

std::chrono::milliseconds ResilientCompletionClient::BackoffDelay(double base,
                                                                  int attempt) {
  double seconds = std::pow(base, attempt);
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

void ResilientCompletionClient::PromoteModel(const std::string& model) {
  std::string previous;
  {
    std::lock_guard<std::mutex> lock(preferred_mutex_);
    if (preferred_model_ == model) {
      return;
    }
    previous = preferred_model_;
    preferred_model_ = model;
  }
  log::Info("upstream", "Preferred model updated after fallback",
            "from=" + previous + " to=" + model);
  if (metrics_) {
    metrics_->RecordModelFallback(model);
  }
}

std::string ResilientCompletionClient::Complete(const std::string& prompt,
                                                const CancellationToken* cancel) {
  auto candidates = CandidateList();
  std::string last_error = "no attempt made";

  for (const auto& model : candidates) {
    for (int attempt = 0; attempt < policy_.max_retries; ++attempt) {
      if (cancel) {
        cancel->ThrowIfCancelled("completion");
      }
      std::string failure;
      UpstreamFailureKind kind = UpstreamFailureKind::kTransient;
      try {
        auto text = Trim(api_.Generate(model, prompt, cancel));
        if (text.empty()) {
          throw UpstreamError("Empty response from model");
        }
        if (metrics_) {
          metrics_->RecordUpstreamAttempt(model, true);
        }
        PromoteModel(model);
        return text;
      } catch (const RequestCancelled&) {
        throw;
      } catch (const UpstreamError& ex) {
        failure = ex.what();
        kind = ClassifyUpstreamFailure(ex);
      } catch (const std::exception& ex) {
        failure = ex.what();
        kind = ClassifyUpstreamFailure(failure);
      }

      last_error = failure;
      if (metrics_) {
        metrics_->RecordUpstreamAttempt(model, false);
      }
      if (SkipsCandidate(kind)) {
        log::Warn("upstream", "Abandoning model candidate",
                  "api=" + api_.Name() + " model=" + model +
                      " reason=" + UpstreamFailureKindName(kind));
        if (metrics_) {
          metrics_->RecordCandidateSkip(UpstreamFailureKindName(kind));
        }
        break;
      }
      log::Warn("upstream", "Completion attempt failed",
                "api=" + api_.Name() + " model=" + model +
                    " attempt=" + std::to_string(attempt + 1) +
                    "/" + std::to_string(policy_.max_retries) +
                    " error=" + failure);
      if (attempt + 1 < policy_.max_retries) {
        if (metrics_) {
          metrics_->RecordUpstreamRetry();
        }
        auto delay = BackoffDelay(policy_.backoff_base_seconds, attempt);
        if (!sleeper_->Sleep(delay, cancel)) {
          if (cancel) {
            cancel->ThrowIfCancelled("completion backoff");
          }
          throw RequestCancelled("completion backoff interrupted");
        }
      }
    }
  }

  throw UpstreamExhaustedError("Failed to generate response after trying " +
                                   std::to_string(candidates.size()) +
                                   " model(s): " + last_error,
                               candidates.size());
}

}  // namespace promptgate
