#pragma once

#include "upstream/completion_client.h"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace promptgate {

class MetricsRegistry;

struct CompletionPolicy {
  // Initial sticky preferred model.
  std::string preferred_model{"gemini-flash-latest"};
  // Fixed fallback sequence tried after the preferred model.
  std::vector<std::string> fallback_models{"gemini-2.5-flash",
                                           "gemini-flash-lite-latest",
                                           "gemini-2.0-flash-lite"};
  // Attempts per candidate (first try included).
  int max_retries{3};
  // Delay before retry n (0-based) is backoff_base_seconds^n.
  double backoff_base_seconds{2.0};
};

// Waits between retries. Returns false if the wait was cut short by
// cancellation.
class BackoffSleeper {
 public:
  virtual ~BackoffSleeper() = default;
  virtual bool Sleep(std::chrono::milliseconds delay,
                     const CancellationToken* cancel) = 0;
};

// Sleeps on the request's cancellation token, or the calling thread when
// there is none.
class TokenBackoffSleeper : public BackoffSleeper {
 public:
  bool Sleep(std::chrono::milliseconds delay,
             const CancellationToken* cancel) override;
};

// CompletionClient that walks an ordered list of model candidates with
// bounded retry and exponential backoff:
//
//   - not-found / rate-limited errors abandon the candidate immediately;
//   - other errors and blank responses retry the same candidate;
//   - a success on a candidate other than the preferred model makes it the
//     new preferred model for later requests.
//
// Throws UpstreamExhaustedError when every candidate failed and
// RequestCancelled when `cancel` fires. The preferred model is the only
// state shared across requests; updates are last-writer-wins.
class ResilientCompletionClient : public CompletionClient {
 public:
  ResilientCompletionClient(UpstreamModelApi& api, CompletionPolicy policy,
                            BackoffSleeper* sleeper = nullptr,
                            MetricsRegistry* metrics = nullptr);

  std::string Complete(const std::string& prompt,
                       const CancellationToken* cancel = nullptr) override;

  std::string PreferredModel() const;

  // Preferred model first, then the remaining configured models in their
  // fixed order.
  std::vector<std::string> CandidateList() const;

  static std::chrono::milliseconds BackoffDelay(double base, int attempt);

 private:
  void PromoteModel(const std::string& model);

  UpstreamModelApi& api_;
  CompletionPolicy policy_;
  std::vector<std::string> ordered_models_;
  TokenBackoffSleeper default_sleeper_;
  BackoffSleeper* sleeper_;
  MetricsRegistry* metrics_;

  mutable std::mutex preferred_mutex_;
  std::string preferred_model_;
};

}  // namespace promptgate
