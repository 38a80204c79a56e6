#pragma once

#include <string>

namespace promptgate {

class CancellationToken;

// UpstreamModelApi is the raw completion endpoint: one call against one
// model, no retries. Implementations throw (UpstreamError or any
// std::exception) on failure and RequestCancelled when `cancel` fires.
//
// Thread safety: Generate() may be called concurrently.
class UpstreamModelApi {
 public:
  virtual ~UpstreamModelApi() = default;

  virtual std::string Generate(const std::string& model,
                               const std::string& prompt,
                               const CancellationToken* cancel) = 0;

  // Identity, for logging.
  virtual std::string Name() const = 0;
};

// CompletionClient turns a prompt into text, hiding model selection. The
// injection classifier and the screening pipeline depend on this seam.
class CompletionClient {
 public:
  virtual ~CompletionClient() = default;

  virtual std::string Complete(const std::string& prompt,
                               const CancellationToken* cancel = nullptr) = 0;
};

}  // namespace promptgate
