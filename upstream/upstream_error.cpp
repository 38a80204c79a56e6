#include "upstream/upstream_error.h"

#include <algorithm>
#include <cctype>

namespace promptgate {

UpstreamFailureKind ClassifyUpstreamFailure(const std::string& message) {
  std::string lower = message;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (message.find("404") != std::string::npos ||
      lower.find("not found") != std::string::npos) {
    return UpstreamFailureKind::kNotFound;
  }
  if (message.find("429") != std::string::npos ||
      lower.find("quota") != std::string::npos ||
      message.find("RESOURCE_EXHAUSTED") != std::string::npos) {
    return UpstreamFailureKind::kRateLimited;
  }
  return UpstreamFailureKind::kTransient;
}

UpstreamFailureKind ClassifyUpstreamFailure(const UpstreamError& error) {
  if (error.status() == 404) {
    return UpstreamFailureKind::kNotFound;
  }
  if (error.status() == 429) {
    return UpstreamFailureKind::kRateLimited;
  }
  return ClassifyUpstreamFailure(std::string(error.what()));
}

const char* UpstreamFailureKindName(UpstreamFailureKind kind) {
  switch (kind) {
    case UpstreamFailureKind::kNotFound:
      return "not_found";
    case UpstreamFailureKind::kRateLimited:
      return "rate_limited";
    case UpstreamFailureKind::kTransient:
      return "transient";
  }
  return "unknown";
}

}  // namespace promptgate
