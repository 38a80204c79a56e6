#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace promptgate {

// One failed attempt against the completion API. The message starts with the
// HTTP status when there is one ("404 NOT_FOUND: ...").
class UpstreamError : public std::runtime_error {
 public:
  explicit UpstreamError(const std::string& what, int status = 0)
      : std::runtime_error(what), status_(status) {}
  int status() const { return status_; }

 private:
  int status_;
};

// Every model candidate failed. The message names the candidate count and the
// last underlying failure; it is logged, never shown to API callers.
class UpstreamExhaustedError : public std::runtime_error {
 public:
  UpstreamExhaustedError(const std::string& what, std::size_t candidates_tried)
      : std::runtime_error(what), candidates_tried_(candidates_tried) {}
  std::size_t candidates_tried() const { return candidates_tried_; }

 private:
  std::size_t candidates_tried_;
};

enum class UpstreamFailureKind {
  kNotFound,     // Model id unknown or retired: skip the candidate.
  kRateLimited,  // 429 / quota exhausted: skip the candidate.
  kTransient,    // Anything else: retry the same candidate with backoff.
};

// Classifies an error message by its identifying substrings and codes.
UpstreamFailureKind ClassifyUpstreamFailure(const std::string& message);

// HTTP 404 and 429 decide directly; any other status falls back to the
// message.
UpstreamFailureKind ClassifyUpstreamFailure(const UpstreamError& error);

inline bool SkipsCandidate(UpstreamFailureKind kind) {
  return kind != UpstreamFailureKind::kTransient;
}

const char* UpstreamFailureKindName(UpstreamFailureKind kind);

}  // namespace promptgate
