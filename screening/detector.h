#pragma once

#include "screening/detected_entity.h"

#include <cstddef>
#include <string>
#include <vector>

namespace promptgate {

// Hard ceiling on the text a detector will run its patterns over. Longer
// input is reported as a detection without being matched.
constexpr std::size_t kMaxScreenableChars = 64 * 1024;

class CancellationToken;
class CompletionClient;

// Seams between the screening pipeline and its detectors. Implementations
// are read-only after construction and safe to share across request threads.

class SensitiveDataDetector {
 public:
  virtual ~SensitiveDataDetector() = default;

  // Non-overlapping entities ordered by ascending start.
  virtual std::vector<DetectedEntity> Scan(const std::string& text) const = 0;

  bool ContainsSensitiveData(const std::string& text) const {
    return !Scan(text).empty();
  }
  std::string Summarize(const std::string& text) const {
    return SummarizeEntities(Scan(text));
  }
};

enum class InjectionTier { kNone, kPattern, kClassifier, kFault };

const char* InjectionTierName(InjectionTier tier);

struct InjectionResult {
  bool blocked{false};
  std::string method{"none"};
  double confidence{0.0};
  InjectionTier tier{InjectionTier::kNone};
};

class InjectionDetector {
 public:
  virtual ~InjectionDetector() = default;

  // `classifier` may be null, in which case only deterministic matching runs.
  virtual InjectionResult IsJailbreakAttempt(
      const std::string& text, CompletionClient* classifier,
      const CancellationToken* cancel) const = 0;
};

}  // namespace promptgate
