#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace promptgate {

enum class EntityType {
  kEmail,
  kPhoneUs,
  kPhoneInternational,
  kSsn,
  kCreditCard,
  kIpAddress,
  kIban,
  kCryptoWallet,
  kApiKey,
  kUnknown,  // Synthetic entity reported when the scanner itself faults.
};

// Upper-case wire name ("EMAIL", "PHONE_US", ...).
const char* EntityTypeName(EntityType type);

// One sensitive span in the scanned text. Offsets are byte offsets into the
// input, half-open [start, end).
struct DetectedEntity {
  EntityType entity_type{EntityType::kUnknown};
  std::size_t start{0};
  std::size_t end{0};
  double score{0.0};
  std::string text;

  std::size_t length() const { return end - start; }
  bool Overlaps(const DetectedEntity& other) const {
    return !(end <= other.start || start >= other.end);
  }
};

// "No PII detected", or "Detected: 2 EMAIL(s), 1 SSN(s)" with types listed in
// order of first appearance.
std::string SummarizeEntities(const std::vector<DetectedEntity>& entities);

enum class VerdictCategory { kNone, kPii, kInjection };

const char* VerdictCategoryName(VerdictCategory category);

struct ScreeningVerdict {
  bool blocked{false};
  VerdictCategory category{VerdictCategory::kNone};
  std::string detail;

  static ScreeningVerdict Pass() { return {}; }
  static ScreeningVerdict Block(VerdictCategory category, std::string detail) {
    return {true, category, std::move(detail)};
  }
};

}  // namespace promptgate
