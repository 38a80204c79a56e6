#pragma once

#include "screening/detector.h"

#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace promptgate {

// One row of the scanner's table: a matcher for an entity type plus the
// validator every raw match must pass before it is reported.
struct EntityPattern {
  EntityType type;
  std::regex pattern;
  std::function<bool(const std::string&)> validator;
};

// Built-in table. Order matters: when two accepted matches start at the same
// offset and have the same length, the earlier row wins overlap resolution,
// so the more specific types come first. A type may own several rows.
std::vector<EntityPattern> DefaultEntityPatterns();

// Pattern-based PII detector.
//
// Scan() runs every pattern over the text, keeps the matches their validator
// accepts, and resolves overlaps so that the result is non-overlapping and
// ordered by start. Any fault while scanning fails closed: the result is a
// single UNKNOWN entity covering the input, so the text is never treated as
// clean because the scanner broke. Input longer than `max_input_chars` takes
// the same path without being matched.
class PiiScanner : public SensitiveDataDetector {
 public:
  PiiScanner();
  explicit PiiScanner(std::vector<EntityPattern> patterns,
                      std::size_t max_input_chars = kMaxScreenableChars);

  std::vector<DetectedEntity> Scan(const std::string& text) const override;

  // Sorts by start (stable) and walks the matches in order. A match that
  // overlaps an already accepted entity replaces it only when strictly
  // longer; the comparison stops at the first overlap found. Chains of three
  // mutually touching spans are therefore resolved greedily, not to a global
  // longest cover.
  static std::vector<DetectedEntity> ResolveOverlaps(
      std::vector<DetectedEntity> entities);

  // Luhn checksum over a string of decimal digits.
  static bool LuhnCheck(const std::string& digits);

 private:
  std::vector<DetectedEntity> FailClosed(const std::string& text) const;

  std::vector<EntityPattern> patterns_;
  std::size_t max_input_chars_{kMaxScreenableChars};
};

// Validators, exposed for tests.
namespace pii_validators {
bool Email(const std::string& match);
bool PhoneUs(const std::string& match);
bool PhoneInternational(const std::string& match);
bool Ssn(const std::string& match);
bool CreditCard(const std::string& match);
bool IpAddress(const std::string& match);
// Best-effort heuristic: a known vendor prefix or at least 40 characters.
// It is not a classifier for secret material.
bool ApiKey(const std::string& match);
}  // namespace pii_validators

}  // namespace promptgate
