#include "screening/pii_scanner.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace promptgate {

namespace {

constexpr double kPatternScore = 0.9;
constexpr std::size_t kFailClosedPreviewChars = 50;

std::string DigitsOnly(const std::string& text) {
  std::string digits;
  digits.reserve(text.size());
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c);
    }
  }
  return digits;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool AcceptAll(const std::string&) { return true; }

}  // namespace

namespace pii_validators {

bool Email(const std::string& match) {
  if (EndsWith(match, ".png") || EndsWith(match, ".jpg")) {
    return false;
  }
  return match.find('@') != std::string::npos;
}

bool PhoneUs(const std::string& match) { return DigitsOnly(match).size() == 10; }

bool PhoneInternational(const std::string& match) {
  auto digit_count = DigitsOnly(match).size();
  if (StartsWith(match, "+")) {
    return digit_count >= 8;
  }
  return digit_count >= 10;
}

bool Ssn(const std::string& match) {
  auto digits = DigitsOnly(match);
  if (digits.size() != 9) {
    return false;
  }
  // Area 000 and group 00 are never issued.
  return digits.compare(0, 3, "000") != 0 && digits.compare(3, 2, "00") != 0;
}

bool CreditCard(const std::string& match) {
  auto digits = DigitsOnly(match);
  if (digits.size() < 13 || digits.size() > 19) {
    return false;
  }
  return PiiScanner::LuhnCheck(digits);
}

bool IpAddress(const std::string& match) {
  int octets = 0;
  std::size_t pos = 0;
  while (pos <= match.size()) {
    auto dot = match.find('.', pos);
    auto part = match.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
    if (part.empty() || part.size() > 3 || DigitsOnly(part).size() != part.size()) {
      return false;
    }
    if (std::stoi(part) > 255) {
      return false;
    }
    ++octets;
    if (dot == std::string::npos) {
      break;
    }
    pos = dot + 1;
  }
  return octets == 4;
}

bool ApiKey(const std::string& match) {
  if (StartsWith(match, "sk-") || StartsWith(match, "ghp_") ||
      StartsWith(match, "xoxb-")) {
    return true;
  }
  return match.size() >= 40;
}

}  // namespace pii_validators

std::vector<EntityPattern> DefaultEntityPatterns() {
  const auto icase = std::regex::ECMAScript | std::regex::icase;
  const auto plain = std::regex::ECMAScript;
  // Every repetition is bounded: std::regex backtracks recursively, so an
  // unbounded run over a long token exhausts the stack.
  std::vector<EntityPattern> patterns;
  patterns.push_back({EntityType::kEmail,
                      std::regex(R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)", icase),
                      pii_validators::Email});
  // Card layouts are listed separately so a Luhn miss on a long grouping
  // does not hide the valid card it starts with.
  for (const char* layout :
       {R"(\b\d{4}[-.\s]?\d{4}[-.\s]?\d{4}[-.\s]?\d{4}\b)",
        R"(\b\d{4}[-.\s]?\d{4}[-.\s]?\d{4}[-.\s]?\d{4}[-.\s]?\d{3}\b)",
        R"(\b\d{4}[-.\s]?\d{6}[-.\s]?\d{5}\b)",
        R"(\b\d{13,19}\b)"}) {
    patterns.push_back({EntityType::kCreditCard, std::regex(layout, plain),
                        pii_validators::CreditCard});
  }
  patterns.push_back({EntityType::kSsn,
                      std::regex(R"(\b\d{3}-?\d{2}-?\d{4}\b)", plain),
                      pii_validators::Ssn});
  patterns.push_back({EntityType::kIpAddress,
                      std::regex(R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", plain),
                      pii_validators::IpAddress});
  patterns.push_back({EntityType::kIban,
                      std::regex(R"(\b[A-Z]{2}\d{2}[A-Z0-9]{4,30}\b)", plain),
                      AcceptAll});
  patterns.push_back({EntityType::kCryptoWallet,
                      std::regex(R"(\b(?:0x)?[A-Fa-f0-9]{40,64}\b)", plain),
                      AcceptAll});
  patterns.push_back(
      {EntityType::kApiKey,
       std::regex(R"(\b(?:sk-[A-Za-z0-9]{20,256}|ghp_[A-Za-z0-9]{20,256}|xoxb-[A-Za-z0-9-]{20,256}|[A-Za-z0-9]{40,512}))",
                  plain),
       pii_validators::ApiKey});
  patterns.push_back({EntityType::kPhoneUs,
                      std::regex(R"(\(?\d{3}\)?[-.\s]?\d{3}[-.\s]?\d{4})", plain),
                      pii_validators::PhoneUs});
  patterns.push_back(
      {EntityType::kPhoneInternational,
       std::regex(R"(\+?\d{1,4}[-.\s]?\(?\d{1,4}\)?[-.\s]?\d{1,4}[-.\s]?\d{1,9})", plain),
       pii_validators::PhoneInternational});
  return patterns;
}

PiiScanner::PiiScanner() : patterns_(DefaultEntityPatterns()) {}

PiiScanner::PiiScanner(std::vector<EntityPattern> patterns, std::size_t max_input_chars)
    : patterns_(std::move(patterns)), max_input_chars_(max_input_chars) {}

bool PiiScanner::LuhnCheck(const std::string& digits) {
  if (digits.empty()) {
    return false;
  }
  int total = 0;
  bool double_it = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (!std::isdigit(static_cast<unsigned char>(*it))) {
      return false;
    }
    int num = *it - '0';
    if (double_it) {
      num *= 2;
      if (num > 9) {
        num -= 9;
      }
    }
    total += num;
    double_it = !double_it;
  }
  return total % 10 == 0;
}

std::vector<DetectedEntity> PiiScanner::ResolveOverlaps(
    std::vector<DetectedEntity> entities) {
  if (entities.empty()) {
    return entities;
  }
  std::stable_sort(entities.begin(), entities.end(),
                   [](const DetectedEntity& a, const DetectedEntity& b) {
                     return a.start < b.start;
                   });

  std::vector<DetectedEntity> accepted;
  accepted.reserve(entities.size());
  for (auto& entity : entities) {
    bool overlaps = false;
    for (auto it = accepted.begin(); it != accepted.end(); ++it) {
      if (entity.Overlaps(*it)) {
        if (entity.length() > it->length()) {
          *it = std::move(entity);
        }
        overlaps = true;
        break;
      }
    }
    if (!overlaps) {
      accepted.push_back(std::move(entity));
    }
  }
  std::stable_sort(accepted.begin(), accepted.end(),
                   [](const DetectedEntity& a, const DetectedEntity& b) {
                     return a.start < b.start;
                   });
  return accepted;
}

std::vector<DetectedEntity> PiiScanner::FailClosed(const std::string& text) const {
  DetectedEntity entity;
  entity.entity_type = EntityType::kUnknown;
  entity.start = 0;
  entity.end = text.size();
  entity.score = 1.0;
  entity.text = text.size() > kFailClosedPreviewChars
                    ? text.substr(0, kFailClosedPreviewChars) + "..."
                    : text;
  return {entity};
}

std::vector<DetectedEntity> PiiScanner::Scan(const std::string& text) const {
  try {
    if (text.size() > max_input_chars_) {
      throw std::length_error("input of " + std::to_string(text.size()) +
                              " chars exceeds the screenable limit of " +
                              std::to_string(max_input_chars_));
    }
    std::vector<DetectedEntity> entities;
    for (const auto& row : patterns_) {
      auto begin = std::sregex_iterator(text.begin(), text.end(), row.pattern);
      for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        std::string matched = match.str(0);
        if (matched.empty() || !row.validator(matched)) {
          continue;
        }
        DetectedEntity entity;
        entity.entity_type = row.type;
        entity.start = static_cast<std::size_t>(match.position(0));
        entity.end = entity.start + matched.size();
        entity.score = kPatternScore;
        entity.text = std::move(matched);
        entities.push_back(std::move(entity));
      }
    }
    return ResolveOverlaps(std::move(entities));
  } catch (const std::exception& ex) {
    log::Warn("pii", "PII detection error (failing closed)", ex.what());
    return FailClosed(text);
  } catch (...) {
    log::Warn("pii", "PII detection error (failing closed)", "non-standard exception");
    return FailClosed(text);
  }
}

}  // namespace promptgate
