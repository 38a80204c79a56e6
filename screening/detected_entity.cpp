#include "screening/detected_entity.h"

#include <utility>

namespace promptgate {

const char* EntityTypeName(EntityType type) {
  switch (type) {
    case EntityType::kEmail:
      return "EMAIL";
    case EntityType::kPhoneUs:
      return "PHONE_US";
    case EntityType::kPhoneInternational:
      return "PHONE_INTERNATIONAL";
    case EntityType::kSsn:
      return "SSN";
    case EntityType::kCreditCard:
      return "CREDIT_CARD";
    case EntityType::kIpAddress:
      return "IP_ADDRESS";
    case EntityType::kIban:
      return "IBAN";
    case EntityType::kCryptoWallet:
      return "CRYPTO_WALLET";
    case EntityType::kApiKey:
      return "API_KEY";
    case EntityType::kUnknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::string SummarizeEntities(const std::vector<DetectedEntity>& entities) {
  if (entities.empty()) {
    return "No PII detected";
  }
  std::vector<std::pair<EntityType, int>> counts;
  for (const auto& entity : entities) {
    bool found = false;
    for (auto& entry : counts) {
      if (entry.first == entity.entity_type) {
        ++entry.second;
        found = true;
        break;
      }
    }
    if (!found) {
      counts.emplace_back(entity.entity_type, 1);
    }
  }
  std::string summary = "Detected: ";
  for (std::size_t i = 0; i < counts.size(); ++i) {
    if (i > 0) {
      summary += ", ";
    }
    summary += std::to_string(counts[i].second) + " " +
               EntityTypeName(counts[i].first) + "(s)";
  }
  return summary;
}

const char* VerdictCategoryName(VerdictCategory category) {
  switch (category) {
    case VerdictCategory::kNone:
      return "NONE";
    case VerdictCategory::kPii:
      return "PII";
    case VerdictCategory::kInjection:
      return "INJECTION";
  }
  return "NONE";
}

}  // namespace promptgate
