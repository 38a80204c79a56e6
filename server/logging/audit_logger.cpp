#include "server/logging/audit_logger.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace promptgate {

namespace {

std::string IsoTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;
  std::tm utc{};
  gmtime_r(&secs, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return out.str();
}

}  // namespace

AuditLogger::AuditLogger(const std::string& path, bool redact) : redact_(redact) {
  if (!path.empty()) {
    writer_ = std::make_unique<AsyncFileWriter>(path);
  }
}

AuditLogger::~AuditLogger() {
  if (writer_) {
    writer_->Stop();
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string AuditLogger::SanitizePayload(const std::string& payload) {
  std::string truncated = payload;
  if (truncated.size() > kMaxPayloadChars) {
    std::size_t cut = kMaxPayloadChars;
    // Do not split a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(payload[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    truncated = payload.substr(0, cut) + "...";
  }
  std::string escaped;
  escaped.reserve(truncated.size());
  for (char c : truncated) {
    if (c == '\n') {
      escaped += "\\n";
    } else if (c == '\r') {
      escaped += "\\r";
    } else {
      escaped.push_back(c);
    }
  }
  return escaped;
}

void AuditLogger::Record(const std::string& ip,
                         const std::string& category,
                         const std::string& payload,
                         const std::string& status) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = IsoTimestamp();
  j["ip"] = ip;
  j["category"] = category;
  if (redact_) {
    j["payload_sha256"] = HashContent(payload);
  } else {
    j["payload"] = SanitizePayload(payload);
  }
  j["status"] = status;
  if (!writer_->TryAppend(j.dump(-1, ' ', false, json::error_handler_t::replace))) {
    log::Warn("audit", "Audit entry dropped", "category=" + category);
  }
}

void AuditLogger::LogPiiDetection(const std::string& ip, const std::string& payload) {
  Record(ip, "PII_DETECTED", payload, "BLOCKED");
}

void AuditLogger::LogInjectionDetection(const std::string& ip, const std::string& payload) {
  Record(ip, "INJECTION_DETECTED", payload, "BLOCKED");
}

void AuditLogger::LogSafeRequest(const std::string& ip, const std::string& payload) {
  Record(ip, "SAFE_REQUEST", payload, "ALLOWED");
}

void AuditLogger::LogUpstreamError(const std::string& ip, const std::string& payload) {
  Record(ip, "LLM_ERROR", payload, "ERROR");
}

void AuditLogger::Flush() {
  if (writer_) {
    writer_->Flush();
  }
}

}  // namespace promptgate
