#pragma once

#include "io/async_file_writer.h"

#include <cstdint>
#include <memory>
#include <string>

namespace promptgate {

// Security audit trail. One JSON object per line:
//   {"timestamp":"2026-01-02T03:04:05.678Z","ip":"...","category":"PII_DETECTED",
//    "payload":"...","status":"BLOCKED"}
// Writes go through a background writer; failures are logged and counted,
// never raised to the caller.
class AuditLogger {
 public:
  static constexpr std::size_t kMaxPayloadChars = 200;

  AuditLogger() = default;

  // path: log file path (empty disables auditing); redact: when true, the
  // payload is replaced by its SHA-256 digest in "payload_sha256".
  explicit AuditLogger(const std::string& path, bool redact = false);
  ~AuditLogger();

  bool Enabled() const { return writer_ && writer_->IsOpen(); }
  bool Redacting() const { return redact_; }

  void Record(const std::string& ip,
              const std::string& category,
              const std::string& payload,
              const std::string& status);

  void LogPiiDetection(const std::string& ip, const std::string& payload);
  void LogInjectionDetection(const std::string& ip, const std::string& payload);
  void LogSafeRequest(const std::string& ip, const std::string& payload);
  void LogUpstreamError(const std::string& ip, const std::string& payload);

  // Waits for queued entries to reach the file.
  void Flush();

  // Entries written to the file, and entries lost to a full queue or a
  // failed write.
  std::uint64_t Written() const { return writer_ ? writer_->Written() : 0; }
  std::uint64_t Dropped() const { return writer_ ? writer_->Dropped() : 0; }

  // Truncates to kMaxPayloadChars (plus "...") and escapes CR/LF.
  static std::string SanitizePayload(const std::string& payload);

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  std::unique_ptr<AsyncFileWriter> writer_;
  bool redact_{false};
};

}  // namespace promptgate
