#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace promptgate {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct GatewayConfig {
  // server
  std::string host{"0.0.0.0"};
  int http_port{8000};
  int http_workers{4};
  int request_timeout_ms{60000};

  // tls
  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;

  // security
  double similarity_threshold{0.85};
  std::string jailbreak_db_path{"jailbreak_patterns.json"};
  bool semantic_classifier{true};
  // Longer prompts are blocked before any detector runs.
  int max_prompt_chars{16384};

  // logging
  std::string audit_log_path{"security_logs.jsonl"};
  bool redact_payloads{false};

  // upstream
  std::string api_key;
  std::string upstream_endpoint{"https://generativelanguage.googleapis.com/v1beta"};
  std::string preferred_model{"gemini-flash-latest"};
  std::vector<std::string> fallback_models{"gemini-2.5-flash",
                                           "gemini-flash-lite-latest",
                                           "gemini-2.0-flash-lite"};
  int max_retries{3};
  double backoff_base_seconds{2.0};
};

using EnvLookup = std::function<const char*(const char*)>;

// Reads `path` over the defaults. A missing file leaves the defaults in
// place; a malformed one throws ConfigError.
GatewayConfig LoadGatewayConfig(const std::string& path);

// Applies PROMPTGATE_* (and GEMINI_API_KEY) overrides. Unparsable numeric
// values throw ConfigError. `getenv` defaults to std::getenv.
void ApplyEnvironmentOverrides(GatewayConfig& config, const EnvLookup& getenv = nullptr);

// Throws ConfigError naming the first invalid field.
void ValidateGatewayConfig(const GatewayConfig& config);

// Load, override, validate.
GatewayConfig ResolveGatewayConfig(const std::string& path, const EnvLookup& getenv = nullptr);

}  // namespace promptgate
