#include "server/config/gateway_config.h"

#include "screening/detector.h"
#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace promptgate {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string& name, const std::string& value) {
  auto lowered = ToLower(value);
  if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
    return false;
  }
  throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

int ParseInt(const std::string& name, const std::string& value) {
  try {
    std::size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used != value.size()) {
      throw ConfigError(name + ": trailing characters in '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(name + ": expected an integer, got '" + value + "'");
  }
}

double ParseDouble(const std::string& name, const std::string& value) {
  try {
    std::size_t used = 0;
    double parsed = std::stod(value, &used);
    if (used != value.size()) {
      throw ConfigError(name + ": trailing characters in '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(name + ": expected a number, got '" + value + "'");
  }
}

template <typename T>
void Read(const YAML::Node& section, const char* key, T& out) {
  if (section && section[key]) {
    out = section[key].as<T>();
  }
}

}  // namespace

GatewayConfig LoadGatewayConfig(const std::string& path) {
  GatewayConfig config;
  if (path.empty() || !std::filesystem::exists(path)) {
    log::Info("config", "No config file, using defaults", path);
    return config;
  }
  try {
    YAML::Node root = YAML::LoadFile(path);

    auto server = root["server"];
    Read(server, "host", config.host);
    Read(server, "http_port", config.http_port);
    Read(server, "workers", config.http_workers);
    Read(server, "request_timeout_ms", config.request_timeout_ms);

    auto tls = root["tls"];
    Read(tls, "enabled", config.tls_enabled);
    Read(tls, "cert_path", config.tls_cert_path);
    Read(tls, "key_path", config.tls_key_path);

    auto security = root["security"];
    Read(security, "similarity_threshold", config.similarity_threshold);
    Read(security, "jailbreak_db_path", config.jailbreak_db_path);
    Read(security, "semantic_classifier", config.semantic_classifier);
    Read(security, "max_prompt_chars", config.max_prompt_chars);

    auto logging = root["logging"];
    Read(logging, "audit_log", config.audit_log_path);
    Read(logging, "redact_payloads", config.redact_payloads);

    auto upstream = root["upstream"];
    Read(upstream, "api_key", config.api_key);
    Read(upstream, "endpoint", config.upstream_endpoint);
    Read(upstream, "preferred_model", config.preferred_model);
    Read(upstream, "max_retries", config.max_retries);
    Read(upstream, "backoff_base_seconds", config.backoff_base_seconds);
    if (upstream && upstream["fallback_models"]) {
      if (!upstream["fallback_models"].IsSequence()) {
        throw ConfigError("upstream.fallback_models must be a list");
      }
      config.fallback_models.clear();
      for (const auto& node : upstream["fallback_models"]) {
        config.fallback_models.push_back(node.as<std::string>());
      }
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError("Error parsing config file " + path + ": " + e.what());
  }
  return config;
}

void ApplyEnvironmentOverrides(GatewayConfig& config, const EnvLookup& getenv) {
  auto lookup = [&](const char* name) -> const char* {
    return getenv ? getenv(name) : std::getenv(name);
  };

  if (const char* v = lookup("PROMPTGATE_HOST")) config.host = v;
  if (const char* v = lookup("PROMPTGATE_PORT")) config.http_port = ParseInt("PROMPTGATE_PORT", v);
  if (const char* v = lookup("PROMPTGATE_HTTP_WORKERS")) {
    config.http_workers = ParseInt("PROMPTGATE_HTTP_WORKERS", v);
  }
  if (const char* v = lookup("PROMPTGATE_REQUEST_TIMEOUT_MS")) {
    config.request_timeout_ms = ParseInt("PROMPTGATE_REQUEST_TIMEOUT_MS", v);
  }
  if (const char* v = lookup("PROMPTGATE_TLS_ENABLED")) {
    config.tls_enabled = ParseBool("PROMPTGATE_TLS_ENABLED", v);
  }
  if (const char* v = lookup("PROMPTGATE_TLS_CERT_PATH")) config.tls_cert_path = v;
  if (const char* v = lookup("PROMPTGATE_TLS_KEY_PATH")) config.tls_key_path = v;
  if (const char* v = lookup("PROMPTGATE_SIMILARITY_THRESHOLD")) {
    config.similarity_threshold = ParseDouble("PROMPTGATE_SIMILARITY_THRESHOLD", v);
  }
  if (const char* v = lookup("PROMPTGATE_JAILBREAK_DB_PATH")) config.jailbreak_db_path = v;
  if (const char* v = lookup("PROMPTGATE_SEMANTIC_CLASSIFIER")) {
    config.semantic_classifier = ParseBool("PROMPTGATE_SEMANTIC_CLASSIFIER", v);
  }
  if (const char* v = lookup("PROMPTGATE_MAX_PROMPT_CHARS")) {
    config.max_prompt_chars = ParseInt("PROMPTGATE_MAX_PROMPT_CHARS", v);
  }
  if (const char* v = lookup("PROMPTGATE_AUDIT_LOG")) config.audit_log_path = v;
  if (const char* v = lookup("PROMPTGATE_AUDIT_REDACT")) {
    config.redact_payloads = ParseBool("PROMPTGATE_AUDIT_REDACT", v);
  }
  if (const char* v = lookup("GEMINI_API_KEY")) config.api_key = v;
  if (const char* v = lookup("PROMPTGATE_UPSTREAM_ENDPOINT")) config.upstream_endpoint = v;
  if (const char* v = lookup("PROMPTGATE_PREFERRED_MODEL")) config.preferred_model = v;
  if (const char* v = lookup("PROMPTGATE_MAX_RETRIES")) {
    config.max_retries = ParseInt("PROMPTGATE_MAX_RETRIES", v);
  }
}

void ValidateGatewayConfig(const GatewayConfig& config) {
  if (config.api_key.empty()) {
    throw ConfigError("GEMINI_API_KEY is required (set the environment variable or upstream.api_key)");
  }
  if (config.similarity_threshold < 0.0 || config.similarity_threshold > 1.0) {
    throw ConfigError("security.similarity_threshold must be within [0, 1]");
  }
  if (config.max_prompt_chars < 1 ||
      static_cast<std::size_t>(config.max_prompt_chars) > kMaxScreenableChars) {
    throw ConfigError("security.max_prompt_chars must be within 1-" +
                      std::to_string(kMaxScreenableChars));
  }
  if (config.http_port < 1 || config.http_port > 65535) {
    throw ConfigError("server.http_port must be within 1-65535");
  }
  if (config.http_workers < 1) {
    throw ConfigError("server.workers must be at least 1");
  }
  if (config.request_timeout_ms < 1) {
    throw ConfigError("server.request_timeout_ms must be positive");
  }
  if (config.max_retries < 1) {
    throw ConfigError("upstream.max_retries must be at least 1");
  }
  if (config.backoff_base_seconds < 1.0) {
    throw ConfigError("upstream.backoff_base_seconds must be at least 1");
  }
  if (config.preferred_model.empty()) {
    throw ConfigError("upstream.preferred_model must not be empty");
  }
  if (config.upstream_endpoint.empty()) {
    throw ConfigError("upstream.endpoint must not be empty");
  }
  if (config.tls_enabled && (config.tls_cert_path.empty() || config.tls_key_path.empty())) {
    throw ConfigError("tls.enabled requires tls.cert_path and tls.key_path");
  }
}

GatewayConfig ResolveGatewayConfig(const std::string& path, const EnvLookup& getenv) {
  auto config = LoadGatewayConfig(path);
  ApplyEnvironmentOverrides(config, getenv);
  ValidateGatewayConfig(config);
  return config;
}

}  // namespace promptgate
