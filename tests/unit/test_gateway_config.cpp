#include <catch2/catch_test_macros.hpp>

#include "server/config/gateway_config.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace {

struct FakeEnv {
  std::map<std::string, std::string> values;

  promptgate::EnvLookup Lookup() const {
    return [this](const char* name) -> const char* {
      auto it = values.find(name);
      return it == values.end() ? nullptr : it->second.c_str();
    };
  }
};

std::filesystem::path WriteYaml(const std::string& name, const std::string& content) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

}  // namespace

TEST_CASE("GatewayConfig defaults", "[config]") {
  promptgate::GatewayConfig config;
  REQUIRE(config.http_port == 8000);
  REQUIRE(config.similarity_threshold == 0.85);
  REQUIRE(config.jailbreak_db_path == "jailbreak_patterns.json");
  REQUIRE(config.audit_log_path == "security_logs.jsonl");
  REQUIRE(config.preferred_model == "gemini-flash-latest");
  REQUIRE(config.fallback_models.size() == 3);
  REQUIRE(config.max_retries == 3);
  REQUIRE(config.backoff_base_seconds == 2.0);
  REQUIRE(config.semantic_classifier);
  REQUIRE(config.max_prompt_chars == 16384);
}

TEST_CASE("LoadGatewayConfig keeps defaults for a missing file", "[config]") {
  auto config = promptgate::LoadGatewayConfig("/nonexistent/promptgate.yaml");
  REQUIRE(config.http_port == 8000);
  REQUIRE(config.api_key.empty());
}

TEST_CASE("LoadGatewayConfig reads every section", "[config]") {
  auto path = WriteYaml("promptgate_config_full.yaml", R"(
server:
  host: 127.0.0.1
  http_port: 9090
  workers: 8
  request_timeout_ms: 1500
tls:
  enabled: true
  cert_path: /etc/cert.pem
  key_path: /etc/key.pem
security:
  similarity_threshold: 0.7
  jailbreak_db_path: /srv/phrases.json
  semantic_classifier: false
logging:
  audit_log: /var/log/audit.jsonl
  redact_payloads: true
upstream:
  api_key: from-yaml
  endpoint: http://localhost:1234/v1
  preferred_model: custom-model
  fallback_models: [fb-1, fb-2]
  max_retries: 5
  backoff_base_seconds: 1.5
)");
  auto config = promptgate::LoadGatewayConfig(path.string());
  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.http_port == 9090);
  REQUIRE(config.http_workers == 8);
  REQUIRE(config.request_timeout_ms == 1500);
  REQUIRE(config.tls_enabled);
  REQUIRE(config.tls_cert_path == "/etc/cert.pem");
  REQUIRE(config.similarity_threshold == 0.7);
  REQUIRE(config.jailbreak_db_path == "/srv/phrases.json");
  REQUIRE_FALSE(config.semantic_classifier);
  REQUIRE(config.audit_log_path == "/var/log/audit.jsonl");
  REQUIRE(config.redact_payloads);
  REQUIRE(config.api_key == "from-yaml");
  REQUIRE(config.upstream_endpoint == "http://localhost:1234/v1");
  REQUIRE(config.preferred_model == "custom-model");
  REQUIRE(config.fallback_models == std::vector<std::string>{"fb-1", "fb-2"});
  REQUIRE(config.max_retries == 5);
  REQUIRE(config.backoff_base_seconds == 1.5);
  std::filesystem::remove(path);
}

TEST_CASE("LoadGatewayConfig rejects malformed YAML", "[config]") {
  auto path = WriteYaml("promptgate_config_bad.yaml", "server: [unclosed\n");
  REQUIRE_THROWS_AS(promptgate::LoadGatewayConfig(path.string()), promptgate::ConfigError);
  std::filesystem::remove(path);

  auto wrong_type = WriteYaml("promptgate_config_type.yaml", "server:\n  http_port: eighty\n");
  REQUIRE_THROWS_AS(promptgate::LoadGatewayConfig(wrong_type.string()),
                    promptgate::ConfigError);
  std::filesystem::remove(wrong_type);
}

TEST_CASE("Environment overrides take precedence", "[config]") {
  promptgate::GatewayConfig config;
  FakeEnv env;
  env.values = {{"GEMINI_API_KEY", "env-key"},
                {"PROMPTGATE_PORT", "7000"},
                {"PROMPTGATE_SIMILARITY_THRESHOLD", "0.9"},
                {"PROMPTGATE_SEMANTIC_CLASSIFIER", "off"},
                {"PROMPTGATE_AUDIT_REDACT", "true"},
                {"PROMPTGATE_PREFERRED_MODEL", "env-model"},
                {"PROMPTGATE_MAX_RETRIES", "2"},
                {"PROMPTGATE_MAX_PROMPT_CHARS", "8000"}};
  promptgate::ApplyEnvironmentOverrides(config, env.Lookup());
  REQUIRE(config.api_key == "env-key");
  REQUIRE(config.http_port == 7000);
  REQUIRE(config.similarity_threshold == 0.9);
  REQUIRE_FALSE(config.semantic_classifier);
  REQUIRE(config.redact_payloads);
  REQUIRE(config.preferred_model == "env-model");
  REQUIRE(config.max_retries == 2);
  REQUIRE(config.max_prompt_chars == 8000);
}

TEST_CASE("Environment overrides reject unparsable numbers", "[config]") {
  promptgate::GatewayConfig config;
  FakeEnv env;
  env.values = {{"PROMPTGATE_PORT", "80x"}};
  REQUIRE_THROWS_AS(promptgate::ApplyEnvironmentOverrides(config, env.Lookup()),
                    promptgate::ConfigError);
  env.values = {{"PROMPTGATE_AUDIT_REDACT", "maybe"}};
  REQUIRE_THROWS_AS(promptgate::ApplyEnvironmentOverrides(config, env.Lookup()),
                    promptgate::ConfigError);
}

TEST_CASE("ValidateGatewayConfig requires the API key", "[config]") {
  promptgate::GatewayConfig config;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);
  config.api_key = "k";
  REQUIRE_NOTHROW(promptgate::ValidateGatewayConfig(config));
}

TEST_CASE("ValidateGatewayConfig checks ranges", "[config]") {
  promptgate::GatewayConfig base;
  base.api_key = "k";

  auto config = base;
  config.similarity_threshold = 1.5;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.http_port = 70000;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.http_workers = 0;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.max_retries = 0;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.backoff_base_seconds = 0.5;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.preferred_model.clear();
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.tls_enabled = true;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);

  config = base;
  config.max_prompt_chars = 0;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);
  config.max_prompt_chars = 1024 * 1024;
  REQUIRE_THROWS_AS(promptgate::ValidateGatewayConfig(config), promptgate::ConfigError);
  config.max_prompt_chars = 65536;
  REQUIRE_NOTHROW(promptgate::ValidateGatewayConfig(config));
}

TEST_CASE("ResolveGatewayConfig loads, overrides and validates", "[config]") {
  auto path = WriteYaml("promptgate_config_resolve.yaml",
                        "server:\n  http_port: 9000\nupstream:\n  max_retries: 4\n");
  FakeEnv env;
  env.values = {{"GEMINI_API_KEY", "secret"}, {"PROMPTGATE_PORT", "9100"}};
  auto config = promptgate::ResolveGatewayConfig(path.string(), env.Lookup());
  REQUIRE(config.http_port == 9100);
  REQUIRE(config.max_retries == 4);
  REQUIRE(config.api_key == "secret");

  FakeEnv empty;
  REQUIRE_THROWS_AS(promptgate::ResolveGatewayConfig(path.string(), empty.Lookup()),
                    promptgate::ConfigError);
  std::filesystem::remove(path);
}
