#include "screening/injection_screen.h"
#include "screening/jailbreak_phrase_store.h"
#include "screening/pii_scanner.h"
#include "screening/screening_pipeline.h"
#include "server/config/gateway_config.h"
#include "server/http/http_server.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "upstream/gemini_api.h"
#include "upstream/resilient_completion_client.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void ConfigureLogging() {
  if (const char* fmt = std::getenv("PROMPTGATE_LOG_FORMAT")) {
    promptgate::log::SetJsonMode(std::string(fmt) == "json");
  }
  if (const char* level = std::getenv("PROMPTGATE_LOG_LEVEL")) {
    promptgate::log::Level parsed;
    if (promptgate::log::ParseLevel(level, &parsed)) {
      promptgate::log::SetMinLevel(parsed);
    } else {
      promptgate::log::Warn("server", "Unknown PROMPTGATE_LOG_LEVEL, keeping default", level);
    }
  }
}

void PrintUsage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [--config <path>]\n"
            << "  --config <path>  YAML configuration (default config/gateway.yaml)\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/gateway.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      PrintUsage(argv[0]);
      return 2;
    }
  }

  ConfigureLogging();

  promptgate::GatewayConfig config;
  try {
    config = promptgate::ResolveGatewayConfig(config_path);
  } catch (const promptgate::ConfigError& e) {
    promptgate::log::Error("config", "Invalid configuration", e.what());
    return 1;
  }

  auto& metrics = promptgate::GlobalMetrics();

  promptgate::PiiScanner pii_scanner;
  auto phrases = promptgate::LoadJailbreakPhrases(config.jailbreak_db_path);
  promptgate::InjectionScreen injection_screen(phrases, config.similarity_threshold);

  promptgate::GeminiApiOptions api_options;
  api_options.endpoint = config.upstream_endpoint;
  api_options.api_key = config.api_key;
  promptgate::GeminiApi gemini(api_options);

  promptgate::CompletionPolicy policy;
  policy.preferred_model = config.preferred_model;
  policy.fallback_models = config.fallback_models;
  policy.max_retries = config.max_retries;
  policy.backoff_base_seconds = config.backoff_base_seconds;
  promptgate::ResilientCompletionClient completion(gemini, policy, nullptr, &metrics);

  promptgate::AuditLogger audit_logger(config.audit_log_path, config.redact_payloads);
  if (!audit_logger.Enabled()) {
    promptgate::log::Warn("audit", "Audit logging disabled", config.audit_log_path);
  }

  promptgate::ScreeningPipeline pipeline(
      pii_scanner, injection_screen, completion,
      config.semantic_classifier ? &completion : nullptr,
      audit_logger.Enabled() ? &audit_logger : nullptr, &metrics,
      static_cast<std::size_t>(config.max_prompt_chars));

  promptgate::HttpServer::TlsConfig tls_config;
  tls_config.enabled = config.tls_enabled;
  tls_config.cert_path = config.tls_cert_path;
  tls_config.key_path = config.tls_key_path;

  promptgate::HttpServer server(config.host, config.http_port, &pipeline, &metrics,
                                tls_config, config.http_workers,
                                std::chrono::milliseconds(config.request_timeout_ms));

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  if (!server.Start()) {
    promptgate::log::Error("server", "Unable to listen",
                           config.host + ":" + std::to_string(config.http_port));
    return 1;
  }
  promptgate::log::Info("server", "PromptGate listening",
                        config.host + ":" + std::to_string(server.BoundPort()) +
                            (config.tls_enabled ? " tls=on" : "") +
                            " model=" + completion.PreferredModel() +
                            " phrases=" + std::to_string(injection_screen.PhraseCount()) +
                            " classifier=" + (config.semantic_classifier ? "on" : "off"));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  audit_logger.Flush();
  if (audit_logger.Enabled()) {
    promptgate::log::Info("audit", "Audit log closed",
                          "written=" + std::to_string(audit_logger.Written()) +
                              " dropped=" + std::to_string(audit_logger.Dropped()));
  }
  promptgate::log::Info("server", "PromptGate shutting down");
  return 0;
}
