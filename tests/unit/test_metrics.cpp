#include <catch2/catch_test_macros.hpp>

#include "server/metrics/metrics.h"

#include <string>

TEST_CASE("MetricsRegistry renders empty counters", "[metrics]") {
  promptgate::MetricsRegistry registry;
  auto output = registry.RenderPrometheus();
  REQUIRE(output.find("# TYPE promptgate_requests_total counter") != std::string::npos);
  REQUIRE(output.find("promptgate_upstream_retries_total 0") != std::string::npos);
  REQUIRE(output.find("promptgate_active_connections 0") != std::string::npos);
}

TEST_CASE("MetricsRegistry counts requests by outcome", "[metrics]") {
  promptgate::MetricsRegistry registry;
  registry.RecordRequest("complete");
  registry.RecordRequest("complete");
  registry.RecordRequest("blocked_pii");

  auto output = registry.RenderPrometheus();
  REQUIRE(output.find("promptgate_requests_total{outcome=\"complete\"} 2") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_requests_total{outcome=\"blocked_pii\"} 1") !=
          std::string::npos);
}

TEST_CASE("MetricsRegistry records detections and faults", "[metrics]") {
  promptgate::MetricsRegistry registry;
  registry.RecordPiiEntity("EMAIL");
  registry.RecordPiiEntity("EMAIL");
  registry.RecordInjection("classifier");
  registry.RecordDetectorFault("pii");

  auto output = registry.RenderPrometheus();
  REQUIRE(output.find("promptgate_pii_entities_total{type=\"EMAIL\"} 2") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_injection_detections_total{tier=\"classifier\"} 1") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_detector_faults_total{detector=\"pii\"} 1") !=
          std::string::npos);
}

TEST_CASE("MetricsRegistry records upstream activity", "[metrics]") {
  promptgate::MetricsRegistry registry;
  registry.RecordUpstreamAttempt("m1", false);
  registry.RecordUpstreamAttempt("m2", true);
  registry.RecordUpstreamRetry();
  registry.RecordCandidateSkip("rate_limited");
  registry.RecordModelFallback("m2");

  auto output = registry.RenderPrometheus();
  REQUIRE(output.find("promptgate_upstream_failure_total{model=\"m1\"} 1") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_upstream_success_total{model=\"m2\"} 1") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_upstream_retries_total 1") != std::string::npos);
  REQUIRE(output.find("promptgate_upstream_candidate_skips_total{reason=\"rate_limited\"} 1") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_model_fallbacks_total{model=\"m2\"} 1") !=
          std::string::npos);
}

TEST_CASE("MetricsRegistry tracks active connections", "[metrics]") {
  promptgate::MetricsRegistry registry;
  registry.IncrementConnections();
  registry.IncrementConnections();
  registry.DecrementConnections();
  REQUIRE(registry.RenderPrometheus().find("promptgate_active_connections 1") !=
          std::string::npos);
}

TEST_CASE("MetricsRegistry latency histogram records buckets", "[metrics]") {
  promptgate::MetricsRegistry registry;
  // 80ms falls in the 100ms bucket and every larger one.
  registry.RecordLatency(80.0);

  auto output = registry.RenderPrometheus();
  REQUIRE(output.find("promptgate_request_duration_ms_bucket{le=\"50\"} 0") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_request_duration_ms_bucket{le=\"100\"} 1") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_request_duration_ms_bucket{le=\"+Inf\"} 1") !=
          std::string::npos);
  REQUIRE(output.find("promptgate_request_duration_ms_sum 80") != std::string::npos);
  REQUIRE(output.find("promptgate_request_duration_ms_count 1") != std::string::npos);
}
