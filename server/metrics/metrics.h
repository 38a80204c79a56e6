#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace promptgate {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  // Terminal pipeline state of a /chat request ("complete", "blocked_pii",
  // "blocked_injection", "upstream_error").
  void RecordRequest(const std::string &outcome);

  void RecordPiiEntity(const std::string &entity_type);
  // tier: "pattern", "classifier" or "fault".
  void RecordInjection(const std::string &tier);
  void RecordDetectorFault(const std::string &detector);

  void RecordUpstreamAttempt(const std::string &model, bool success);
  void RecordUpstreamRetry();
  void RecordCandidateSkip(const std::string &reason);
  void RecordModelFallback(const std::string &model);

  void RecordLatency(double request_ms);

  void IncrementConnections();
  void DecrementConnections();

  std::string RenderPrometheus() const;

private:
  using LabeledCounter = std::map<std::string, uint64_t>;

  static void Bump(std::mutex &mutex, LabeledCounter &counter,
                   const std::string &label);

  mutable std::mutex requests_mutex_;
  LabeledCounter requests_;
  mutable std::mutex pii_mutex_;
  LabeledCounter pii_entities_;
  mutable std::mutex injection_mutex_;
  LabeledCounter injections_;
  mutable std::mutex fault_mutex_;
  LabeledCounter detector_faults_;
  mutable std::mutex upstream_mutex_;
  LabeledCounter upstream_success_;
  LabeledCounter upstream_failure_;
  mutable std::mutex skip_mutex_;
  LabeledCounter candidate_skips_;
  mutable std::mutex fallback_mutex_;
  LabeledCounter model_fallbacks_;

  std::atomic<uint64_t> upstream_retries_{0};
  std::atomic<int> active_connections_{0};

  LatencyHistogram request_latency_;
};

MetricsRegistry &GlobalMetrics();

} // namespace promptgate
