#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace promptgate {

namespace {
MetricsRegistry g_metrics;

void RenderLabeled(std::ostringstream &out, const std::string &name,
                   const std::string &help, const std::string &label_key,
                   const std::map<std::string, uint64_t> &values) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " counter\n";
  for (const auto &[label, value] : values) {
    out << name << "{" << label_key << "=\"" << label << "\"} " << value
        << "\n";
  }
}

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << hist.counts[i].load()
        << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << hist.sum_ms.load() << "\n";
  out << name << "_count " << hist.total.load() << "\n";
}
}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::Bump(std::mutex &mutex, LabeledCounter &counter,
                           const std::string &label) {
  std::lock_guard<std::mutex> lock(mutex);
  ++counter[label];
}

void MetricsRegistry::RecordRequest(const std::string &outcome) {
  Bump(requests_mutex_, requests_, outcome);
}

void MetricsRegistry::RecordPiiEntity(const std::string &entity_type) {
  Bump(pii_mutex_, pii_entities_, entity_type);
}

void MetricsRegistry::RecordInjection(const std::string &tier) {
  Bump(injection_mutex_, injections_, tier);
}

void MetricsRegistry::RecordDetectorFault(const std::string &detector) {
  Bump(fault_mutex_, detector_faults_, detector);
}

void MetricsRegistry::RecordUpstreamAttempt(const std::string &model,
                                            bool success) {
  std::lock_guard<std::mutex> lock(upstream_mutex_);
  if (success) {
    ++upstream_success_[model];
  } else {
    ++upstream_failure_[model];
  }
}

void MetricsRegistry::RecordUpstreamRetry() {
  upstream_retries_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordCandidateSkip(const std::string &reason) {
  Bump(skip_mutex_, candidate_skips_, reason);
}

void MetricsRegistry::RecordModelFallback(const std::string &model) {
  Bump(fallback_mutex_, model_fallbacks_, model);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;
  {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    RenderLabeled(out, "promptgate_requests_total",
                  "Chat requests by terminal pipeline state", "outcome",
                  requests_);
  }
  {
    std::lock_guard<std::mutex> lock(pii_mutex_);
    RenderLabeled(out, "promptgate_pii_entities_total",
                  "PII entities reported by the scanner", "type",
                  pii_entities_);
  }
  {
    std::lock_guard<std::mutex> lock(injection_mutex_);
    RenderLabeled(out, "promptgate_injection_detections_total",
                  "Injection detections by screening tier", "tier",
                  injections_);
  }
  {
    std::lock_guard<std::mutex> lock(fault_mutex_);
    RenderLabeled(out, "promptgate_detector_faults_total",
                  "Detector faults converted to blocks", "detector",
                  detector_faults_);
  }
  {
    std::lock_guard<std::mutex> lock(upstream_mutex_);
    RenderLabeled(out, "promptgate_upstream_success_total",
                  "Successful completion API calls", "model",
                  upstream_success_);
    RenderLabeled(out, "promptgate_upstream_failure_total",
                  "Failed completion API calls", "model", upstream_failure_);
  }
  {
    std::lock_guard<std::mutex> lock(skip_mutex_);
    RenderLabeled(out, "promptgate_upstream_candidate_skips_total",
                  "Model candidates abandoned without retry", "reason",
                  candidate_skips_);
  }
  {
    std::lock_guard<std::mutex> lock(fallback_mutex_);
    RenderLabeled(out, "promptgate_model_fallbacks_total",
                  "Preferred model switches after a fallback success", "model",
                  model_fallbacks_);
  }

  out << "# HELP promptgate_upstream_retries_total Backoff retries against the "
         "same candidate\n";
  out << "# TYPE promptgate_upstream_retries_total counter\n";
  out << "promptgate_upstream_retries_total " << upstream_retries_.load()
      << "\n";

  out << "# HELP promptgate_active_connections Connections being served\n";
  out << "# TYPE promptgate_active_connections gauge\n";
  out << "promptgate_active_connections " << active_connections_.load()
      << "\n";

  RenderHistogram(out, "promptgate_request_duration_ms",
                  "End-to-end request latency in milliseconds",
                  request_latency_);
  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace promptgate
