#include "server/metrics/metrics.h"

#include <algorithm>
#include <sstream>

namespace zoneguard {

void LatencyHistogram::Record(double us) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_us.fetch_add(static_cast<uint64_t>(std::max(0.0, us)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= us.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (us <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void GuardrailMetrics::RecordClassification(Zone zone, double latency_us) {
  zone_counts_[ZoneIndex(zone)].fetch_add(1, std::memory_order_relaxed);
  classify_latency_.Record(latency_us);
}

void GuardrailMetrics::RecordFault() {
  faults_.fetch_add(1, std::memory_order_relaxed);
}

void GuardrailMetrics::RecordReload(bool success) {
  if (success) {
    reloads_.fetch_add(1, std::memory_order_relaxed);
  } else {
    reload_failures_.fetch_add(1, std::memory_order_relaxed);
  }
}

void GuardrailMetrics::SetMatcherDegraded(bool degraded) {
  matcher_degraded_.store(degraded ? 1 : 0, std::memory_order_relaxed);
}

void GuardrailMetrics::RecordUnknownFlag() {
  unknown_flags_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t GuardrailMetrics::Classifications(Zone zone) const {
  return zone_counts_[ZoneIndex(zone)].load(std::memory_order_relaxed);
}

std::string GuardrailMetrics::RenderPrometheus() const {
  std::ostringstream out;

  out << "# HELP zoneguard_classifications_total Classifications by zone\n";
  out << "# TYPE zoneguard_classifications_total counter\n";
  for (int z = 0; z <= ZoneIndex(Zone::kE); ++z) {
    out << "zoneguard_classifications_total{zone=\""
        << ZoneName(static_cast<Zone>(z)) << "\"} " << zone_counts_[z].load()
        << "\n";
  }

  out << "# HELP zoneguard_classification_faults_total Internal faults "
         "resolved to zone E\n";
  out << "# TYPE zoneguard_classification_faults_total counter\n";
  out << "zoneguard_classification_faults_total " << faults_.load() << "\n";

  out << "# HELP zoneguard_pattern_reloads_total Pattern set reloads\n";
  out << "# TYPE zoneguard_pattern_reloads_total counter\n";
  out << "zoneguard_pattern_reloads_total{result=\"success\"} "
      << reloads_.load() << "\n";
  out << "zoneguard_pattern_reloads_total{result=\"failure\"} "
      << reload_failures_.load() << "\n";

  out << "# HELP zoneguard_unknown_flags_total Preamble/disclaimer requests "
         "with an unrecognised flag\n";
  out << "# TYPE zoneguard_unknown_flags_total counter\n";
  out << "zoneguard_unknown_flags_total " << unknown_flags_.load() << "\n";

  out << "# HELP zoneguard_matcher_degraded Literal matcher running on the "
         "linear-scan fallback\n";
  out << "# TYPE zoneguard_matcher_degraded gauge\n";
  out << "zoneguard_matcher_degraded " << matcher_degraded_.load() << "\n";

  out << "# HELP zoneguard_classify_duration_us Classification latency in "
         "microseconds\n";
  out << "# TYPE zoneguard_classify_duration_us histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "zoneguard_classify_duration_us_bucket{le=\""
        << LatencyHistogram::kBuckets[i] << "\"} "
        << classify_latency_.counts[i].load() << "\n";
  }
  out << "zoneguard_classify_duration_us_bucket{le=\"+Inf\"} "
      << classify_latency_.counts[LatencyHistogram::kBuckets.size()].load()
      << "\n";
  out << "zoneguard_classify_duration_us_sum " << classify_latency_.sum_us.load()
      << "\n";
  out << "zoneguard_classify_duration_us_count "
      << classify_latency_.total.load() << "\n";

  return out.str();
}

} // namespace zoneguard
