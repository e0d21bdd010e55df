#pragma once

#include "policy/zone.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace zoneguard {

// Latency histogram with fixed buckets (in microseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in microseconds: 10, 50, 100, 250, 500, 1000, 5000, +Inf
  static constexpr std::array<double, 7> kBuckets{10.0,  50.0,   100.0, 250.0,
                                                  500.0, 1000.0, 5000.0};
  std::array<std::atomic<uint64_t>, 8> counts{}; // 7 finite + 1 +Inf
  std::atomic<uint64_t> sum_us{0};
  std::atomic<uint64_t> total{0};

  void Record(double us);
};

// Counters for the classification path. All updates are relaxed atomics so
// recording never blocks a classification call.
class GuardrailMetrics {
public:
  void RecordClassification(Zone zone, double latency_us);
  void RecordFault();
  void RecordReload(bool success);
  void SetMatcherDegraded(bool degraded);
  void RecordUnknownFlag();

  uint64_t Classifications(Zone zone) const;
  uint64_t Faults() const { return faults_.load(); }
  uint64_t Reloads() const { return reloads_.load(); }
  uint64_t ReloadFailures() const { return reload_failures_.load(); }
  bool MatcherDegraded() const { return matcher_degraded_.load() != 0; }

  std::string RenderPrometheus() const;

private:
  std::array<std::atomic<uint64_t>, 5> zone_counts_{};
  std::atomic<uint64_t> faults_{0};
  std::atomic<uint64_t> reloads_{0};
  std::atomic<uint64_t> reload_failures_{0};
  std::atomic<uint64_t> unknown_flags_{0};
  std::atomic<int> matcher_degraded_{0};
  LatencyHistogram classify_latency_;
};

} // namespace zoneguard
