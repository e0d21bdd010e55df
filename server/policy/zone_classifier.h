#pragma once

#include "policy/pattern_store.h"
#include "policy/zone.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zoneguard {

struct ZoneClassification {
  Zone zone{Zone::kE};
  std::string reason;
  double confidence{1.0};
  // Semantic tag of the winning pattern. For zone C it names an EthicalFlag,
  // for zone D a ProfessionalCategory.
  std::optional<std::string> ethical_flag;
  std::optional<std::string> matched_pattern;

  bool operator==(const ZoneClassification &other) const {
    return zone == other.zone && reason == other.reason &&
           confidence == other.confidence &&
           ethical_flag == other.ethical_flag &&
           matched_pattern == other.matched_pattern;
  }
  bool operator!=(const ZoneClassification &other) const {
    return !(*this == other);
  }
};

nlohmann::json ToJson(const ZoneClassification &classification);
nlohmann::json ToJson(const PatternHit &hit);

// ZoneClassifier turns matcher output into exactly one zone per input.
//
// One literal scan covers all zones; its hits are then filtered in priority
// order A > B > C > D. A zone's regexes run only when the zone had no literal
// hit and no higher zone has already won, so zone A short-circuits everything
// below it. Within a zone the earliest literal occurrence wins, then the first
// regex in definition order.
//
// Classify() never throws: an internal fault resolves to zone E with a
// "classification_fault" reason.
//
// Thread safety: Classify()/Scan() may run concurrently with each other and
// with Reload(). The active set is swapped atomically; a call sees either the
// old or the new set, never a mix.
class ZoneClassifier {
public:
  explicit ZoneClassifier(std::shared_ptr<const CompiledPatternSet> patterns,
                          GuardrailMetrics *metrics = nullptr);

  ZoneClassification Classify(const std::string &text) const;

  // Every literal and regex hit across all zones, for audit callers.
  // Does not apply priority resolution.
  std::vector<PatternHit> Scan(const std::string &text) const;

  void Reload(std::shared_ptr<const CompiledPatternSet> patterns);
  std::shared_ptr<const CompiledPatternSet> Snapshot() const;

private:
  ZoneClassification Evaluate(const CompiledPatternSet &set,
                              const std::string &text) const;

  std::shared_ptr<const CompiledPatternSet> patterns_;
  GuardrailMetrics *metrics_;
};

} // namespace zoneguard
