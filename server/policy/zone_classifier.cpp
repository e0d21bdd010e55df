#include "server/policy/zone_classifier.h"

#include "matching/text_normalize.h"
#include "server/logging/logger.h"
#include "server/logging/redact.h"

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace zoneguard {

namespace {

ZoneClassification FromHit(const PatternHit &hit) {
  ZoneClassification out;
  out.zone = hit.zone;
  out.reason = hit.tag;
  out.confidence = 1.0;
  out.ethical_flag = hit.tag;
  out.matched_pattern = hit.matched;
  return out;
}

json OptionalString(const std::optional<std::string> &value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

} // namespace

json ToJson(const ZoneClassification &classification) {
  json j;
  j["zone"] = ZoneName(classification.zone);
  j["reason"] = classification.reason;
  j["confidence"] = classification.confidence;
  j["ethical_flag"] = OptionalString(classification.ethical_flag);
  j["matched_pattern"] = OptionalString(classification.matched_pattern);
  return j;
}

json ToJson(const PatternHit &hit) {
  json j;
  j["zone"] = ZoneName(hit.zone);
  j["tag"] = hit.tag;
  j["pattern"] = hit.pattern;
  j["matched"] = hit.matched;
  j["kind"] = hit.is_regex ? "regex" : "literal";
  return j;
}

ZoneClassifier::ZoneClassifier(
    std::shared_ptr<const CompiledPatternSet> patterns,
    GuardrailMetrics *metrics)
    : patterns_(std::move(patterns)), metrics_(metrics) {
  if (metrics_ && patterns_) {
    metrics_->SetMatcherDegraded(patterns_->Degraded());
  }
}

std::shared_ptr<const CompiledPatternSet> ZoneClassifier::Snapshot() const {
  return std::atomic_load(&patterns_);
}

void ZoneClassifier::Reload(std::shared_ptr<const CompiledPatternSet> patterns) {
  if (!patterns) {
    log::Warn("classifier", "Ignoring reload with an empty pattern set");
    return;
  }
  const bool degraded = patterns->Degraded();
  const auto version = patterns->Version();
  std::atomic_store(&patterns_, std::move(patterns));
  if (metrics_) {
    metrics_->SetMatcherDegraded(degraded);
  }
  log::Info("classifier", "Pattern set published",
            "version=" + std::to_string(version));
}

ZoneClassification ZoneClassifier::Evaluate(const CompiledPatternSet &set,
                                            const std::string &text) const {
  if (IsBlank(text)) {
    return ZoneClassification{};
  }
  const std::string folded = FoldCase(text);

  // Earliest literal hit per zone from the single scan.
  std::array<std::optional<LiteralHit>, kPatternZoneCount> first_hit{};
  const auto &literals = set.Literals();
  for (const auto &hit : set.ScanLiterals(folded)) {
    const int z = ZoneIndex(literals.at(hit.pattern_id).zone);
    if (!first_hit[z]) {
      first_hit[z] = hit;
    }
    if (z == ZoneIndex(Zone::kA)) {
      break;
    }
  }

  for (int z = 0; z < kPatternZoneCount; ++z) {
    const auto zone = static_cast<Zone>(z);
    if (first_hit[z]) {
      return FromHit(set.ResolveLiteral(*first_hit[z]));
    }
    if (auto regex_hit = set.FirstRegexHit(zone, folded)) {
      return FromHit(*regex_hit);
    }
  }
  return ZoneClassification{};
}

ZoneClassification ZoneClassifier::Classify(const std::string &text) const {
  const auto start = std::chrono::steady_clock::now();
  ZoneClassification result;
  try {
    auto set = Snapshot();
    if (!set) {
      throw std::runtime_error("no pattern set loaded");
    }
    result = Evaluate(*set, text);
  } catch (const std::exception &e) {
    result = ZoneClassification{};
    result.reason = std::string("classification_fault: ") + e.what();
    result.confidence = 0.0;
    log::Error("classifier", "Classification fault resolved to zone E",
               std::string("error=") + e.what() + " " + log::RedactText(text));
    if (metrics_) {
      metrics_->RecordFault();
    }
  }
  const auto elapsed_us = std::chrono::duration<double, std::micro>(
                              std::chrono::steady_clock::now() - start)
                              .count();
  if (metrics_) {
    metrics_->RecordClassification(result.zone, elapsed_us);
  }
  if (result.zone != Zone::kE && log::MinLevel() == log::Level::DEBUG) {
    log::Debug("classifier", std::string("Zone ") + ZoneName(result.zone),
               "tag=" + result.reason + " " + log::RedactText(text));
  }
  return result;
}

std::vector<PatternHit> ZoneClassifier::Scan(const std::string &text) const {
  std::vector<PatternHit> hits;
  if (IsBlank(text)) {
    return hits;
  }
  try {
    auto set = Snapshot();
    if (!set) {
      throw std::runtime_error("no pattern set loaded");
    }
    const std::string folded = FoldCase(text);
    for (const auto &hit : set->ScanLiterals(folded)) {
      hits.push_back(set->ResolveLiteral(hit));
    }
    for (int z = 0; z < kPatternZoneCount; ++z) {
      auto regex_hits = set->RegexHits(static_cast<Zone>(z), folded);
      hits.insert(hits.end(), regex_hits.begin(), regex_hits.end());
    }
  } catch (const std::exception &e) {
    log::Error("classifier", "Scan failed", std::string("error=") + e.what());
    hits.clear();
  }
  return hits;
}

} // namespace zoneguard
