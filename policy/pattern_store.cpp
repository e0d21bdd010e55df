#include "policy/pattern_store.h"

#include "matching/text_normalize.h"
#include "policy/flags.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <atomic>
#include <unordered_map>

namespace zoneguard {

namespace {

std::atomic<uint64_t> g_next_version{1};

std::string Describe(const Pattern &p) {
  return std::string(p.is_regex ? "regex" : "literal") + " '" + p.text +
         "' (zone " + ZoneName(p.zone) + ", tag " + p.tag + ")";
}

bool Fail(std::string *error, const std::string &message) {
  if (error) {
    *error = message;
  }
  log::Error("pattern_store", message);
  return false;
}

bool ValidateDefinition(const Pattern &p, std::string *error) {
  if (p.text.empty()) {
    return Fail(error, "empty pattern text for tag '" + p.tag + "'");
  }
  if (p.tag.empty()) {
    return Fail(error, "missing semantic tag on " + Describe(p));
  }
  if (p.zone == Zone::kE) {
    return Fail(error, "zone E carries no patterns: " + Describe(p));
  }
  if (p.zone == Zone::kC && !ParseEthicalFlag(p.tag)) {
    return Fail(error, "zone C tag has no ethical preamble: " + Describe(p));
  }
  if (p.zone == Zone::kD && !ParseProfessionalCategory(p.tag)) {
    return Fail(error, "zone D tag has no professional disclaimer: " +
                           Describe(p));
  }
  return true;
}

RE2::Options RegexOptions() {
  // Latin-1 keeps every byte matchable, so invalid UTF-8 in the input
  // cannot break a wildcard such as `.*`.
  RE2::Options opts;
  opts.set_encoding(RE2::Options::EncodingLatin1);
  opts.set_case_sensitive(false);
  opts.set_log_errors(false);
  return opts;
}

} // namespace

std::size_t CompiledPatternSet::LiteralCount(Zone zone) const {
  if (zone == Zone::kE) {
    return 0;
  }
  return zone_literal_counts_[ZoneIndex(zone)];
}

std::size_t CompiledPatternSet::RegexCount(Zone zone) const {
  if (zone == Zone::kE) {
    return 0;
  }
  return zone_regex_ids_[ZoneIndex(zone)].size();
}

std::vector<LiteralHit>
CompiledPatternSet::ScanLiterals(const std::string &folded_text) const {
  return matcher_->Scan(folded_text);
}

PatternHit CompiledPatternSet::ResolveLiteral(const LiteralHit &hit) const {
  const auto &lit = literals_.at(hit.pattern_id);
  PatternHit out;
  out.zone = lit.zone;
  out.tag = lit.tag;
  out.pattern = lit.text;
  out.matched = lit.text;
  out.is_regex = false;
  out.end = hit.end;
  return out;
}

std::vector<std::size_t>
CompiledPatternSet::CandidateRegexes(Zone zone,
                                     const std::string &folded_text) const {
  std::vector<std::size_t> candidates;
  if (zone == Zone::kE) {
    return candidates;
  }
  const auto &ids = zone_regex_ids_[ZoneIndex(zone)];
  const auto &set = zone_regex_sets_[ZoneIndex(zone)];
  if (ids.empty()) {
    return candidates;
  }
  if (set) {
    std::vector<int> matched;
    RE2::Set::ErrorInfo info;
    info.kind = RE2::Set::kNoError;
    if (set->Match(folded_text, &matched, &info)) {
      std::sort(matched.begin(), matched.end());
      candidates.reserve(matched.size());
      for (int i : matched) {
        candidates.push_back(ids[static_cast<std::size_t>(i)]);
      }
      return candidates;
    }
    if (info.kind == RE2::Set::kNoError) {
      return candidates;
    }
    // The set's DFA ran out of memory: test every regex of the zone instead.
    log::Warn("pattern_store", "RE2::Set match failed; testing regexes one by one",
              std::string("zone=") + ZoneName(zone) +
                  " error_kind=" + std::to_string(static_cast<int>(info.kind)));
  }
  return ids;
}

std::optional<PatternHit>
CompiledPatternSet::MatchRegex(std::size_t index,
                               const std::string &folded_text) const {
  const auto &rx = regexes_[index];
  re2::StringPiece input(folded_text);
  re2::StringPiece match;
  if (!rx.re->Match(input, 0, input.size(), RE2::UNANCHORED, &match, 1)) {
    return std::nullopt;
  }
  PatternHit out;
  out.zone = rx.zone;
  out.tag = rx.tag;
  out.pattern = rx.text;
  out.matched = std::string(match.data(), match.size());
  out.is_regex = true;
  out.end = static_cast<std::size_t>(match.data() - input.data()) + match.size();
  return out;
}

std::optional<PatternHit>
CompiledPatternSet::FirstRegexHit(Zone zone,
                                  const std::string &folded_text) const {
  for (std::size_t index : CandidateRegexes(zone, folded_text)) {
    auto hit = MatchRegex(index, folded_text);
    if (hit) {
      return hit;
    }
  }
  return std::nullopt;
}

std::vector<PatternHit>
CompiledPatternSet::RegexHits(Zone zone, const std::string &folded_text) const {
  std::vector<PatternHit> hits;
  for (std::size_t index : CandidateRegexes(zone, folded_text)) {
    auto hit = MatchRegex(index, folded_text);
    if (hit) {
      hits.push_back(std::move(*hit));
    }
  }
  return hits;
}

std::shared_ptr<const CompiledPatternSet>
PatternStore::Compile(const std::vector<Pattern> &patterns,
                      const MatcherOptions &options, std::string *error,
                      const std::string &source) {
  auto set =
      std::make_shared<CompiledPatternSet>(CompiledPatternSet::BuildKey());
  set->source_ = source;

  // Keyed by kind + normalized text; detects duplicates and conflicts.
  std::unordered_map<std::string, const Pattern *> seen;
  std::vector<std::string> keywords;

  for (const auto &p : patterns) {
    if (!ValidateDefinition(p, error)) {
      return nullptr;
    }
    const std::string normalized = p.is_regex ? p.text : FoldCase(p.text);
    const std::string key = (p.is_regex ? "re:" : "lit:") + normalized;
    auto [it, inserted] = seen.emplace(key, &p);
    if (!inserted) {
      const Pattern &prior = *it->second;
      if (prior.zone == p.zone && prior.tag == p.tag) {
        Fail(error, "duplicate pattern definition: " + Describe(p));
      } else {
        Fail(error, "conflicting pattern definitions: " + Describe(prior) +
                        " vs " + Describe(p));
      }
      return nullptr;
    }

    const int z = ZoneIndex(p.zone);
    if (p.is_regex) {
      CompiledRegex rx;
      rx.text = p.text;
      rx.zone = p.zone;
      rx.tag = p.tag;
      rx.re = std::make_unique<RE2>(p.text, RegexOptions());
      if (!rx.re->ok()) {
        Fail(error, "invalid " + Describe(p) + ": " + rx.re->error());
        return nullptr;
      }
      set->zone_regex_ids_[z].push_back(set->regexes_.size());
      set->regexes_.push_back(std::move(rx));
    } else {
      CompiledLiteral lit;
      lit.text = p.text;
      lit.folded = normalized;
      lit.zone = p.zone;
      lit.tag = p.tag;
      keywords.push_back(lit.folded);
      set->literals_.push_back(std::move(lit));
      ++set->zone_literal_counts_[z];
    }
  }

  for (int z = 0; z < kPatternZoneCount; ++z) {
    const auto &ids = set->zone_regex_ids_[z];
    if (ids.empty()) {
      continue;
    }
    auto rset = std::make_unique<RE2::Set>(RegexOptions(), RE2::UNANCHORED);
    bool ok = true;
    for (std::size_t index : ids) {
      std::string add_error;
      if (rset->Add(set->regexes_[index].text, &add_error) < 0) {
        ok = false;
        break;
      }
    }
    if (ok && rset->Compile()) {
      set->zone_regex_sets_[z] = std::move(rset);
    } else {
      // Each regex compiled individually, so matching still works one by one.
      log::Warn("pattern_store", "RE2::Set unavailable for zone; regexes are "
                                 "tested one by one",
                std::string("zone=") + ZoneName(static_cast<Zone>(z)));
    }
  }

  auto selection = MatcherFactory::Create(keywords, options);
  set->matcher_ = std::move(selection.matcher);
  set->degraded_ = selection.used_fallback;
  set->fallback_reason_ = selection.fallback_reason;
  set->version_ = g_next_version.fetch_add(1);

  log::Info("pattern_store", "Compiled pattern set",
            "version=" + std::to_string(set->version_) + " source=" + source +
                " literals=" + std::to_string(set->literals_.size()) +
                " regexes=" + std::to_string(set->regexes_.size()) +
                " engine=" + set->matcher_->Name());
  return set;
}

} // namespace zoneguard
