#pragma once

#include "matching/literal_matcher.h"
#include "matching/matcher_factory.h"
#include "policy/zone.h"

#include <re2/re2.h>
#include <re2/set.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zoneguard {

struct CompiledLiteral {
  std::string text;   // as configured
  std::string folded; // what the matcher searches for
  Zone zone{Zone::kE};
  std::string tag;
};

struct CompiledRegex {
  std::string text;
  Zone zone{Zone::kE};
  std::string tag;
  std::unique_ptr<RE2> re;
};

// A match resolved back to the pattern definition that produced it.
struct PatternHit {
  Zone zone{Zone::kE};
  std::string tag;
  std::string pattern; // configured literal or regex source
  std::string matched; // literal as configured, or the regex's matched text
  bool is_regex{false};
  std::size_t end{0};  // end offset in the folded input (literal hits)
};

// CompiledPatternSet is the immutable artifact produced by PatternStore. It
// owns the literal matcher and the compiled regexes, and is shared read-only
// by every classification call. Updating patterns means compiling a new set
// and swapping the shared_ptr; a published set is never modified.
class CompiledPatternSet {
  // Only PatternStore can construct the key, so only it builds sets.
  class BuildKey {
    friend class PatternStore;
    BuildKey() {}
  };

public:
  explicit CompiledPatternSet(BuildKey) {}

  const std::vector<CompiledLiteral> &Literals() const { return literals_; }
  const std::vector<CompiledRegex> &Regexes() const { return regexes_; }
  std::size_t LiteralCount(Zone zone) const;
  std::size_t RegexCount(Zone zone) const;

  // Every literal occurrence in `folded_text` (see LiteralMatcher::Scan).
  std::vector<LiteralHit> ScanLiterals(const std::string &folded_text) const;
  PatternHit ResolveLiteral(const LiteralHit &hit) const;

  // First regex of `zone`, in definition order, that matches `folded_text`.
  std::optional<PatternHit> FirstRegexHit(Zone zone,
                                          const std::string &folded_text) const;
  // Every regex of `zone` that matches, in definition order.
  std::vector<PatternHit> RegexHits(Zone zone,
                                    const std::string &folded_text) const;

  const LiteralMatcher &Matcher() const { return *matcher_; }
  bool Degraded() const { return degraded_; }
  const std::string &FallbackReason() const { return fallback_reason_; }

  uint64_t Version() const { return version_; }
  const std::string &Source() const { return source_; }

private:
  friend class PatternStore;

  std::vector<std::size_t> CandidateRegexes(Zone zone,
                                            const std::string &folded_text) const;
  std::optional<PatternHit> MatchRegex(std::size_t index,
                                       const std::string &folded_text) const;

  std::vector<CompiledLiteral> literals_;
  std::vector<CompiledRegex> regexes_;
  std::array<std::size_t, kPatternZoneCount> zone_literal_counts_{};
  // Per zone: indices into regexes_ in definition order, and a RE2::Set over
  // the same regexes (set index i == zone_regex_ids_[zone][i]).
  std::array<std::vector<std::size_t>, kPatternZoneCount> zone_regex_ids_;
  std::array<std::unique_ptr<RE2::Set>, kPatternZoneCount> zone_regex_sets_;
  std::unique_ptr<LiteralMatcher> matcher_;
  bool degraded_{false};
  std::string fallback_reason_;
  uint64_t version_{0};
  std::string source_;
};

class PatternStore {
public:
  // Compiles `patterns` into an immutable set. On a configuration error
  // (invalid regex, empty text or tag, zone E pattern, duplicate or
  // conflicting definition, Zone C/D tag without a preamble/disclaimer
  // category) returns nullptr and fills *error. Callers treat that as fatal
  // at startup.
  static std::shared_ptr<const CompiledPatternSet>
  Compile(const std::vector<Pattern> &patterns, const MatcherOptions &options,
          std::string *error, const std::string &source = "builtin");
};

} // namespace zoneguard
