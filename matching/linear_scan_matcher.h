#pragma once

#include "matching/literal_matcher.h"

#include <string>
#include <vector>

namespace zoneguard {

// LinearScanMatcher tests every keyword against the text with a substring
// search. O(text x keywords); used only when the automaton cannot be built.
class LinearScanMatcher : public LiteralMatcher {
public:
  explicit LinearScanMatcher(std::vector<std::string> keywords);

  std::vector<LiteralHit> Scan(const std::string &folded_text) const override;
  std::size_t PatternCount() const override { return keywords_.size(); }
  std::string Name() const override { return "linear_scan"; }

private:
  std::vector<std::string> keywords_;
};

} // namespace zoneguard
