#pragma once

#include "matching/literal_matcher.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zoneguard {

enum class MatcherStrategy {
  kAutomaton,
  kLinear,
};

const char *MatcherStrategyName(MatcherStrategy strategy);
std::optional<MatcherStrategy> ParseMatcherStrategy(const std::string &name);

using MatcherBuilder = std::function<std::unique_ptr<LiteralMatcher>(
    const std::vector<std::string> &)>;

struct MatcherOptions {
  MatcherStrategy strategy{MatcherStrategy::kAutomaton};
  // Upper bound on automaton states; 0 = unbounded.
  std::size_t max_automaton_states{0};
  // When set, replaces the automaton as the preferred engine. A builder that
  // throws or returns nullptr degrades to the linear scan like the automaton.
  MatcherBuilder custom_builder;
};

struct MatcherFactoryResult {
  std::unique_ptr<LiteralMatcher> matcher;
  bool used_fallback{false};
  std::string fallback_reason;
};

// MatcherFactory selects the literal matching strategy once, when a pattern
// set is compiled. Failure to construct the preferred engine is never fatal:
// the factory logs a degraded-mode warning and hands back a LinearScanMatcher.
class MatcherFactory {
public:
  static MatcherFactoryResult Create(const std::vector<std::string> &keywords,
                                     const MatcherOptions &options);
};

} // namespace zoneguard
