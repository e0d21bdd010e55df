#include "matching/matcher_factory.h"

#include "matching/aho_corasick_matcher.h"
#include "matching/linear_scan_matcher.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <exception>

namespace zoneguard {

namespace {

MatcherFactoryResult LinearFallback(const std::vector<std::string> &keywords,
                                    const std::string &reason) {
  MatcherFactoryResult out;
  out.matcher = std::make_unique<LinearScanMatcher>(keywords);
  if (!reason.empty()) {
    log::Warn("matcher_factory",
              "Literal matcher running in degraded mode (linear scan): " +
                  reason,
              "keywords=" + std::to_string(keywords.size()));
    out.used_fallback = true;
    out.fallback_reason = reason;
  }
  return out;
}

} // namespace

const char *MatcherStrategyName(MatcherStrategy strategy) {
  switch (strategy) {
  case MatcherStrategy::kAutomaton:
    return "automaton";
  case MatcherStrategy::kLinear:
    return "linear";
  }
  return "automaton";
}

std::optional<MatcherStrategy> ParseMatcherStrategy(const std::string &name) {
  std::string lowered = name;
  std::transform(
      lowered.begin(), lowered.end(), lowered.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "automaton" || lowered == "aho_corasick" ||
      lowered == "auto") {
    return MatcherStrategy::kAutomaton;
  }
  if (lowered == "linear" || lowered == "linear_scan") {
    return MatcherStrategy::kLinear;
  }
  return std::nullopt;
}

MatcherFactoryResult
MatcherFactory::Create(const std::vector<std::string> &keywords,
                       const MatcherOptions &options) {
  if (options.strategy == MatcherStrategy::kLinear && !options.custom_builder) {
    return LinearFallback(keywords, "");
  }

  MatcherFactoryResult out;
  try {
    if (options.custom_builder) {
      out.matcher = options.custom_builder(keywords);
      if (!out.matcher) {
        return LinearFallback(keywords, "custom matcher builder returned null");
      }
    } else {
      out.matcher = std::make_unique<AhoCorasickMatcher>(
          keywords, options.max_automaton_states);
    }
  } catch (const std::exception &e) {
    return LinearFallback(keywords, e.what());
  }
  log::Debug("matcher_factory", "Built literal matcher",
             "engine=" + out.matcher->Name() +
                 " keywords=" + std::to_string(keywords.size()));
  return out;
}

} // namespace zoneguard
