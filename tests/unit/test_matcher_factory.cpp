#include <catch2/catch.hpp>

#include "matching/matcher_factory.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace zoneguard;

namespace {

const std::vector<std::string> kKeywords{"kill myself", "manipulate", "sue"};

} // namespace

TEST_CASE("MatcherFactory prefers the automaton", "[matcher_factory]") {
  auto result = MatcherFactory::Create(kKeywords, MatcherOptions{});
  REQUIRE(result.matcher != nullptr);
  REQUIRE(result.matcher->Name() == "aho_corasick");
  REQUIRE_FALSE(result.used_fallback);
  REQUIRE(result.fallback_reason.empty());
}

TEST_CASE("MatcherFactory honours an explicit linear strategy",
          "[matcher_factory]") {
  MatcherOptions options;
  options.strategy = MatcherStrategy::kLinear;
  auto result = MatcherFactory::Create(kKeywords, options);
  REQUIRE(result.matcher->Name() == "linear_scan");
  // Configured, not degraded.
  REQUIRE_FALSE(result.used_fallback);
}

TEST_CASE("MatcherFactory falls back when the automaton exceeds its budget",
          "[matcher_factory]") {
  MatcherOptions options;
  options.max_automaton_states = 3;
  auto result = MatcherFactory::Create(kKeywords, options);
  REQUIRE(result.matcher->Name() == "linear_scan");
  REQUIRE(result.used_fallback);
  REQUIRE(result.fallback_reason.find("state budget") != std::string::npos);
  REQUIRE(result.matcher->Scan("i will sue").size() == 1);
}

TEST_CASE("MatcherFactory falls back when a custom builder throws",
          "[matcher_factory]") {
  MatcherOptions options;
  options.custom_builder = [](const std::vector<std::string> &)
      -> std::unique_ptr<LiteralMatcher> {
    throw std::runtime_error("automaton library unavailable");
  };
  auto result = MatcherFactory::Create(kKeywords, options);
  REQUIRE(result.matcher->Name() == "linear_scan");
  REQUIRE(result.used_fallback);
  REQUIRE(result.fallback_reason == "automaton library unavailable");
}

TEST_CASE("MatcherFactory falls back when a custom builder returns null",
          "[matcher_factory]") {
  MatcherOptions options;
  options.custom_builder = [](const std::vector<std::string> &)
      -> std::unique_ptr<LiteralMatcher> { return nullptr; };
  auto result = MatcherFactory::Create(kKeywords, options);
  REQUIRE(result.matcher->Name() == "linear_scan");
  REQUIRE(result.used_fallback);
}

TEST_CASE("ParseMatcherStrategy accepts names and aliases",
          "[matcher_factory]") {
  REQUIRE(ParseMatcherStrategy("automaton") == MatcherStrategy::kAutomaton);
  REQUIRE(ParseMatcherStrategy("auto") == MatcherStrategy::kAutomaton);
  REQUIRE(ParseMatcherStrategy("Aho_Corasick") == MatcherStrategy::kAutomaton);
  REQUIRE(ParseMatcherStrategy("LINEAR") == MatcherStrategy::kLinear);
  REQUIRE(ParseMatcherStrategy("linear_scan") == MatcherStrategy::kLinear);
  REQUIRE_FALSE(ParseMatcherStrategy("regex").has_value());
  REQUIRE(std::string(MatcherStrategyName(MatcherStrategy::kLinear)) ==
          "linear");
}
