#include <catch2/catch.hpp>

#include "policy/builtin_patterns.h"
#include "policy/pattern_store.h"

#include <string>
#include <type_traits>
#include <vector>

using namespace zoneguard;

namespace {

std::vector<Pattern> SmallSet() {
  return {
      Literal(Zone::kA, "Get Revenge", "violence"),
      Regex(Zone::kA, "make (a )?bomb", "weapons"),
      Literal(Zone::kB, "kill myself", "suicide"),
      Regex(Zone::kB, "end (my )?life", "suicide"),
      Regex(Zone::kB, "end my", "suicide"),
      Literal(Zone::kC, "manipulate", "manipulation"),
      Literal(Zone::kD, "medication", "medical"),
  };
}

} // namespace

TEST_CASE("PatternStore compiles a valid set", "[pattern_store]") {
  std::string error;
  auto set = PatternStore::Compile(SmallSet(), MatcherOptions{}, &error);
  REQUIRE(set != nullptr);
  REQUIRE(error.empty());
  REQUIRE(set->Literals().size() == 4);
  REQUIRE(set->Regexes().size() == 3);
  REQUIRE(set->LiteralCount(Zone::kA) == 1);
  REQUIRE(set->RegexCount(Zone::kB) == 2);
  REQUIRE(set->LiteralCount(Zone::kE) == 0);
  REQUIRE(set->Source() == "builtin");
  REQUIRE(set->Matcher().Name() == "aho_corasick");
  REQUIRE_FALSE(set->Degraded());
}

TEST_CASE("PatternStore folds literals but keeps configured text",
          "[pattern_store]") {
  std::string error;
  auto set = PatternStore::Compile(SmallSet(), MatcherOptions{}, &error);
  REQUIRE(set != nullptr);
  const auto &lit = set->Literals().front();
  REQUIRE(lit.text == "Get Revenge");
  REQUIRE(lit.folded == "get revenge");

  auto hits = set->ScanLiterals("i will get revenge");
  REQUIRE(hits.size() == 1);
  auto resolved = set->ResolveLiteral(hits[0]);
  REQUIRE(resolved.zone == Zone::kA);
  REQUIRE(resolved.tag == "violence");
  REQUIRE(resolved.matched == "Get Revenge");
  REQUIRE_FALSE(resolved.is_regex);
}

TEST_CASE("PatternStore regexes are case-insensitive and ordered",
          "[pattern_store]") {
  std::string error;
  auto set = PatternStore::Compile(SmallSet(), MatcherOptions{}, &error);
  REQUIRE(set != nullptr);

  auto first = set->FirstRegexHit(Zone::kB, "I want to END MY LIFE");
  REQUIRE(first.has_value());
  REQUIRE(first->pattern == "end (my )?life");
  REQUIRE(first->matched == "END MY LIFE");
  REQUIRE(first->is_regex);

  auto all = set->RegexHits(Zone::kB, "i want to end my life");
  REQUIRE(all.size() == 2);
  REQUIRE(all[0].pattern == "end (my )?life");
  REQUIRE(all[1].pattern == "end my");

  REQUIRE_FALSE(set->FirstRegexHit(Zone::kA, "bake a cake").has_value());
  REQUIRE_FALSE(set->FirstRegexHit(Zone::kE, "make a bomb").has_value());
}

TEST_CASE("PatternStore regexes match across non-UTF-8 bytes",
          "[pattern_store]") {
  std::string error;
  auto set = PatternStore::Compile({Regex(Zone::kA, "(create|build).*weapon",
                                          "weapons")},
                                   MatcherOptions{}, &error);
  REQUIRE(set != nullptr);

  auto hit = set->FirstRegexHit(Zone::kA, "build \xff\xfe a weapon");
  REQUIRE(hit.has_value());
  REQUIRE(hit->matched == "build \xff\xfe a weapon");
  REQUIRE(set->RegexHits(Zone::kA, "create \x80 weapon").size() == 1);
}

TEST_CASE("Compiled sets are only built by PatternStore", "[pattern_store]") {
  STATIC_REQUIRE_FALSE(std::is_default_constructible<CompiledPatternSet>::value);
  STATIC_REQUIRE_FALSE(std::is_copy_constructible<CompiledPatternSet>::value);

  auto set = PatternStore::Compile(SmallSet(), MatcherOptions{}, nullptr);
  REQUIRE(set != nullptr);
  REQUIRE(set.use_count() == 1);
}

TEST_CASE("PatternStore rejects invalid regex", "[pattern_store]") {
  std::string error;
  auto set = PatternStore::Compile({Regex(Zone::kA, "(unclosed", "violence")},
                                   MatcherOptions{}, &error);
  REQUIRE(set == nullptr);
  REQUIRE(error.find("invalid regex") != std::string::npos);
}

TEST_CASE("PatternStore rejects empty text, missing tag and zone E",
          "[pattern_store]") {
  std::string error;
  REQUIRE(PatternStore::Compile({Literal(Zone::kA, "", "violence")},
                                MatcherOptions{}, &error) == nullptr);
  REQUIRE(error.find("empty pattern text") != std::string::npos);

  REQUIRE(PatternStore::Compile({Literal(Zone::kA, "x", "")}, MatcherOptions{},
                                &error) == nullptr);
  REQUIRE(error.find("missing semantic tag") != std::string::npos);

  REQUIRE(PatternStore::Compile({Literal(Zone::kE, "hello", "greeting")},
                                MatcherOptions{}, &error) == nullptr);
  REQUIRE(error.find("zone E") != std::string::npos);
}

TEST_CASE("PatternStore rejects duplicate and conflicting literals",
          "[pattern_store]") {
  std::string error;
  REQUIRE(PatternStore::Compile({Literal(Zone::kB, "kill myself", "suicide"),
                                 Literal(Zone::kB, "KILL MYSELF", "suicide")},
                                MatcherOptions{}, &error) == nullptr);
  REQUIRE(error.find("duplicate pattern definition") != std::string::npos);

  REQUIRE(PatternStore::Compile({Literal(Zone::kB, "kill myself", "suicide"),
                                 Literal(Zone::kA, "kill myself", "violence")},
                                MatcherOptions{}, &error) == nullptr);
  REQUIRE(error.find("conflicting pattern definitions") != std::string::npos);
}

TEST_CASE("PatternStore requires C and D tags to map to augment categories",
          "[pattern_store]") {
  std::string error;
  REQUIRE(PatternStore::Compile({Literal(Zone::kC, "gaslight", "gaslighting")},
                                MatcherOptions{}, &error) == nullptr);
  REQUIRE(error.find("ethical preamble") != std::string::npos);

  REQUIRE(PatternStore::Compile({Literal(Zone::kD, "tax return", "tax")},
                                MatcherOptions{}, &error) == nullptr);
  REQUIRE(error.find("professional disclaimer") != std::string::npos);

  // A and B tags are free-form.
  REQUIRE(PatternStore::Compile({Literal(Zone::kB, "alone", "loneliness")},
                                MatcherOptions{}, &error) != nullptr);
}

TEST_CASE("PatternStore records matcher degradation", "[pattern_store]") {
  MatcherOptions options;
  options.max_automaton_states = 2;
  std::string error;
  auto set = PatternStore::Compile(SmallSet(), options, &error, "test");
  REQUIRE(set != nullptr);
  REQUIRE(set->Degraded());
  REQUIRE(set->Matcher().Name() == "linear_scan");
  REQUIRE_FALSE(set->FallbackReason().empty());
  REQUIRE(set->Source() == "test");
}

TEST_CASE("PatternStore assigns increasing versions", "[pattern_store]") {
  std::string error;
  auto first = PatternStore::Compile(SmallSet(), MatcherOptions{}, &error);
  auto second = PatternStore::Compile(SmallSet(), MatcherOptions{}, &error);
  REQUIRE(first != nullptr);
  REQUIRE(second != nullptr);
  REQUIRE(second->Version() > first->Version());
}

TEST_CASE("Builtin corpus compiles with every zone populated",
          "[pattern_store]") {
  std::string error;
  auto set = PatternStore::Compile(BuiltinPatterns(), MatcherOptions{}, &error);
  REQUIRE(set != nullptr);
  INFO(error);
  for (int z = 0; z < kPatternZoneCount; ++z) {
    const auto zone = static_cast<Zone>(z);
    REQUIRE(set->LiteralCount(zone) > 0);
    REQUIRE(set->RegexCount(zone) > 0);
  }
}
