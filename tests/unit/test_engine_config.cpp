#include <catch2/catch.hpp>

#include "server/config/engine_config.h"
#include "server/logging/redact.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace zoneguard;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
  EnvGuard(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~EnvGuard() { ::unsetenv(name_); }

private:
  const char *name_;
};

} // namespace

TEST_CASE("EngineConfig defaults", "[config]") {
  EngineConfig config;
  REQUIRE(config.matcher.strategy == MatcherStrategy::kAutomaton);
  REQUIRE(config.matcher.max_automaton_states == 0);
  REQUIRE(config.patterns_file.empty());
  REQUIRE(config.default_locale == "INTL");
  REQUIRE_FALSE(config.log_json);
  REQUIRE(config.log_level == log::Level::INFO);
  REQUIRE(config.texts.preambles[0] == DefaultPreamble(EthicalFlag::kManipulation));
}

TEST_CASE("ParseEngineConfig reads every section", "[config]") {
  const std::string yaml = R"(
matcher:
  strategy: linear
  max_automaton_states: 5000
patterns:
  file: /etc/zoneguard/patterns.yaml
crisis:
  default_locale: UK
augment:
  preambles:
    dependency: "custom dependency preamble"
  disclaimers:
    legal: ""
logging:
  format: json
  level: debug
  debug_text: true
)";
  EngineConfig config;
  std::string error;
  REQUIRE(ParseEngineConfig(yaml, &config, &error));
  REQUIRE(config.matcher.strategy == MatcherStrategy::kLinear);
  REQUIRE(config.matcher.max_automaton_states == 5000);
  REQUIRE(config.patterns_file == "/etc/zoneguard/patterns.yaml");
  REQUIRE(config.default_locale == "UK");
  REQUIRE(config.texts.Preamble(EthicalFlag::kDependency) ==
          "custom dependency preamble");
  REQUIRE(config.texts.Preamble(EthicalFlag::kManipulation) ==
          DefaultPreamble(EthicalFlag::kManipulation));
  REQUIRE(config.texts.Disclaimer(ProfessionalCategory::kLegal).empty());
  REQUIRE(config.log_json);
  REQUIRE(config.log_level == log::Level::DEBUG);
  REQUIRE(config.debug_text);
}

TEST_CASE("ParseEngineConfig rejects invalid values", "[config]") {
  EngineConfig config;
  std::string error;

  REQUIRE_FALSE(ParseEngineConfig("matcher:\n  strategy: regex\n", &config,
                                  &error));
  REQUIRE(error.find("unknown matcher strategy") != std::string::npos);

  REQUIRE_FALSE(ParseEngineConfig(
      "augment:\n  preambles:\n    flattery: hi\n", &config, &error));
  REQUIRE(error.find("unknown ethical flag 'flattery'") != std::string::npos);

  REQUIRE_FALSE(ParseEngineConfig(
      "augment:\n  disclaimers:\n    tax: hi\n", &config, &error));
  REQUIRE(error.find("unknown professional category 'tax'") !=
          std::string::npos);

  REQUIRE_FALSE(ParseEngineConfig("logging:\n  format: xml\n", &config,
                                  &error));
  REQUIRE(error.find("unknown log format") != std::string::npos);

  REQUIRE_FALSE(ParseEngineConfig("logging:\n  level: loud\n", &config,
                                  &error));
  REQUIRE(error.find("unknown log level") != std::string::npos);

  REQUIRE_FALSE(ParseEngineConfig("matcher: [1, 2\n", &config, &error));
  REQUIRE(error.find("invalid config") != std::string::npos);

  REQUIRE_FALSE(ParseEngineConfig(
      "matcher:\n  max_automaton_states: lots\n", &config, &error));
}

TEST_CASE("ParseEngineConfig accepts an empty document", "[config]") {
  EngineConfig config;
  std::string error;
  REQUIRE(ParseEngineConfig("", &config, &error));
  REQUIRE(config.default_locale == "INTL");
}

TEST_CASE("LoadEngineConfig treats a missing file as defaults", "[config]") {
  EngineConfig config;
  std::string error;
  REQUIRE(LoadEngineConfig("/nonexistent/zoneguard.yaml", &config, &error));
  REQUIRE(config.matcher.strategy == MatcherStrategy::kAutomaton);
}

TEST_CASE("LoadEngineConfig reads from disk", "[config]") {
  auto tmp_path =
      std::filesystem::temp_directory_path() / "zoneguard_config_test.yaml";
  {
    std::ofstream out(tmp_path);
    out << "crisis:\n  default_locale: AU\n";
  }
  EngineConfig config;
  std::string error;
  REQUIRE(LoadEngineConfig(tmp_path.string(), &config, &error));
  REQUIRE(config.default_locale == "AU");
  std::filesystem::remove(tmp_path);
}

TEST_CASE("Environment overrides win over file values", "[config]") {
  EngineConfig config;
  std::string error;
  REQUIRE(ParseEngineConfig("matcher:\n  strategy: automaton\n", &config,
                            &error));
  {
    EnvGuard matcher("ZONEGUARD_MATCHER", "linear");
    EnvGuard states("ZONEGUARD_MAX_AUTOMATON_STATES", "128");
    EnvGuard patterns("ZONEGUARD_PATTERNS_FILE", "/tmp/p.yaml");
    EnvGuard locale("ZONEGUARD_DEFAULT_LOCALE", "IN");
    EnvGuard format("ZONEGUARD_LOG_FORMAT", "json");
    EnvGuard level("ZONEGUARD_LOG_LEVEL", "warn");
    EnvGuard debug("ZONEGUARD_DEBUG_TEXT", "true");
    REQUIRE(ApplyEnvOverrides(&config, &error));
  }
  REQUIRE(config.matcher.strategy == MatcherStrategy::kLinear);
  REQUIRE(config.matcher.max_automaton_states == 128);
  REQUIRE(config.patterns_file == "/tmp/p.yaml");
  REQUIRE(config.default_locale == "IN");
  REQUIRE(config.log_json);
  REQUIRE(config.log_level == log::Level::WARN);
  REQUIRE(config.debug_text);
}

TEST_CASE("Invalid environment overrides are configuration errors",
          "[config]") {
  EngineConfig config;
  std::string error;
  {
    EnvGuard matcher("ZONEGUARD_MATCHER", "quantum");
    REQUIRE_FALSE(ApplyEnvOverrides(&config, &error));
    REQUIRE(error.find("quantum") != std::string::npos);
  }
  {
    EnvGuard states("ZONEGUARD_MAX_AUTOMATON_STATES", "many");
    REQUIRE_FALSE(ApplyEnvOverrides(&config, &error));
    REQUIRE(error.find("ZONEGUARD_MAX_AUTOMATON_STATES") != std::string::npos);
  }
}

TEST_CASE("ApplyLogging configures the process logger", "[config]") {
  EngineConfig config;
  config.log_json = true;
  config.log_level = log::Level::ERROR;
  config.debug_text = true;
  ApplyLogging(config);
  REQUIRE(log::IsJsonMode());
  REQUIRE(log::MinLevel() == log::Level::ERROR);
  REQUIRE(log::IsDebugText());

  ApplyLogging(EngineConfig{});
  REQUIRE_FALSE(log::IsJsonMode());
  REQUIRE(log::MinLevel() == log::Level::INFO);
  REQUIRE_FALSE(log::IsDebugText());
}
