#pragma once

#include "matching/matcher_factory.h"
#include "server/logging/logger.h"
#include "server/policy/response_augmentor.h"

#include <string>

namespace zoneguard {

struct EngineConfig {
  MatcherOptions matcher;
  // Empty = builtin corpus.
  std::string patterns_file;
  std::string default_locale{"INTL"};
  // Starts from the built-in texts; `augment.preambles` and
  // `augment.disclaimers` replace individual entries.
  AugmentTexts texts{AugmentTexts::Defaults()};
  bool log_json{false};
  log::Level log_level{log::Level::INFO};
  bool debug_text{false};
};

// Reads `path` into *config. A missing file leaves the defaults in place and
// succeeds. Returns false with *error set on YAML syntax errors or invalid
// values (unknown strategy, unknown flag name, unknown log level/format).
bool LoadEngineConfig(const std::string &path, EngineConfig *config,
                      std::string *error);

// Same as LoadEngineConfig for an in-memory document.
bool ParseEngineConfig(const std::string &yaml, EngineConfig *config,
                       std::string *error);

// ZONEGUARD_MATCHER, ZONEGUARD_MAX_AUTOMATON_STATES, ZONEGUARD_PATTERNS_FILE,
// ZONEGUARD_DEFAULT_LOCALE, ZONEGUARD_LOG_FORMAT, ZONEGUARD_LOG_LEVEL and
// ZONEGUARD_DEBUG_TEXT override whatever the file set.
bool ApplyEnvOverrides(EngineConfig *config, std::string *error);

// Pushes the logging section into the process-wide logger.
void ApplyLogging(const EngineConfig &config);

} // namespace zoneguard
