#include "server/config/engine_config.h"

#include "server/logging/redact.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace zoneguard {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto lower = ToLower(value);
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

bool SetStrategy(const std::string &name, EngineConfig *config,
                 std::string *error) {
  auto strategy = ParseMatcherStrategy(name);
  if (!strategy) {
    *error = "unknown matcher strategy '" + name + "'";
    return false;
  }
  config->matcher.strategy = *strategy;
  return true;
}

bool SetLogFormat(const std::string &name, EngineConfig *config,
                  std::string *error) {
  const auto lower = ToLower(name);
  if (lower == "json") {
    config->log_json = true;
  } else if (lower == "text") {
    config->log_json = false;
  } else {
    *error = "unknown log format '" + name + "'";
    return false;
  }
  return true;
}

bool SetLogLevel(const std::string &name, EngineConfig *config,
                 std::string *error) {
  auto level = log::ParseLevel(name);
  if (!level) {
    *error = "unknown log level '" + name + "'";
    return false;
  }
  config->log_level = *level;
  return true;
}

bool ApplyDocument(const YAML::Node &root, EngineConfig *config,
                   std::string *error) {
  if (!root || root.IsNull()) {
    return true;
  }
  if (!root.IsMap()) {
    *error = "config root must be a mapping";
    return false;
  }

  if (const auto matcher = root["matcher"]) {
    if (matcher["strategy"] &&
        !SetStrategy(matcher["strategy"].as<std::string>(), config, error)) {
      return false;
    }
    if (matcher["max_automaton_states"]) {
      config->matcher.max_automaton_states =
          matcher["max_automaton_states"].as<std::size_t>();
    }
  }

  if (const auto patterns = root["patterns"]) {
    if (patterns["file"]) {
      config->patterns_file = patterns["file"].as<std::string>();
    }
  }

  if (const auto crisis = root["crisis"]) {
    if (crisis["default_locale"]) {
      config->default_locale = crisis["default_locale"].as<std::string>();
    }
  }

  if (const auto augment = root["augment"]) {
    if (const auto preambles = augment["preambles"]) {
      if (!preambles.IsMap()) {
        *error = "augment.preambles must be a mapping";
        return false;
      }
      for (const auto &entry : preambles) {
        const auto name = entry.first.as<std::string>();
        auto flag = ParseEthicalFlag(name);
        if (!flag) {
          *error = "unknown ethical flag '" + name + "' in augment.preambles";
          return false;
        }
        config->texts.Preamble(*flag) = entry.second.as<std::string>();
      }
    }
    if (const auto disclaimers = augment["disclaimers"]) {
      if (!disclaimers.IsMap()) {
        *error = "augment.disclaimers must be a mapping";
        return false;
      }
      for (const auto &entry : disclaimers) {
        const auto name = entry.first.as<std::string>();
        auto category = ParseProfessionalCategory(name);
        if (!category) {
          *error = "unknown professional category '" + name +
                   "' in augment.disclaimers";
          return false;
        }
        config->texts.Disclaimer(*category) = entry.second.as<std::string>();
      }
    }
  }

  if (const auto logging = root["logging"]) {
    if (logging["format"] &&
        !SetLogFormat(logging["format"].as<std::string>(), config, error)) {
      return false;
    }
    if (logging["level"] &&
        !SetLogLevel(logging["level"].as<std::string>(), config, error)) {
      return false;
    }
    if (logging["debug_text"]) {
      config->debug_text = logging["debug_text"].as<bool>();
    }
  }
  return true;
}

} // namespace

bool ParseEngineConfig(const std::string &yaml, EngineConfig *config,
                       std::string *error) {
  try {
    return ApplyDocument(YAML::Load(yaml), config, error);
  } catch (const YAML::Exception &e) {
    *error = std::string("invalid config: ") + e.what();
    return false;
  }
}

bool LoadEngineConfig(const std::string &path, EngineConfig *config,
                      std::string *error) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return true;
  }
  try {
    return ApplyDocument(YAML::LoadFile(path), config, error);
  } catch (const YAML::Exception &e) {
    *error = "error parsing config file " + path + ": " + e.what();
    return false;
  }
}

bool ApplyEnvOverrides(EngineConfig *config, std::string *error) {
  if (const char *env_matcher = std::getenv("ZONEGUARD_MATCHER")) {
    if (!SetStrategy(env_matcher, config, error)) {
      return false;
    }
  }
  if (const char *env_states = std::getenv("ZONEGUARD_MAX_AUTOMATON_STATES")) {
    try {
      config->matcher.max_automaton_states = std::stoul(env_states);
    } catch (const std::exception &) {
      *error = std::string("invalid ZONEGUARD_MAX_AUTOMATON_STATES '") +
               env_states + "'";
      return false;
    }
  }
  if (const char *env_patterns = std::getenv("ZONEGUARD_PATTERNS_FILE")) {
    config->patterns_file = env_patterns;
  }
  if (const char *env_locale = std::getenv("ZONEGUARD_DEFAULT_LOCALE")) {
    config->default_locale = env_locale;
  }
  if (const char *env_format = std::getenv("ZONEGUARD_LOG_FORMAT")) {
    if (!SetLogFormat(env_format, config, error)) {
      return false;
    }
  }
  if (const char *env_level = std::getenv("ZONEGUARD_LOG_LEVEL")) {
    if (!SetLogLevel(env_level, config, error)) {
      return false;
    }
  }
  if (const char *env_debug = std::getenv("ZONEGUARD_DEBUG_TEXT")) {
    config->debug_text = ParseBool(env_debug);
  }
  return true;
}

void ApplyLogging(const EngineConfig &config) {
  log::SetJsonMode(config.log_json);
  log::SetMinLevel(config.log_level);
  log::SetDebugText(config.debug_text);
}

} // namespace zoneguard
