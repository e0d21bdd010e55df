#include "policy/pattern_file.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace zoneguard {

namespace {

bool ParseNode(const YAML::Node &root, std::vector<Pattern> *patterns,
               std::string *error) {
  if (!root["patterns"] || !root["patterns"].IsSequence()) {
    *error = "pattern file must contain a 'patterns' sequence";
    return false;
  }
  std::vector<Pattern> parsed;
  std::size_t index = 0;
  for (const auto &node : root["patterns"]) {
    const std::string where = "patterns[" + std::to_string(index++) + "]";
    if (!node.IsMap()) {
      *error = where + ": expected a mapping";
      return false;
    }
    if (!node["zone"] || !node["tag"]) {
      *error = where + ": 'zone' and 'tag' are required";
      return false;
    }
    auto zone = ParseZone(node["zone"].as<std::string>());
    if (!zone) {
      *error = where + ": unknown zone '" + node["zone"].as<std::string>() +
               "'";
      return false;
    }
    const bool has_literal = static_cast<bool>(node["literal"]);
    const bool has_regex = static_cast<bool>(node["regex"]);
    if (has_literal == has_regex) {
      *error = where + ": exactly one of 'literal' or 'regex' is required";
      return false;
    }
    Pattern p;
    p.zone = *zone;
    p.tag = node["tag"].as<std::string>();
    p.is_regex = has_regex;
    p.text = has_regex ? node["regex"].as<std::string>()
                       : node["literal"].as<std::string>();
    parsed.push_back(std::move(p));
  }
  *patterns = std::move(parsed);
  return true;
}

} // namespace

bool ParsePatternYaml(const std::string &yaml, std::vector<Pattern> *patterns,
                      std::string *error) {
  std::string local_error;
  std::string *err = error ? error : &local_error;
  try {
    return ParseNode(YAML::Load(yaml), patterns, err);
  } catch (const YAML::Exception &e) {
    *err = std::string("invalid pattern YAML: ") + e.what();
    return false;
  }
}

bool LoadPatternFile(const std::string &path, std::vector<Pattern> *patterns,
                     std::string *error) {
  std::string local_error;
  std::string *err = error ? error : &local_error;
  if (!std::filesystem::exists(path)) {
    *err = "pattern file not found: " + path;
    return false;
  }
  try {
    if (!ParseNode(YAML::LoadFile(path), patterns, err)) {
      *err = path + ": " + *err;
      return false;
    }
    return true;
  } catch (const YAML::Exception &e) {
    *err = "error parsing pattern file " + path + ": " + e.what();
    return false;
  }
}

} // namespace zoneguard
