#pragma once

#include "policy/zone.h"

#include <string>
#include <vector>

namespace zoneguard {

// Reads pattern definitions from a YAML file:
//
//   patterns:
//     - zone: A
//       tag: violence
//       literal: "get revenge"
//     - zone: B
//       tag: suicide
//       regex: "end (my )?life"
//
// Returns false and fills *error on unreadable files, YAML syntax errors,
// unknown zones, or entries without exactly one of literal/regex. Semantic
// validation (regex syntax, duplicates, tag categories) happens in
// PatternStore::Compile.
bool LoadPatternFile(const std::string &path, std::vector<Pattern> *patterns,
                     std::string *error);

// Same as LoadPatternFile but parses YAML already held in memory.
bool ParsePatternYaml(const std::string &yaml, std::vector<Pattern> *patterns,
                      std::string *error);

} // namespace zoneguard
