#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace zoneguard {

// One occurrence of a literal keyword. `pattern_id` indexes the keyword list
// the matcher was built from; `end` is the offset one past the last matched
// byte.
struct LiteralHit {
  std::size_t pattern_id{0};
  std::size_t end{0};

  bool operator==(const LiteralHit &other) const {
    return pattern_id == other.pattern_id && end == other.end;
  }
};

// LiteralMatcher is the strategy interface for multi-keyword substring search.
// Implementations receive already case-folded keywords at construction and
// case-folded text at scan time.
//
// Scan() reports every occurrence of every keyword, ordered by `end` and then
// by ascending `pattern_id`. Every implementation must produce exactly the
// same hit list for the same input so strategies can be swapped freely.
//
// Thread safety: Scan() is const and must be safe to call concurrently.
class LiteralMatcher {
public:
  virtual ~LiteralMatcher() = default;

  virtual std::vector<LiteralHit> Scan(const std::string &folded_text) const = 0;

  virtual std::size_t PatternCount() const = 0;

  // Identity for logging and metrics ("aho_corasick", "linear_scan").
  virtual std::string Name() const = 0;
};

} // namespace zoneguard
