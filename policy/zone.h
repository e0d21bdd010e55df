#pragma once

#include <optional>
#include <string>
#include <utility>

namespace zoneguard {

// Safety zones in priority order. A lower enumerator value always wins over a
// higher one when patterns from several zones match the same input.
//   A: block, no inference
//   B: crisis resources, no inference
//   C: ethical preamble, then inference
//   D: inference, then professional disclaimer
//   E: pass through
enum class Zone { kA = 0, kB = 1, kC = 2, kD = 3, kE = 4 };

// Number of zones that carry patterns (A..D).
constexpr int kPatternZoneCount = 4;

const char *ZoneName(Zone zone);
std::optional<Zone> ParseZone(const std::string &name);

inline int ZoneIndex(Zone zone) { return static_cast<int>(zone); }

// True when `lhs` takes precedence over `rhs`.
inline bool HigherPriority(Zone lhs, Zone rhs) {
  return ZoneIndex(lhs) < ZoneIndex(rhs);
}

// A single pattern definition as supplied by configuration. Literal text is
// matched as a case-folded substring; regex text is compiled once with
// case-insensitive matching.
struct Pattern {
  std::string text;
  Zone zone{Zone::kE};
  std::string tag;
  bool is_regex{false};
};

inline Pattern Literal(Zone zone, std::string text, std::string tag) {
  return Pattern{std::move(text), zone, std::move(tag), false};
}

inline Pattern Regex(Zone zone, std::string text, std::string tag) {
  return Pattern{std::move(text), zone, std::move(tag), true};
}

} // namespace zoneguard
