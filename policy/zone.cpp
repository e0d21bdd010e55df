#include "policy/zone.h"

#include <cctype>

namespace zoneguard {

const char *ZoneName(Zone zone) {
  switch (zone) {
  case Zone::kA:
    return "A";
  case Zone::kB:
    return "B";
  case Zone::kC:
    return "C";
  case Zone::kD:
    return "D";
  case Zone::kE:
    return "E";
  }
  return "E";
}

std::optional<Zone> ParseZone(const std::string &name) {
  if (name.size() != 1) {
    return std::nullopt;
  }
  switch (std::toupper(static_cast<unsigned char>(name[0]))) {
  case 'A':
    return Zone::kA;
  case 'B':
    return Zone::kB;
  case 'C':
    return Zone::kC;
  case 'D':
    return Zone::kD;
  case 'E':
    return Zone::kE;
  default:
    return std::nullopt;
  }
}

} // namespace zoneguard
