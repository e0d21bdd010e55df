#pragma once

#include "policy/zone.h"

#include <vector>

namespace zoneguard {

// Default pattern corpus used when no pattern file is configured.
const std::vector<Pattern> &BuiltinPatterns();

} // namespace zoneguard
