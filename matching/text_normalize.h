#pragma once

#include <string>

namespace zoneguard {

// ASCII case folding applied once per input and once per literal at load
// time. Bytes >= 0x80 (UTF-8 continuation/lead bytes) pass through unchanged
// so multi-byte sequences are never corrupted.
std::string FoldCase(const std::string &text);

// True for empty input or input consisting only of ASCII whitespace.
bool IsBlank(const std::string &text);

} // namespace zoneguard
