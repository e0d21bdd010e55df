#pragma once

#include <string>

namespace zoneguard {
namespace log {

// When enabled, diagnostics carry raw user text instead of its SHA-256
// digest. Off by default; never enable in production.
void SetDebugText(bool enabled);
bool IsDebugText();

// SHA-256 of `content` as 64 lowercase hex characters.
std::string HashContent(const std::string &content);

// "text=<raw>" in debug-text mode, otherwise "text_sha256=<digest>".
std::string RedactText(const std::string &text);

} // namespace log
} // namespace zoneguard
