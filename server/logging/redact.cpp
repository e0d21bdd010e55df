#include "server/logging/redact.h"

#include <openssl/sha.h>

#include <atomic>
#include <iomanip>
#include <sstream>

namespace zoneguard {
namespace log {

namespace {
std::atomic<bool> g_debug_text{false};
} // namespace

void SetDebugText(bool enabled) { g_debug_text.store(enabled); }
bool IsDebugText() { return g_debug_text.load(); }

std::string HashContent(const std::string &content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(content.data()),
         content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string RedactText(const std::string &text) {
  if (g_debug_text.load()) {
    return "text=" + text;
  }
  return "text_sha256=" + HashContent(text);
}

} // namespace log
} // namespace zoneguard
