#include "matching/text_normalize.h"

#include <algorithm>
#include <cctype>

namespace zoneguard {

std::string FoldCase(const std::string &text) {
  std::string folded = text;
  std::transform(folded.begin(), folded.end(), folded.begin(),
                 [](unsigned char c) {
                   return c < 0x80 ? static_cast<char>(std::tolower(c))
                                   : static_cast<char>(c);
                 });
  return folded;
}

bool IsBlank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return c < 0x80 && std::isspace(c);
  });
}

} // namespace zoneguard
