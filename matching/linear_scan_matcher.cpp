#include "matching/linear_scan_matcher.h"

#include <algorithm>
#include <utility>

namespace zoneguard {

LinearScanMatcher::LinearScanMatcher(std::vector<std::string> keywords)
    : keywords_(std::move(keywords)) {}

std::vector<LiteralHit>
LinearScanMatcher::Scan(const std::string &folded_text) const {
  std::vector<LiteralHit> hits;
  for (std::size_t id = 0; id < keywords_.size(); ++id) {
    const auto &keyword = keywords_[id];
    if (keyword.empty()) {
      continue;
    }
    auto pos = folded_text.find(keyword);
    while (pos != std::string::npos) {
      hits.push_back({id, pos + keyword.size()});
      pos = folded_text.find(keyword, pos + 1);
    }
  }
  std::sort(hits.begin(), hits.end(),
            [](const LiteralHit &a, const LiteralHit &b) {
              if (a.end != b.end) {
                return a.end < b.end;
              }
              return a.pattern_id < b.pattern_id;
            });
  return hits;
}

} // namespace zoneguard
