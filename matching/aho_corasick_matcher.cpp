#include "matching/aho_corasick_matcher.h"

#include <algorithm>
#include <cstddef>
#include <queue>
#include <stdexcept>

namespace zoneguard {

AhoCorasickMatcher::AhoCorasickMatcher(const std::vector<std::string> &keywords,
                                       std::size_t max_states)
    : pattern_count_(keywords.size()) {
  nodes_.emplace_back(); // root
  for (std::size_t id = 0; id < keywords.size(); ++id) {
    if (keywords[id].empty()) {
      continue;
    }
    Insert(keywords[id], id, max_states);
  }
  BuildFailureLinks();
}

void AhoCorasickMatcher::Insert(const std::string &keyword, std::size_t id,
                                std::size_t max_states) {
  int state = 0;
  for (char ch : keyword) {
    auto c = static_cast<unsigned char>(ch);
    auto it = nodes_[state].children.find(c);
    if (it != nodes_[state].children.end()) {
      state = it->second;
      continue;
    }
    if (max_states > 0 && nodes_.size() >= max_states) {
      throw std::length_error("automaton state budget exceeded (" +
                              std::to_string(max_states) + " states)");
    }
    int next = static_cast<int>(nodes_.size());
    // emplace_back may reallocate; link the child only afterwards.
    nodes_.emplace_back();
    nodes_[state].children.emplace(c, next);
    state = next;
  }
  nodes_[state].outputs.push_back(id);
}

void AhoCorasickMatcher::BuildFailureLinks() {
  std::queue<int> q;
  for (const auto &entry : nodes_[0].children) {
    int child = entry.second;
    nodes_[child].fail = 0;
    nodes_[child].output_link = -1;
    q.push(child);
  }

  while (!q.empty()) {
    int v = q.front();
    q.pop();
    for (const auto &[c, u] : nodes_[v].children) {
      int f = nodes_[v].fail;
      while (f != 0 && nodes_[f].children.count(c) == 0) {
        f = nodes_[f].fail;
      }
      auto it = nodes_[f].children.find(c);
      int fail = (it != nodes_[f].children.end()) ? it->second : 0;
      nodes_[u].fail = fail;
      nodes_[u].output_link =
          nodes_[fail].outputs.empty() ? nodes_[fail].output_link : fail;
      q.push(u);
    }
  }
}

int AhoCorasickMatcher::Step(int state, unsigned char c) const {
  while (true) {
    auto it = nodes_[state].children.find(c);
    if (it != nodes_[state].children.end()) {
      return it->second;
    }
    if (state == 0) {
      return 0;
    }
    state = nodes_[state].fail;
  }
}

std::vector<LiteralHit>
AhoCorasickMatcher::Scan(const std::string &folded_text) const {
  std::vector<LiteralHit> hits;
  int state = 0;
  for (std::size_t pos = 0; pos < folded_text.size(); ++pos) {
    state = Step(state, static_cast<unsigned char>(folded_text[pos]));
    int s = nodes_[state].outputs.empty() ? nodes_[state].output_link : state;
    const std::size_t first = hits.size();
    while (s > 0) {
      for (std::size_t id : nodes_[s].outputs) {
        hits.push_back({id, pos + 1});
      }
      s = nodes_[s].output_link;
    }
    // Output links walk from longest to shortest keyword; the contract orders
    // hits sharing an end offset by keyword id.
    if (hits.size() - first > 1) {
      std::sort(hits.begin() + static_cast<std::ptrdiff_t>(first), hits.end(),
                [](const LiteralHit &a, const LiteralHit &b) {
                  return a.pattern_id < b.pattern_id;
                });
    }
  }
  return hits;
}

} // namespace zoneguard
