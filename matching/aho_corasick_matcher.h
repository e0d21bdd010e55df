#pragma once

#include "matching/literal_matcher.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace zoneguard {

// AhoCorasickMatcher finds every occurrence of every keyword in a single
// left-to-right pass. Total cost is O(text + total keyword length + hits),
// independent of the number of keywords loaded.
//
// Construction builds a trie over the keywords, then computes failure links
// breadth-first so that a mismatch resumes from the longest proper suffix
// already scanned. Each state also carries an output link to the nearest
// suffix state that completes a keyword, so keywords that end as suffixes of
// longer trie paths are still reported.
class AhoCorasickMatcher : public LiteralMatcher {
public:
  // max_states bounds the trie size (0 = unbounded). Throws std::length_error
  // when the keyword set needs more states than allowed.
  explicit AhoCorasickMatcher(const std::vector<std::string> &keywords,
                              std::size_t max_states = 0);

  std::vector<LiteralHit> Scan(const std::string &folded_text) const override;
  std::size_t PatternCount() const override { return pattern_count_; }
  std::string Name() const override { return "aho_corasick"; }

  std::size_t StateCount() const { return nodes_.size(); }

private:
  struct Node {
    std::unordered_map<unsigned char, int> children;
    int fail{0};
    // Nearest proper-suffix state with a non-empty output set, or -1.
    int output_link{-1};
    std::vector<std::size_t> outputs;
  };

  void Insert(const std::string &keyword, std::size_t id,
              std::size_t max_states);
  void BuildFailureLinks();
  int Step(int state, unsigned char c) const;

  std::vector<Node> nodes_;
  std::size_t pattern_count_{0};
};

} // namespace zoneguard
