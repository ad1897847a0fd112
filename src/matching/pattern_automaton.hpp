#ifndef PATTERN_AUTOMATON_HPP
#define PATTERN_AUTOMATON_HPP

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wordguard {

// Aho-Corasick automaton over code points. Patterns are inserted in their
// normalized form; matches report the pattern as it was supplied.
class PatternAutomaton {
public:
  PatternAutomaton();

  // Inserting the same normalized word twice keeps the later pattern.
  // Marks the failure links stale.
  void insert(std::u32string_view normalized_word, const Pattern &pattern);

  // Recomputed from scratch on every call
  void build_failure_links();

  // Throws AutomatonStateError unless build_failure_links() ran after the
  // last insert. Offsets are into `text`; position and searched_position are
  // equal, searched_text is left to the caller.
  std::vector<Match> search(std::u32string_view text, bool partial_match) const;

  bool is_built() const { return built_; }
  size_t pattern_count() const { return terminal_count_; }
  size_t node_count() const { return trie_.size(); }

private:
  struct TrieNode {
    std::unordered_map<char32_t, int32_t> children;
    int32_t pattern_index = -1;
    int32_t failure_link = 0; // Default to root
    int32_t output_link = -1; // Nearest terminal on the failure chain
    size_t depth = 0;
  };

  static bool is_at_word_boundary(std::u32string_view text, size_t start,
                                  size_t end);

  std::vector<TrieNode> trie_;
  std::vector<Pattern> patterns_;
  size_t terminal_count_ = 0;
  bool built_ = false;
};

} // namespace wordguard

#endif // PATTERN_AUTOMATON_HPP
