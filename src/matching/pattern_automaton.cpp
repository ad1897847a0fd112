#include "pattern_automaton.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/unicode.hpp"

#include <cstddef>
#include <queue>

namespace wordguard {

PatternAutomaton::PatternAutomaton() {
  trie_.emplace_back(); // Root node
}

void PatternAutomaton::insert(std::u32string_view normalized_word,
                              const Pattern &pattern) {
  if (normalized_word.empty())
    throw InvalidPatternError("Pattern '" + pattern.word +
                              "' is empty after normalization");

  int32_t node = 0;
  for (char32_t ch : normalized_word) {
    auto it = trie_[node].children.find(ch);
    if (it == trie_[node].children.end()) {
      int32_t child = static_cast<int32_t>(trie_.size());
      size_t depth = trie_[node].depth + 1;
      trie_[node].children[ch] = child;
      trie_.emplace_back();
      trie_.back().depth = depth;
      node = child;
    } else {
      node = it->second;
    }
  }

  if (trie_[node].pattern_index < 0)
    ++terminal_count_;
  trie_[node].pattern_index = static_cast<int32_t>(patterns_.size());
  patterns_.push_back(pattern);
  built_ = false;
}

void PatternAutomaton::build_failure_links() {
  std::queue<int32_t> q;
  trie_[0].failure_link = 0;
  trie_[0].output_link = -1;
  for (auto const &[key, child] : trie_[0].children) {
    trie_[child].failure_link = 0;
    trie_[child].output_link = -1;
    q.push(child);
  }

  while (!q.empty()) {
    int32_t u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      int32_t j = trie_[u].failure_link;
      while (j > 0 && trie_[j].children.find(ch) == trie_[j].children.end())
        j = trie_[j].failure_link;

      auto it = trie_[j].children.find(ch);
      trie_[v].failure_link =
          (it != trie_[j].children.end() && it->second != v) ? it->second : 0;

      int32_t suffix_node = trie_[v].failure_link;
      trie_[v].output_link = trie_[suffix_node].pattern_index >= 0
                                 ? suffix_node
                                 : trie_[suffix_node].output_link;
      q.push(v);
    }
  }

  built_ = true;
  LOG(LogLevel::DEBUG, LogComponent::AUTOMATON,
      "Built failure links for " << terminal_count_ << " patterns over "
                                 << trie_.size() << " nodes");
}

std::vector<Match> PatternAutomaton::search(std::u32string_view text,
                                            bool partial_match) const {
  if (!built_)
    throw AutomatonStateError(
        "search called before build_failure_links() or after an insert");

  std::vector<Match> found;
  int32_t current_node = 0;

  for (size_t i = 0; i < text.size(); ++i) {
    char32_t ch = text[i];
    while (current_node > 0 && trie_[current_node].children.find(ch) ==
                                   trie_[current_node].children.end()) {
      current_node = trie_[current_node].failure_link;
    }
    auto it = trie_[current_node].children.find(ch);
    if (it != trie_[current_node].children.end())
      current_node = it->second;

    int32_t temp_node = trie_[current_node].pattern_index >= 0
                            ? current_node
                            : trie_[current_node].output_link;
    while (temp_node > 0) {
      const TrieNode &terminal = trie_[temp_node];
      size_t length = terminal.depth;
      size_t position = i + 1 - length;

      if (partial_match || is_at_word_boundary(text, position, i + 1)) {
        const Pattern &pattern = patterns_[terminal.pattern_index];
        Match match;
        match.word = pattern.word;
        match.severity = pattern.severity;
        match.category = pattern.category;
        match.position = position;
        match.length = length;
        match.source = MatchSource::AUTOMATON;
        match.searched_position = position;
        match.searched_length = length;
        found.push_back(std::move(match));
      }
      temp_node = terminal.output_link;
    }
  }

  LOG(LogLevel::TRACE, LogComponent::AUTOMATON,
      "Search over " << text.size() << " code points found " << found.size()
                     << " matches");
  return found;
}

bool PatternAutomaton::is_at_word_boundary(std::u32string_view text,
                                           size_t start, size_t end) {
  bool before_ok = start == 0 || !Utils::is_word_char(text[start - 1]);
  bool after_ok = end >= text.size() || !Utils::is_word_char(text[end]);
  return before_ok && after_ok;
}

} // namespace wordguard
