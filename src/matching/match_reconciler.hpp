#ifndef MATCH_RECONCILER_HPP
#define MATCH_RECONCILER_HPP

#include "context_filter.hpp"
#include "core/types.hpp"
#include "whitelist.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

// Match sets from each detection path, offsets already mapped onto the
// original text
struct MatchSets {
  std::vector<Match> automaton;
  std::vector<Match> fuzzy;
  std::vector<Match> strict_automaton;
};

class MatchReconciler {
public:
  MatchReconciler(const Whitelist &whitelist,
                  const ContextFilter &context_filter);

  // Automaton matches first; fuzzy and strict matches only contribute words
  // not yet present. The result is whitelist/context filtered and ordered by
  // position.
  std::vector<Match> reconcile(std::u32string_view original, MatchSets sets,
                               bool context_aware) const;

  // Appends the matches of `extra` whose word (case-insensitive) is not
  // already in `into`
  static void merge_new_words(std::vector<Match> &into,
                              std::vector<Match> extra);

  bool should_keep(std::u32string_view original, const Match &match,
                   bool context_aware) const;

  // Ascending position; longer match first on ties
  static void sort_by_position(std::vector<Match> &matches);

  // Every code point covered by a match becomes `replacement`
  static std::u32string apply_replacement(std::u32string_view original,
                                          const std::vector<Match> &matches,
                                          std::u32string_view replacement);

private:
  const Whitelist &whitelist_;
  const ContextFilter &context_filter_;
};

} // namespace wordguard

#endif // MATCH_RECONCILER_HPP
