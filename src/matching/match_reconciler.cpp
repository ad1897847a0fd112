#include "match_reconciler.hpp"
#include "core/logger.hpp"
#include "utils/unicode.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace wordguard {

namespace {

std::u32string word_key(const std::string &word) {
  return Utils::to_lower(Utils::to_utf32(word));
}

} // namespace

MatchReconciler::MatchReconciler(const Whitelist &whitelist,
                                 const ContextFilter &context_filter)
    : whitelist_(whitelist), context_filter_(context_filter) {}

std::vector<Match> MatchReconciler::reconcile(std::u32string_view original,
                                              MatchSets sets,
                                              bool context_aware) const {
  std::vector<Match> merged = std::move(sets.automaton);
  size_t from_automaton = merged.size();
  merge_new_words(merged, std::move(sets.fuzzy));
  size_t from_fuzzy = merged.size() - from_automaton;
  merge_new_words(merged, std::move(sets.strict_automaton));
  size_t from_strict = merged.size() - from_automaton - from_fuzzy;

  std::vector<Match> kept;
  kept.reserve(merged.size());
  for (auto &match : merged) {
    if (should_keep(original, match, context_aware))
      kept.push_back(std::move(match));
  }
  sort_by_position(kept);

  LOG(LogLevel::DEBUG, LogComponent::RECONCILER,
      "Reconciled " << from_automaton << " automaton, " << from_fuzzy
                    << " fuzzy and " << from_strict << " strict matches into "
                    << kept.size());
  return kept;
}

void MatchReconciler::merge_new_words(std::vector<Match> &into,
                                      std::vector<Match> extra) {
  std::unordered_set<std::u32string> seen;
  for (const auto &match : into)
    seen.insert(word_key(match.word));

  for (auto &match : extra) {
    if (seen.insert(word_key(match.word)).second)
      into.push_back(std::move(match));
  }
}

bool MatchReconciler::should_keep(std::u32string_view original,
                                  const Match &match,
                                  bool context_aware) const {
  if (whitelist_.is_whitelisted(match.word)) {
    LOG(LogLevel::TRACE, LogComponent::RECONCILER,
        "Dropping whitelisted match '" << match.word << "'");
    return false;
  }
  if (context_aware && context_filter_.is_only_in_safe_context(
                           original, Utils::to_utf32(match.word))) {
    LOG(LogLevel::TRACE, LogComponent::RECONCILER,
        "Dropping '" << match.word << "' found only inside safe words");
    return false;
  }
  return true;
}

void MatchReconciler::sort_by_position(std::vector<Match> &matches) {
  std::stable_sort(matches.begin(), matches.end(),
                   [](const Match &a, const Match &b) {
                     if (a.position != b.position)
                       return a.position < b.position;
                     return a.length > b.length;
                   });
}

std::u32string
MatchReconciler::apply_replacement(std::u32string_view original,
                                   const std::vector<Match> &matches,
                                   std::u32string_view replacement) {
  // Overlapping spans are simply masked twice
  std::vector<bool> masked(original.size(), false);
  for (const auto &match : matches) {
    size_t end = std::min(match.position + match.length, original.size());
    for (size_t i = match.position; i < end; ++i)
      masked[i] = true;
  }

  std::u32string cleaned;
  cleaned.reserve(original.size());
  for (size_t i = 0; i < original.size(); ++i) {
    if (masked[i])
      cleaned.append(replacement);
    else
      cleaned.push_back(original[i]);
  }
  return cleaned;
}

} // namespace wordguard
