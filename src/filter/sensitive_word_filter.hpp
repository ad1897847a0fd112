#ifndef SENSITIVE_WORD_FILTER_HPP
#define SENSITIVE_WORD_FILTER_HPP

#include "core/config.hpp"
#include "core/types.hpp"
#include "matching/context_filter.hpp"
#include "matching/fuzzy_matcher.hpp"
#include "matching/pattern_automaton.hpp"
#include "matching/whitelist.hpp"
#include "text/normalizer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

// Sensitive word detection over a base word list plus custom words.
//
// Detection methods are const and may run concurrently as long as nothing
// mutates the filter. Every change to the word set or the configuration
// rebuilds the automata.
class SensitiveWordFilter {
public:
  // Throws InvalidConfigError or InvalidPatternError
  explicit SensitiveWordFilter(Config::FilterConfig config = {},
                               std::vector<Pattern> base_words = {},
                               std::vector<WhitelistEntry> whitelist = {});

  // --- Custom words ---
  // Custom words are active regardless of the severity, language and
  // category filters. A word that is already present is replaced.
  void add_word(const Pattern &pattern);
  // All or nothing
  void add_words(const std::vector<Pattern> &patterns);
  // Case-insensitive; returns false when the word was not a custom word
  bool remove_word(std::string_view word);
  void clear_custom_words();
  const std::vector<Pattern> &custom_words() const { return custom_words_; }
  const std::vector<Pattern> &base_words() const { return base_words_; }

  // --- Configuration ---
  void set_config(const Config::FilterConfig &config);
  const Config::FilterConfig &config() const { return config_; }

  // --- Whitelist ---
  void add_to_whitelist(const std::string &word);
  void add_to_whitelist(const WhitelistEntry &entry);
  void add_many_to_whitelist(const std::vector<WhitelistEntry> &entries);
  bool remove_from_whitelist(std::string_view word);
  void clear_whitelist() { whitelist_.clear(); }
  const std::vector<WhitelistEntry> &whitelist() const {
    return whitelist_.entries();
  }
  bool is_whitelisted(std::string_view word) const {
    return whitelist_.is_whitelisted(word);
  }
  // Merging keeps existing entries for words that are already present
  void import_whitelist(const std::vector<WhitelistEntry> &entries,
                        bool replace = false);
  std::vector<WhitelistEntry> export_whitelist() const {
    return whitelist_.entries();
  }

  // --- Detection ---
  DetectionResult detect(const std::string &text) const;
  bool has_match(const std::string &text) const;
  // Replaces every match regardless of replace_matches
  std::string clean(const std::string &text) const;

  BatchDetectionResult detect_batch(const std::vector<std::string> &texts) const;
  bool has_match_in_any(const std::vector<std::string> &texts) const;
  std::vector<std::string>
  clean_batch(const std::vector<std::string> &texts) const;

  FilterStats stats() const;

  // --- Import / export ---
  WordListExport export_custom_words() const;
  // Validates the whole list first. Merging skips words already present.
  void import_words(const WordListExport &list, bool replace = false);
  std::string export_to_json() const;
  void import_from_json(const std::string &json_text, bool replace = false);

  // Throws InvalidPatternError
  static void validate_pattern(const Pattern &pattern);

private:
  DetectionResult detect_impl(const std::string &text,
                              bool force_replacement) const;
  NormalizerOptions automaton_options() const;
  FuzzyMatchOptions fuzzy_options() const;
  bool is_active(const Pattern &pattern) const;
  void rebuild();

  std::vector<Match> search_automaton(const PatternAutomaton &automaton,
                                      const NormalizedText &normalized,
                                      std::u32string_view original,
                                      bool partial_match,
                                      SearchedText searched,
                                      MatchSource source) const;

  Config::FilterConfig config_;
  std::vector<Pattern> base_words_;
  std::vector<Pattern> custom_words_;
  std::vector<Pattern> active_patterns_;

  Normalizer normalizer_;
  Whitelist whitelist_;
  ContextFilter context_filter_;

  std::unique_ptr<const PatternAutomaton> automaton_;
  // Only built at PARANOID strictness
  std::unique_ptr<const PatternAutomaton> strict_automaton_;
};

} // namespace wordguard

#endif // SENSITIVE_WORD_FILTER_HPP
