#ifndef FUZZY_MATCHER_HPP
#define FUZZY_MATCHER_HPP

#include "core/types.hpp"
#include "text/normalizer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

struct FuzzyMatchOptions {
  DetectionStrictness strictness = DetectionStrictness::MEDIUM;
  size_t max_edit_distance = 2;
  bool detect_symbol_replacement = true;
  bool detect_space_insertion = true;
  bool detect_repeated_letters = true;
  bool detect_language_mixing = true;
};

struct FuzzyMatchResult {
  bool matched = false;
  double confidence = 0.0;
  std::u32string normalized_text;
  std::vector<EvasionTechnique> evasion_techniques;

  // Evidence, as a span of the text that was passed in
  SourceSpan span;
  SearchedText searched_text = SearchedText::ORIGINAL;
  size_t searched_position = 0;
  size_t searched_length = 0;
};

// Near-miss matcher for obfuscated words. Its behavior is selected by the
// strictness level:
//  - LOW: case-insensitive equality
//  - MEDIUM: equality after evasion normalization
//  - HIGH: as MEDIUM, plus bounded edit distance
//  - PARANOID: strict normalization, containment and a looser distance bound
class FuzzyMatcher {
public:
  explicit FuzzyMatcher(const Normalizer &normalizer,
                        FuzzyMatchOptions options = {});
  FuzzyMatcher(Normalizer &&, FuzzyMatchOptions = {}) = delete;

  FuzzyMatchResult fuzzy_match(std::u32string_view text,
                               std::u32string_view pattern) const;
  FuzzyMatchResult fuzzy_match(std::string_view text,
                               std::string_view pattern) const;

  // Token by token first, then the whole text
  FuzzyMatchResult contains_word(std::u32string_view text,
                                 std::u32string_view pattern) const;
  FuzzyMatchResult contains_word(std::string_view text,
                                 std::string_view pattern) const;

  // At most one match per pattern. Offsets refer to `text`.
  std::vector<Match> find_all(std::u32string_view text,
                              const std::vector<Pattern> &patterns) const;

  const FuzzyMatchOptions &options() const { return options_; }
  void set_options(const FuzzyMatchOptions &options) { options_ = options; }

  static size_t levenshtein_distance(std::u32string_view a,
                                     std::u32string_view b);

private:
  struct TokenForm {
    size_t begin;
    size_t end;
    NormalizedText normalized;
  };

  // A text normalized once for every comparison `find_all` runs against it
  struct PreparedText {
    std::vector<TokenForm> tokens;
    NormalizedText evasion; // whole text, unused at LOW
    NormalizedText strict;  // whole text, PARANOID only
  };

  struct PreparedWord {
    std::u32string primary; // normalized for the strictness level
    std::u32string evasion;
  };

  NormalizerOptions evasion_options() const;
  NormalizedText normalize_for_level(std::u32string_view text) const;
  PreparedText prepare_text(std::u32string_view text) const;
  PreparedWord prepare_word(std::u32string_view pattern) const;

  FuzzyMatchResult compare(std::u32string_view text,
                           const NormalizedText &normalized,
                           std::u32string_view word) const;
  FuzzyMatchResult compare_evasion(std::u32string_view text,
                                   const NormalizedText &normalized,
                                   std::u32string_view word) const;
  FuzzyMatchResult compare_strict(std::u32string_view text,
                                  const NormalizedText &normalized,
                                  std::u32string_view word) const;
  FuzzyMatchResult search(std::u32string_view text,
                          const PreparedText &prepared,
                          const PreparedWord &word) const;
  FuzzyMatchResult matched_at(std::u32string_view text,
                              const NormalizedText &normalized,
                              FuzzyMatchResult result) const;

  const Normalizer &normalizer_;
  FuzzyMatchOptions options_;
};

} // namespace wordguard

#endif // FUZZY_MATCHER_HPP
