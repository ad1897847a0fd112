#include "fuzzy_matcher.hpp"
#include "core/logger.hpp"
#include "text/evasion_detector.hpp"
#include "utils/unicode.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace wordguard {

namespace {

constexpr double kEvasionEqualConfidence = 0.95;
constexpr double kHighMinConfidence = 0.7;
constexpr double kStrictEqualConfidence = 0.99;
constexpr double kStrictContainsConfidence = 0.95;
constexpr double kParanoidMinConfidence = 0.5;
constexpr double kWholeTextConfidence = 0.9;

struct Token {
  size_t begin;
  size_t end;
};

std::vector<Token> split_tokens(std::u32string_view text) {
  std::vector<Token> tokens;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && Utils::is_whitespace(text[i]))
      ++i;
    size_t start = i;
    while (i < text.size() && !Utils::is_whitespace(text[i]))
      ++i;
    if (i > start)
      tokens.push_back({start, i});
  }
  return tokens;
}

size_t length_gap(size_t a, size_t b) { return a > b ? a - b : b - a; }

double similarity(size_t distance, size_t a_len, size_t b_len) {
  size_t longest = std::max(a_len, b_len);
  if (longest == 0)
    return 1.0;
  return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

} // namespace

FuzzyMatcher::FuzzyMatcher(const Normalizer &normalizer,
                           FuzzyMatchOptions options)
    : normalizer_(normalizer), options_(options) {}

NormalizerOptions FuzzyMatcher::evasion_options() const {
  return NormalizerOptions::evasion(
      options_.detect_symbol_replacement, options_.detect_space_insertion,
      options_.detect_repeated_letters, options_.detect_language_mixing);
}

NormalizedText
FuzzyMatcher::normalize_for_level(std::u32string_view text) const {
  switch (options_.strictness) {
  case DetectionStrictness::LOW:
    return normalizer_.normalize(text, NormalizerOptions::lowercase_only());
  case DetectionStrictness::PARANOID:
    return normalizer_.normalize_strict(text);
  default:
    return normalizer_.normalize(text, evasion_options());
  }
}

FuzzyMatcher::PreparedText
FuzzyMatcher::prepare_text(std::u32string_view text) const {
  PreparedText prepared;
  for (const Token &token : split_tokens(text)) {
    prepared.tokens.push_back(
        {token.begin, token.end,
         normalize_for_level(text.substr(token.begin, token.end - token.begin))});
  }
  if (options_.strictness != DetectionStrictness::LOW)
    prepared.evasion = normalizer_.normalize(text, evasion_options());
  if (options_.strictness == DetectionStrictness::PARANOID)
    prepared.strict = normalizer_.normalize_strict(text);
  return prepared;
}

FuzzyMatcher::PreparedWord
FuzzyMatcher::prepare_word(std::u32string_view pattern) const {
  PreparedWord word;
  word.primary = normalize_for_level(pattern).text;
  switch (options_.strictness) {
  case DetectionStrictness::LOW:
    break;
  case DetectionStrictness::PARANOID:
    word.evasion = normalizer_.normalize(pattern, evasion_options()).text;
    break;
  default:
    word.evasion = word.primary;
    break;
  }
  return word;
}

FuzzyMatchResult FuzzyMatcher::fuzzy_match(std::u32string_view text,
                                           std::u32string_view pattern) const {
  NormalizedText normalized = normalize_for_level(text);
  FuzzyMatchResult result =
      compare(text, normalized, normalize_for_level(pattern).text);
  if (!result.matched)
    result.normalized_text = std::move(normalized.text);
  return result;
}

FuzzyMatchResult FuzzyMatcher::fuzzy_match(std::string_view text,
                                           std::string_view pattern) const {
  return fuzzy_match(std::u32string_view(Utils::to_utf32(text)),
                     std::u32string_view(Utils::to_utf32(pattern)));
}

FuzzyMatchResult FuzzyMatcher::compare(std::u32string_view text,
                                       const NormalizedText &normalized,
                                       std::u32string_view word) const {
  if (options_.strictness == DetectionStrictness::PARANOID)
    return compare_strict(text, normalized, word);
  if (options_.strictness != DetectionStrictness::LOW)
    return compare_evasion(text, normalized, word);

  FuzzyMatchResult result;
  if (word.empty() || normalized.text != word)
    return result;
  result.confidence = 1.0;
  result.span = {0, text.size()};
  result.searched_length = text.size();
  return matched_at(text, normalized, std::move(result));
}

FuzzyMatchResult
FuzzyMatcher::compare_evasion(std::u32string_view text,
                              const NormalizedText &normalized,
                              std::u32string_view word) const {
  const std::u32string &candidate = normalized.text;
  FuzzyMatchResult result;
  result.searched_text = SearchedText::EVASION_NORMALIZED;
  if (word.empty() || candidate.empty())
    return result;

  if (candidate == word) {
    result.confidence = kEvasionEqualConfidence;
  } else if (options_.strictness == DetectionStrictness::HIGH) {
    if (length_gap(candidate.size(), word.size()) >
        options_.max_edit_distance)
      return result;
    size_t distance = levenshtein_distance(candidate, word);
    if (distance > options_.max_edit_distance)
      return result;
    double confidence = similarity(distance, candidate.size(), word.size());
    if (confidence < kHighMinConfidence)
      return result;
    result.confidence = confidence;
  } else {
    return result;
  }

  result.span = normalized.source_span(0, candidate.size());
  result.searched_length = candidate.size();
  return matched_at(text, normalized, std::move(result));
}

FuzzyMatchResult
FuzzyMatcher::compare_strict(std::u32string_view text,
                             const NormalizedText &normalized,
                             std::u32string_view word) const {
  const std::u32string &candidate = normalized.text;
  FuzzyMatchResult result;
  result.searched_text = SearchedText::STRICT_NORMALIZED;
  if (word.empty() || candidate.empty())
    return result;

  if (candidate == word) {
    result.confidence = kStrictEqualConfidence;
  } else if (size_t found = candidate.find(word);
             found != std::u32string::npos) {
    result.confidence = kStrictContainsConfidence;
    result.span = normalized.source_span(found, word.size());
    result.searched_position = found;
    result.searched_length = word.size();
    return matched_at(text, normalized, std::move(result));
  } else {
    size_t allowed = std::max(
        options_.max_edit_distance,
        static_cast<size_t>(std::ceil(static_cast<double>(word.size()) * 0.4)));
    if (length_gap(candidate.size(), word.size()) > allowed)
      return result;
    size_t distance = levenshtein_distance(candidate, word);
    if (distance > allowed)
      return result;
    double confidence = similarity(distance, candidate.size(), word.size());
    if (confidence < kParanoidMinConfidence)
      return result;
    result.confidence = confidence;
  }

  result.span = normalized.source_span(0, candidate.size());
  result.searched_length = candidate.size();
  return matched_at(text, normalized, std::move(result));
}

FuzzyMatchResult FuzzyMatcher::matched_at(std::u32string_view text,
                                          const NormalizedText &normalized,
                                          FuzzyMatchResult result) const {
  result.matched = true;
  result.normalized_text = normalized.text;
  result.evasion_techniques = detect_evasion_techniques(
      text.substr(result.span.begin, result.span.length()),
      normalizer_.tables());
  return result;
}

// Token by token first, then the whole text. Unmatched results carry no
// normalized text.
FuzzyMatchResult FuzzyMatcher::search(std::u32string_view text,
                                      const PreparedText &prepared,
                                      const PreparedWord &word) const {
  for (const TokenForm &token : prepared.tokens) {
    FuzzyMatchResult result =
        compare(text.substr(token.begin, token.end - token.begin),
                token.normalized, word.primary);
    if (!result.matched)
      continue;
    result.span.begin += token.begin;
    result.span.end += token.begin;
    result.searched_text = SearchedText::ORIGINAL;
    result.searched_position = result.span.begin;
    result.searched_length = result.span.length();
    return result;
  }

  if (options_.strictness == DetectionStrictness::LOW)
    return {};

  if (!word.evasion.empty()) {
    size_t found = prepared.evasion.text.find(word.evasion);
    if (found != std::u32string::npos) {
      FuzzyMatchResult result;
      result.confidence = kWholeTextConfidence;
      result.span = prepared.evasion.source_span(found, word.evasion.size());
      result.searched_text = SearchedText::EVASION_NORMALIZED;
      result.searched_position = found;
      result.searched_length = word.evasion.size();
      return matched_at(text, prepared.evasion, std::move(result));
    }
  }

  if (options_.strictness == DetectionStrictness::PARANOID)
    return compare(text, prepared.strict, word.primary);
  return {};
}

FuzzyMatchResult
FuzzyMatcher::contains_word(std::u32string_view text,
                            std::u32string_view pattern) const {
  FuzzyMatchResult result =
      search(text, prepare_text(text), prepare_word(pattern));
  if (!result.matched)
    result.normalized_text = std::u32string(text);
  return result;
}

FuzzyMatchResult FuzzyMatcher::contains_word(std::string_view text,
                                             std::string_view pattern) const {
  return contains_word(std::u32string_view(Utils::to_utf32(text)),
                       std::u32string_view(Utils::to_utf32(pattern)));
}

std::vector<Match>
FuzzyMatcher::find_all(std::u32string_view text,
                       const std::vector<Pattern> &patterns) const {
  std::vector<Match> matches;
  if (text.empty())
    return matches;
  PreparedText prepared = prepare_text(text);
  for (const auto &pattern : patterns) {
    std::u32string word = Utils::to_utf32(pattern.word);
    if (word.empty())
      continue;
    FuzzyMatchResult result = search(text, prepared, prepare_word(word));
    if (!result.matched || result.span.length() == 0)
      continue;

    Match match;
    match.word = pattern.word;
    match.severity = pattern.severity;
    match.category = pattern.category;
    match.position = result.span.begin;
    match.length = result.span.length();
    match.source = MatchSource::FUZZY;
    match.searched_text = result.searched_text;
    match.searched_position = result.searched_position;
    match.searched_length = result.searched_length;
    match.confidence = result.confidence;
    match.evasion_techniques = std::move(result.evasion_techniques);
    matches.push_back(std::move(match));
  }

  LOG(LogLevel::DEBUG, LogComponent::FUZZY,
      "Fuzzy pass at " << strictness_to_string(options_.strictness)
                       << " matched " << matches.size() << " of "
                       << patterns.size() << " patterns");
  return matches;
}

size_t FuzzyMatcher::levenshtein_distance(std::u32string_view a,
                                          std::u32string_view b) {
  std::vector<std::vector<size_t>> matrix(a.size() + 1,
                                          std::vector<size_t>(b.size() + 1));
  for (size_t i = 0; i <= a.size(); ++i)
    matrix[i][0] = i;
  for (size_t j = 0; j <= b.size(); ++j)
    matrix[0][j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    for (size_t j = 1; j <= b.size(); ++j) {
      size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      matrix[i][j] = std::min({matrix[i - 1][j] + 1,          // deletion
                               matrix[i][j - 1] + 1,          // insertion
                               matrix[i - 1][j - 1] + cost}); // substitution
    }
  }
  return matrix[a.size()][b.size()];
}

} // namespace wordguard
