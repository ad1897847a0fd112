#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

enum class SeverityLevel { MILD = 1, MODERATE = 2, SEVERE = 3, EXTREME = 4 };

// Detection strictness, shared by the fuzzy matcher and the filter
enum class DetectionStrictness {
  LOW = 1,     // Exact matches only
  MEDIUM = 2,  // Evasion-normalized equality
  HIGH = 3,    // Adds bounded edit distance
  PARANOID = 4 // Maximum recall, may produce false positives
};

enum class Language { UNSPECIFIED, ENGLISH, ARABIC };

enum class EvasionTechnique {
  SYMBOL_REPLACEMENT,
  SPACE_INSERTION,
  REPEATED_LETTERS,
  NUMERAL_SUBSTITUTION,
  LANGUAGE_MIXING,
  CHARACTER_SUBSTITUTION
};

// Which path produced a match
enum class MatchSource { AUTOMATON, FUZZY, STRICT_AUTOMATON };

// Which text the searched offsets of a match refer to
enum class SearchedText {
  ORIGINAL,
  NORMALIZED,
  STRICT_NORMALIZED,
  EVASION_NORMALIZED
};

struct Pattern {
  std::string word;
  SeverityLevel severity = SeverityLevel::MODERATE;
  std::string category;
  Language language = Language::UNSPECIFIED;
};

struct Match {
  std::string word; // Pattern text as supplied, before normalization
  SeverityLevel severity = SeverityLevel::MODERATE;
  std::string category;

  // Offsets into the original text, in code points
  size_t position = 0;
  size_t length = 0;

  MatchSource source = MatchSource::AUTOMATON;
  SearchedText searched_text = SearchedText::ORIGINAL;
  size_t searched_position = 0;
  size_t searched_length = 0;

  std::optional<double> confidence;
  std::vector<EvasionTechnique> evasion_techniques;
};

struct WhitelistEntry {
  std::string word;
  bool case_sensitive = false;
  bool whole_word = true;
};

struct DetectionResult {
  bool has_match = false;
  std::vector<Match> matches;
  std::string original_text;
  std::optional<std::string> cleaned_text;
};

struct BatchDetectionResult {
  std::vector<DetectionResult> results;
  size_t total_matches = 0;
  double processing_time_ms = 0.0;
};

// Portable form of a custom word list
struct WordListExport {
  std::string version = "1.0.0";
  std::string exported_at; // ISO-8601 UTC
  std::vector<Pattern> words;
};

struct FilterStats {
  size_t total_words = 0;
  size_t custom_words = 0;
  size_t base_words = 0;
  size_t whitelist_count = 0;
  std::map<Language, size_t> by_language;
  std::map<SeverityLevel, size_t> by_severity;
  std::map<std::string, size_t> by_category;
};

std::string severity_to_string(SeverityLevel severity);
std::string strictness_to_string(DetectionStrictness strictness);
std::string language_to_string(Language language);
std::string evasion_technique_to_string(EvasionTechnique technique);
std::string match_source_to_string(MatchSource source);
std::string searched_text_to_string(SearchedText searched);

// Accepts "", "en" and "ar" (case-insensitive); std::nullopt otherwise
std::optional<Language> parse_language(std::string_view tag);

} // namespace wordguard

#endif // TYPES_HPP
