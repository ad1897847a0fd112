#include "types.hpp"
#include "utils/utils.hpp"

#include <string>

namespace wordguard {

std::string severity_to_string(SeverityLevel severity) {
  switch (severity) {
  case SeverityLevel::MILD:
    return "MILD";
  case SeverityLevel::MODERATE:
    return "MODERATE";
  case SeverityLevel::SEVERE:
    return "SEVERE";
  case SeverityLevel::EXTREME:
    return "EXTREME";
  }
  return "UNKNOWN";
}

std::string strictness_to_string(DetectionStrictness strictness) {
  switch (strictness) {
  case DetectionStrictness::LOW:
    return "LOW";
  case DetectionStrictness::MEDIUM:
    return "MEDIUM";
  case DetectionStrictness::HIGH:
    return "HIGH";
  case DetectionStrictness::PARANOID:
    return "PARANOID";
  }
  return "UNKNOWN";
}

std::string language_to_string(Language language) {
  switch (language) {
  case Language::ENGLISH:
    return "en";
  case Language::ARABIC:
    return "ar";
  case Language::UNSPECIFIED:
    return "";
  }
  return "";
}

std::string evasion_technique_to_string(EvasionTechnique technique) {
  switch (technique) {
  case EvasionTechnique::SYMBOL_REPLACEMENT:
    return "symbol_replacement";
  case EvasionTechnique::SPACE_INSERTION:
    return "space_insertion";
  case EvasionTechnique::REPEATED_LETTERS:
    return "repeated_letters";
  case EvasionTechnique::NUMERAL_SUBSTITUTION:
    return "leet_speak";
  case EvasionTechnique::LANGUAGE_MIXING:
    return "language_mixing";
  case EvasionTechnique::CHARACTER_SUBSTITUTION:
    return "character_substitution";
  }
  return "unknown";
}

std::string match_source_to_string(MatchSource source) {
  switch (source) {
  case MatchSource::AUTOMATON:
    return "automaton";
  case MatchSource::FUZZY:
    return "fuzzy";
  case MatchSource::STRICT_AUTOMATON:
    return "strict_automaton";
  }
  return "unknown";
}

std::string searched_text_to_string(SearchedText searched) {
  switch (searched) {
  case SearchedText::ORIGINAL:
    return "original";
  case SearchedText::NORMALIZED:
    return "normalized";
  case SearchedText::STRICT_NORMALIZED:
    return "strict_normalized";
  case SearchedText::EVASION_NORMALIZED:
    return "evasion_normalized";
  }
  return "unknown";
}

std::optional<Language> parse_language(std::string_view tag) {
  std::string lowered = Utils::to_lower_ascii(Utils::trim_copy(tag));
  if (lowered.empty())
    return Language::UNSPECIFIED;
  if (lowered == "en")
    return Language::ENGLISH;
  if (lowered == "ar")
    return Language::ARABIC;
  return std::nullopt;
}

} // namespace wordguard
