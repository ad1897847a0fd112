#include "evasion_detector.hpp"
#include "utils/unicode.hpp"

namespace wordguard {

namespace {

bool has_symbol_replacement(std::u32string_view text) {
  for (char32_t c : text) {
    if (c == U'@' || c == U'$' || c == U'!' || c == U'*' || c == U'#')
      return true;
  }
  return false;
}

bool has_space_insertion(std::u32string_view text) {
  size_t whitespace_run = 0;
  size_t single_letter_tokens = 0;
  size_t token_length = 0;

  auto end_token = [&]() {
    if (token_length == 1)
      ++single_letter_tokens;
    else if (token_length > 1)
      single_letter_tokens = 0;
    token_length = 0;
  };

  for (char32_t c : text) {
    if (c == U'.' || c == U'_' || c == U'-' || c == U'|')
      return true;
    if (Utils::is_whitespace(c)) {
      if (++whitespace_run >= 2)
        return true;
      end_token();
      continue;
    }
    whitespace_run = 0;
    ++token_length;
  }
  end_token();
  return single_letter_tokens >= 3;
}

bool has_repeated_letters(std::u32string_view text) {
  size_t run = 1;
  for (size_t i = 1; i < text.size(); ++i) {
    run = text[i] == text[i - 1] ? run + 1 : 1;
    if (run >= 4)
      return true;
  }
  return false;
}

bool has_digit(std::u32string_view text) {
  for (char32_t c : text) {
    if (c >= U'0' && c <= U'9')
      return true;
  }
  return false;
}

bool has_language_mixing(std::u32string_view text) {
  bool arabic = false;
  bool latin = false;
  for (char32_t c : text) {
    arabic = arabic || (c >= 0x0600 && c <= 0x06FF);
    latin = latin || Utils::is_ascii_letter(c);
  }
  return arabic && latin;
}

} // namespace

std::vector<EvasionTechnique>
detect_evasion_techniques(std::u32string_view original,
                          const FoldTables &tables) {
  std::vector<EvasionTechnique> techniques;
  if (has_symbol_replacement(original))
    techniques.push_back(EvasionTechnique::SYMBOL_REPLACEMENT);
  if (has_space_insertion(original))
    techniques.push_back(EvasionTechnique::SPACE_INSERTION);
  if (has_repeated_letters(original))
    techniques.push_back(EvasionTechnique::REPEATED_LETTERS);
  if (has_digit(original))
    techniques.push_back(EvasionTechnique::NUMERAL_SUBSTITUTION);
  if (has_language_mixing(original))
    techniques.push_back(EvasionTechnique::LANGUAGE_MIXING);
  for (char32_t c : original) {
    if (tables.is_known_substitute(c)) {
      techniques.push_back(EvasionTechnique::CHARACTER_SUBSTITUTION);
      break;
    }
  }
  return techniques;
}

} // namespace wordguard
