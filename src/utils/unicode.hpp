#ifndef UNICODE_HPP
#define UNICODE_HPP

#include <string>
#include <string_view>

namespace Utils {

// UTF-8 <-> code point conversion. Ill-formed UTF-8 sequences decode to U+FFFD.
std::u32string to_utf32(std::string_view utf8);
std::string to_utf8(std::u32string_view text);

char32_t to_lower(char32_t c);
std::u32string to_lower(std::u32string_view text);

// Characters that extend a word for boundary checks: ASCII letters, digits,
// underscore and the Arabic blocks (U+0600-U+06FF, U+0750-U+077F,
// U+08A0-U+08FF).
bool is_word_char(char32_t c);

bool is_letter_or_digit(char32_t c);
bool is_letter(char32_t c);
bool is_whitespace(char32_t c);
bool is_ascii_letter(char32_t c);
bool is_latin_letter(char32_t c);

// Which kinds of letters a text contains. Digits, symbols and punctuation are
// ignored.
struct LetterScripts {
  bool latin = false;
  bool other = false;
};

LetterScripts scan_letter_scripts(std::u32string_view text);

// True when the text has at least one Latin letter and at least one letter of
// another script
bool is_mixed_script(std::u32string_view text);

} // namespace Utils

#endif // UNICODE_HPP
