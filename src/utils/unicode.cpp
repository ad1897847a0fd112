#include "unicode.hpp"

#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/uscript.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace Utils {

std::u32string to_utf32(std::string_view utf8) {
  icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
  std::u32string out;
  out.reserve(static_cast<size_t>(ustr.length()));
  for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1))
    out.push_back(static_cast<char32_t>(ustr.char32At(i)));
  return out;
}

std::string to_utf8(std::u32string_view text) {
  icu::UnicodeString ustr = icu::UnicodeString::fromUTF32(
      reinterpret_cast<const UChar32 *>(text.data()),
      static_cast<int32_t>(text.size()));
  std::string out;
  ustr.toUTF8String(out);
  return out;
}

char32_t to_lower(char32_t c) {
  return static_cast<char32_t>(u_tolower(static_cast<UChar32>(c)));
}

std::u32string to_lower(std::u32string_view text) {
  std::u32string out;
  out.reserve(text.size());
  for (char32_t c : text)
    out.push_back(to_lower(c));
  return out;
}

bool is_word_char(char32_t c) {
  if (c < 0x80)
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') ||
           (c >= U'0' && c <= U'9') || c == U'_';
  return (c >= 0x0600 && c <= 0x06FF) || (c >= 0x0750 && c <= 0x077F) ||
         (c >= 0x08A0 && c <= 0x08FF);
}

bool is_letter_or_digit(char32_t c) {
  return u_isalnum(static_cast<UChar32>(c)) != 0;
}

bool is_letter(char32_t c) { return u_isalpha(static_cast<UChar32>(c)) != 0; }

bool is_whitespace(char32_t c) {
  return u_isUWhiteSpace(static_cast<UChar32>(c)) != 0;
}

bool is_ascii_letter(char32_t c) {
  return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

bool is_latin_letter(char32_t c) {
  if (c < 0x80)
    return is_ascii_letter(c);
  UErrorCode status = U_ZERO_ERROR;
  UScriptCode script = uscript_getScript(static_cast<UChar32>(c), &status);
  return U_SUCCESS(status) && script == USCRIPT_LATIN && is_letter(c);
}

LetterScripts scan_letter_scripts(std::u32string_view text) {
  LetterScripts scripts;
  for (char32_t c : text) {
    if (!is_letter(c))
      continue;
    if (is_latin_letter(c))
      scripts.latin = true;
    else
      scripts.other = true;
    if (scripts.latin && scripts.other)
      break;
  }
  return scripts;
}

bool is_mixed_script(std::u32string_view text) {
  LetterScripts scripts = scan_letter_scripts(text);
  return scripts.latin && scripts.other;
}

} // namespace Utils
