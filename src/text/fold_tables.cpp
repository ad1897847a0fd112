#include "fold_tables.hpp"
#include "utils/unicode.hpp"

#include <optional>
#include <string>

namespace wordguard {

namespace {

struct LetterRange {
  char32_t first;
  char32_t last;
};

// Blocks whose members map in order onto 'a'..'z'
constexpr LetterRange kAlphabetRanges[] = {
    {0x249C, 0x24B5},   // Parenthesized Latin small letters
    {0x24B6, 0x24CF},   // Circled Latin capital letters
    {0x24D0, 0x24E9},   // Circled Latin small letters
    {0x1F130, 0x1F149}, // Squared Latin capital letters
    {0x1F150, 0x1F169}, // Negative circled Latin capital letters
    {0x1F170, 0x1F189}, // Negative squared Latin capital letters
    {0x1F1E6, 0x1F1FF}, // Regional indicator symbols
};

void add_script_variants(FoldTables &tables) {
  auto &m = tables.script_variants;
  // Alef with hamza above/below, madda, wasla and wavy hamza
  m[U'آ'] = U'ا';
  m[U'أ'] = U'ا';
  m[U'إ'] = U'ا';
  m[U'ٱ'] = U'ا';
  m[U'ٲ'] = U'ا';
  m[U'ٳ'] = U'ا';
  // Teh marbuta and heh variants
  m[U'ة'] = U'ه';
  m[U'ە'] = U'ه';
  m[U'ۀ'] = U'ه';
  m[U'ہ'] = U'ه';
  m[U'ھ'] = U'ه';
  // Alef maksura and Persian/Urdu yeh forms
  m[U'ى'] = U'ي';
  m[U'ی'] = U'ي';
  m[U'ې'] = U'ي';
  m[U'ئ'] = U'ي';
  // Keheh and swash kaf
  m[U'ک'] = U'ك';
  m[U'ڪ'] = U'ك';
  m[U'ؤ'] = U'و';
  // Latin long s
  m[U'ſ'] = U's';
}

void add_confusables(FoldTables &tables) {
  auto &m = tables.confusables;
  // Cyrillic
  m[U'а'] = U'a';
  m[U'в'] = U'b';
  m[U'ь'] = U'b';
  m[U'е'] = U'e';
  m[U'к'] = U'k';
  m[U'м'] = U'm';
  m[U'н'] = U'h';
  m[U'о'] = U'o';
  m[U'п'] = U'n';
  m[U'р'] = U'p';
  m[U'с'] = U'c';
  m[U'т'] = U't';
  m[U'у'] = U'y';
  m[U'х'] = U'x';
  m[U'я'] = U'r';
  m[U'ѕ'] = U's';
  m[U'і'] = U'i';
  m[U'ј'] = U'j';
  m[U'ԁ'] = U'd';
  m[U'ԛ'] = U'q';
  m[U'ԝ'] = U'w';
  // Greek
  m[U'α'] = U'a';
  m[U'β'] = U'b';
  m[U'γ'] = U'y';
  m[U'ε'] = U'e';
  m[U'η'] = U'n';
  m[U'ι'] = U'i';
  m[U'κ'] = U'k';
  m[U'ν'] = U'v';
  m[U'ο'] = U'o';
  m[U'ρ'] = U'p';
  m[U'τ'] = U't';
  m[U'υ'] = U'u';
  m[U'χ'] = U'x';
  m[U'ω'] = U'w';
  // Latin letters without a canonical decomposition, and symbol glyphs
  m[U'ı'] = U'i';
  m[U'ł'] = U'l';
  m[U'đ'] = U'd';
  m[U'ħ'] = U'h';
  m[U'ŧ'] = U't';
  m[U'ŋ'] = U'n';
  m[U'ø'] = U'o';
  m[U'þ'] = U'p';
  m[U'ß'] = U'b';
  m[U'ƒ'] = U'f';
  m[U'ɡ'] = U'g';
  m[U'€'] = U'e';
  m[U'†'] = U't';
  m[U'×'] = U'x';
  m[U'¢'] = U'c';
  m[U'¥'] = U'y';
}

void add_phonetic(FoldTables &tables) {
  auto &m = tables.phonetic;
  m[U'ا'] = U"a";
  m[U'ب'] = U"b";
  m[U'ت'] = U"t";
  m[U'ث'] = U"th";
  m[U'ج'] = U"j";
  m[U'ح'] = U"h";
  m[U'خ'] = U"kh";
  m[U'د'] = U"d";
  m[U'ذ'] = U"th";
  m[U'ر'] = U"r";
  m[U'ز'] = U"z";
  m[U'س'] = U"s";
  m[U'ش'] = U"sh";
  m[U'ص'] = U"s";
  m[U'ض'] = U"d";
  m[U'ط'] = U"t";
  m[U'ظ'] = U"z";
  m[U'ع'] = U"a";
  m[U'غ'] = U"gh";
  m[U'ف'] = U"f";
  m[U'ق'] = U"q";
  m[U'ك'] = U"k";
  m[U'ل'] = U"l";
  m[U'م'] = U"m";
  m[U'ن'] = U"n";
  m[U'ه'] = U"h";
  m[U'و'] = U"w";
  m[U'ي'] = U"y";
}

void add_leet_symbols(FoldTables &tables) {
  auto &m = tables.leet_symbols;
  m[U'*'] = U"";
  m[U'~'] = U"";
  m[U'@'] = U"a";
  m[U'$'] = U"s";
  m[U'!'] = U"i";
  m[U'0'] = U"o";
  m[U'1'] = U"i";
  m[U'3'] = U"e";
  m[U'4'] = U"a";
  m[U'5'] = U"s";
  m[U'7'] = U"t";
  m[U'8'] = U"b";
  m[U'9'] = U"g";
}

} // namespace

std::optional<char32_t> FoldTables::fold_confusable(char32_t c) const {
  // Fullwidth ASCII variants
  if (c >= 0xFF01 && c <= 0xFF5E)
    return static_cast<char32_t>(c - 0xFEE0);

  for (const auto &range : kAlphabetRanges) {
    if (c >= range.first && c <= range.last)
      return static_cast<char32_t>(U'a' + (c - range.first));
  }

  auto it = confusables.find(Utils::to_lower(c));
  if (it != confusables.end())
    return it->second;
  return std::nullopt;
}

bool FoldTables::is_separator(char32_t c) const {
  return Utils::is_whitespace(c) || separators.count(c) > 0;
}

bool FoldTables::is_known_substitute(char32_t c) const {
  if (leet_symbols.count(c) > 0 || fold_confusable(c).has_value())
    return true;
  // Accented Latin letters
  return c >= 0x80 && Utils::is_latin_letter(c);
}

FoldTables build_default_fold_tables() {
  FoldTables tables;
  add_script_variants(tables);
  add_confusables(tables);
  add_phonetic(tables);
  add_leet_symbols(tables);
  tables.separators = {U'.', U'-', U'_', U'|'};
  return tables;
}

const FoldTables &default_fold_tables() {
  static const FoldTables tables = build_default_fold_tables();
  return tables;
}

} // namespace wordguard
