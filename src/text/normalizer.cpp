#include "normalizer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <algorithm>

namespace wordguard {

namespace {

using NormalizerGetter = const icu::Normalizer2 *(*)(UErrorCode &);

const icu::Normalizer2 &load_normalizer(NormalizerGetter getter,
                                        const char *name) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *instance = getter(status);
  if (U_FAILURE(status) || instance == nullptr)
    throw WordguardError(std::string("ICU ") + name +
                         " data unavailable: " + u_errorName(status));
  return *instance;
}

const icu::Normalizer2 &nfd() {
  static const icu::Normalizer2 &instance =
      load_normalizer(&icu::Normalizer2::getNFDInstance, "NFD");
  return instance;
}

const icu::Normalizer2 &nfkc() {
  static const icu::Normalizer2 &instance =
      load_normalizer(&icu::Normalizer2::getNFKCInstance, "NFKC");
  return instance;
}

std::u32string code_points(const icu::UnicodeString &ustr) {
  std::u32string out;
  for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1))
    out.push_back(static_cast<char32_t>(ustr.char32At(i)));
  return out;
}

// Canonical decomposition, or empty when `c` has none
std::u32string decompose(char32_t c) {
  icu::UnicodeString decomposition;
  if (!nfd().getDecomposition(static_cast<UChar32>(c), decomposition))
    return {};
  return code_points(decomposition);
}

std::u32string compatibility_form(char32_t c) {
  UErrorCode status = U_ZERO_ERROR;
  icu::UnicodeString result =
      nfkc().normalize(icu::UnicodeString(static_cast<UChar32>(c)), status);
  if (U_FAILURE(status))
    return std::u32string(1, c);
  return code_points(result);
}

bool is_combining_mark(char32_t c) {
  int8_t type = u_charType(static_cast<UChar32>(c));
  return type == U_NON_SPACING_MARK || type == U_ENCLOSING_MARK;
}

bool is_arabic_presentation_form(char32_t c) {
  return (c >= 0xFB50 && c <= 0xFDFF) || (c >= 0xFE70 && c <= 0xFEFF);
}

// Mathematical alphanumerics and letterlike symbols
bool is_styled_letter(char32_t c) {
  return (c >= 0x1D400 && c <= 0x1D7FF) || (c >= 0x2100 && c <= 0x214F);
}

bool is_invisible(char32_t c) {
  UChar32 cp = static_cast<UChar32>(c);
  if (u_hasBinaryProperty(cp, UCHAR_BIDI_CONTROL))
    return false;
  if (u_hasBinaryProperty(cp, UCHAR_DEFAULT_IGNORABLE_CODE_POINT))
    return true;
  return u_charType(cp) == U_CONTROL_CHAR && !Utils::is_whitespace(c);
}

bool is_elongation(char32_t c) { return c == 0x0640 || c == 0x07FA; }

bool same_letter(char32_t a, char32_t b) {
  return a == b || Utils::to_lower(a) == Utils::to_lower(b);
}

} // namespace

SourceSpan NormalizedText::source_span(size_t position, size_t length) const {
  if (origins.empty() || length == 0 || position >= origins.size())
    return {};
  size_t last = std::min(position + length, origins.size()) - 1;
  return {origins[position].begin, origins[last].end};
}

std::string NormalizedText::to_utf8() const { return Utils::to_utf8(text); }

NormalizerOptions NormalizerOptions::canonical() {
  NormalizerOptions options;
  options.strip_invisible = false;
  options.strip_bidi_and_elongation = false;
  return options;
}

NormalizerOptions NormalizerOptions::standard() { return NormalizerOptions{}; }

NormalizerOptions NormalizerOptions::evasion(bool symbol_replacement,
                                             bool space_insertion,
                                             bool repeated_letters,
                                             bool language_mixing) {
  NormalizerOptions options;
  options.fold_confusables = true;
  options.fold_cross_script = language_mixing;
  options.collapse_leet_symbols = symbol_replacement;
  options.remove_separators = space_insertion;
  options.collapse_repeats = repeated_letters;
  return options;
}

NormalizerOptions NormalizerOptions::lowercase_only() {
  NormalizerOptions options;
  options.strip_invisible = false;
  options.strip_bidi_and_elongation = false;
  options.fold_script_variants = false;
  options.strip_diacritics = false;
  options.squeeze_whitespace = false;
  return options;
}

NormalizerOptions NormalizerOptions::all_stages() {
  return evasion(true, true, true, true);
}

Normalizer::Normalizer(const FoldTables &tables) : tables_(tables) {}

NormalizedText Normalizer::normalize(std::u32string_view text,
                                     const NormalizerOptions &options) const {
  NormalizedText result = to_normalized_text(run_stages(text, options));
  LOG(LogLevel::TRACE, LogComponent::NORMALIZER,
      "Normalized " << text.size() << " code points to "
                    << result.text.size());
  return result;
}

std::string Normalizer::normalize(std::string_view utf8,
                                  const NormalizerOptions &options) const {
  return normalize(std::u32string_view(Utils::to_utf32(utf8)), options)
      .to_utf8();
}

NormalizedText Normalizer::normalize_strict(std::u32string_view text) const {
  Units units = run_stages(text, NormalizerOptions::all_stages());
  keep_letters_and_digits(units);
  collapse_repeats(units, 1);
  return to_normalized_text(units);
}

std::string Normalizer::normalize_strict(std::string_view utf8) const {
  return normalize_strict(std::u32string_view(Utils::to_utf32(utf8)))
      .to_utf8();
}

Normalizer::Units
Normalizer::run_stages(std::u32string_view text,
                       const NormalizerOptions &options) const {
  Units units;
  units.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i)
    units.push_back({text[i], {i, i + 1}});

  if (options.strip_invisible)
    strip_invisible(units);
  if (options.strip_bidi_and_elongation)
    strip_bidi_and_elongation(units);
  if (options.fold_script_variants)
    fold_script_variants(units);
  if (options.strip_diacritics)
    strip_diacritics(units);
  if (options.fold_confusables)
    fold_confusables(units);
  // Both decisions look at letters only, so punctuation and digits in text
  // written in another script never turn it into Latin.
  if (options.fold_cross_script && Utils::is_mixed_script(unit_text(units)))
    fold_cross_script(units);
  if (options.collapse_leet_symbols) {
    Utils::LetterScripts scripts = Utils::scan_letter_scripts(unit_text(units));
    if (scripts.latin || !scripts.other)
      collapse_leet_symbols(units);
  }
  if (options.remove_separators)
    remove_separators(units);
  if (options.collapse_repeats)
    collapse_repeats(units, 2);
  if (options.lowercase_and_trim)
    lowercase_and_trim(units, options.squeeze_whitespace);
  return units;
}

std::u32string Normalizer::unit_text(const Units &units) {
  std::u32string text;
  text.reserve(units.size());
  for (const auto &u : units)
    text.push_back(u.c);
  return text;
}

NormalizedText Normalizer::to_normalized_text(const Units &units) {
  NormalizedText result;
  result.text.reserve(units.size());
  result.origins.reserve(units.size());
  for (const auto &u : units) {
    result.text.push_back(u.c);
    result.origins.push_back(u.span);
  }
  return result;
}

void Normalizer::strip_invisible(Units &units) const {
  units.erase(std::remove_if(units.begin(), units.end(),
                             [](const Unit &u) { return is_invisible(u.c); }),
              units.end());
}

void Normalizer::strip_bidi_and_elongation(Units &units) const {
  units.erase(std::remove_if(units.begin(), units.end(),
                             [](const Unit &u) {
                               return is_elongation(u.c) ||
                                      u_hasBinaryProperty(
                                          static_cast<UChar32>(u.c),
                                          UCHAR_BIDI_CONTROL);
                             }),
              units.end());
}

void Normalizer::fold_script_variants(Units &units) const {
  Units out;
  out.reserve(units.size());

  auto emit = [&](char32_t c, const SourceSpan &span) {
    auto it = tables_.script_variants.find(c);
    if (it != tables_.script_variants.end()) {
      out.push_back({it->second, span});
      return;
    }
    // A precomposed letter built on a variant folds like its base; the marks
    // are left for the diacritics stage
    std::u32string parts = decompose(c);
    if (!parts.empty()) {
      auto base = tables_.script_variants.find(parts[0]);
      if (base != tables_.script_variants.end()) {
        out.push_back({base->second, span});
        for (size_t i = 1; i < parts.size(); ++i)
          out.push_back({parts[i], span});
        return;
      }
    }
    out.push_back({c, span});
  };

  for (const auto &u : units) {
    if (is_arabic_presentation_form(u.c)) {
      for (char32_t c : compatibility_form(u.c))
        emit(c, u.span);
    } else {
      emit(u.c, u.span);
    }
  }
  units.swap(out);
}

void Normalizer::strip_diacritics(Units &units) const {
  Units out;
  out.reserve(units.size());
  for (const auto &u : units) {
    if (is_combining_mark(u.c))
      continue;
    std::u32string parts = decompose(u.c);
    bool had_mark = std::any_of(parts.begin(), parts.end(), is_combining_mark);
    if (!had_mark) {
      out.push_back(u);
      continue;
    }
    for (char32_t c : parts) {
      if (!is_combining_mark(c))
        out.push_back({c, u.span});
    }
  }
  units.swap(out);
}

void Normalizer::fold_confusables(Units &units) const {
  for (auto &u : units) {
    if (auto folded = tables_.fold_confusable(u.c)) {
      u.c = *folded;
      continue;
    }
    if (!is_styled_letter(u.c))
      continue;
    std::u32string plain = compatibility_form(u.c);
    if (plain.size() != 1)
      continue;
    auto folded = tables_.fold_confusable(plain[0]);
    u.c = folded ? *folded : plain[0];
  }
}

void Normalizer::fold_cross_script(Units &units) const {
  Units out;
  out.reserve(units.size());
  for (const auto &u : units) {
    auto it = tables_.phonetic.find(u.c);
    if (it == tables_.phonetic.end()) {
      out.push_back(u);
      continue;
    }
    for (char32_t c : it->second)
      out.push_back({c, u.span});
  }
  units.swap(out);
}

void Normalizer::collapse_leet_symbols(Units &units) const {
  Units out;
  out.reserve(units.size());
  for (const auto &u : units) {
    auto it = tables_.leet_symbols.find(u.c);
    if (it == tables_.leet_symbols.end()) {
      out.push_back(u);
      continue;
    }
    for (char32_t c : it->second)
      out.push_back({c, u.span});
  }
  units.swap(out);
}

void Normalizer::remove_separators(Units &units) const {
  units.erase(std::remove_if(units.begin(), units.end(),
                             [this](const Unit &u) {
                               return tables_.is_separator(u.c);
                             }),
              units.end());
}

// Runs longer than `keep` shrink to `keep` units; the last kept unit takes
// over the span of the dropped ones.
void Normalizer::collapse_repeats(Units &units, size_t keep) const {
  Units out;
  out.reserve(units.size());
  size_t i = 0;
  while (i < units.size()) {
    size_t j = i + 1;
    while (j < units.size() && same_letter(units[i].c, units[j].c))
      ++j;
    size_t run = j - i;
    if (run <= keep) {
      out.insert(out.end(), units.begin() + i, units.begin() + j);
    } else {
      out.insert(out.end(), units.begin() + i, units.begin() + i + keep);
      out.back().span.end = units[j - 1].span.end;
    }
    i = j;
  }
  units.swap(out);
}

void Normalizer::lowercase_and_trim(Units &units, bool squeeze) const {
  if (!squeeze) {
    for (auto &u : units)
      u.c = Utils::to_lower(u.c);
    return;
  }
  Units out;
  out.reserve(units.size());
  for (const auto &u : units) {
    if (Utils::is_whitespace(u.c)) {
      if (out.empty())
        continue;
      if (out.back().c == U' ') {
        out.back().span.end = u.span.end;
        continue;
      }
      out.push_back({U' ', u.span});
      continue;
    }
    out.push_back({Utils::to_lower(u.c), u.span});
  }
  if (!out.empty() && out.back().c == U' ')
    out.pop_back();
  units.swap(out);
}

void Normalizer::keep_letters_and_digits(Units &units) const {
  units.erase(std::remove_if(units.begin(), units.end(),
                             [](const Unit &u) {
                               return !Utils::is_letter_or_digit(u.c);
                             }),
              units.end());
}

} // namespace wordguard
