#ifndef NORMALIZER_HPP
#define NORMALIZER_HPP

#include "fold_tables.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

// Half-open range of code points in the text that was normalized
struct SourceSpan {
  size_t begin = 0;
  size_t end = 0;

  size_t length() const { return end - begin; }
};

struct NormalizedText {
  std::u32string text;
  // origins[i] is the part of the input that produced text[i]
  std::vector<SourceSpan> origins;

  // Maps [position, position + length) of `text` back onto the input
  SourceSpan source_span(size_t position, size_t length) const;
  std::string to_utf8() const;
};

// Stage toggles. Stages always run in declaration order.
struct NormalizerOptions {
  bool strip_invisible = true;           // 1. zero-width and control chars
  bool strip_bidi_and_elongation = true; // 2. bidi marks, tatweel
  bool fold_script_variants = true;      // 3. many-to-one letterforms
  bool strip_diacritics = true;          // 4. combining marks
  bool fold_confusables = false;         // 5. homoglyphs -> ASCII
  bool fold_cross_script = false;        // 6. phonetic, mixed-script only
  bool collapse_leet_symbols = false;    // 7. @ -> a, * -> nothing, ...
  bool remove_separators = false;        // 8. spaces, dots, dashes, ...
  bool collapse_repeats = false;         // 9. 3+ identical -> 2
  bool lowercase_and_trim = true;        // 10. lowercase, squeeze spaces
  bool squeeze_whitespace = true;        // part of stage 10

  // Stages 3, 4 and 10
  static NormalizerOptions canonical();
  // Stages 1 to 4 and 10
  static NormalizerOptions standard();
  // Stages 1 to 5 and 10, plus the evasion stages that are switched on
  static NormalizerOptions evasion(bool symbol_replacement, bool space_insertion,
                                   bool repeated_letters, bool language_mixing);
  // Lowercasing only; keeps a one-to-one mapping with the input
  static NormalizerOptions lowercase_only();
  static NormalizerOptions all_stages();
};

// Stateless text canonicalization pipeline. Safe to share between threads.
// Holds a reference to its tables, which must outlive it.
class Normalizer {
public:
  explicit Normalizer(const FoldTables &tables = default_fold_tables());
  Normalizer(FoldTables &&) = delete;

  NormalizedText normalize(std::u32string_view text,
                           const NormalizerOptions &options) const;
  std::string normalize(std::string_view utf8,
                        const NormalizerOptions &options) const;

  // Maximum recall variant: every stage, then only letters and digits are
  // kept and every run of repeated characters becomes a single character.
  // Lossy; not meant for display.
  NormalizedText normalize_strict(std::u32string_view text) const;
  std::string normalize_strict(std::string_view utf8) const;

  const FoldTables &tables() const { return tables_; }

private:
  struct Unit {
    char32_t c;
    SourceSpan span;
  };
  using Units = std::vector<Unit>;

  void strip_invisible(Units &units) const;
  void strip_bidi_and_elongation(Units &units) const;
  void fold_script_variants(Units &units) const;
  void strip_diacritics(Units &units) const;
  void fold_confusables(Units &units) const;
  void fold_cross_script(Units &units) const;
  void collapse_leet_symbols(Units &units) const;
  void remove_separators(Units &units) const;
  void collapse_repeats(Units &units, size_t keep) const;
  void lowercase_and_trim(Units &units, bool squeeze) const;
  void keep_letters_and_digits(Units &units) const;

  Units run_stages(std::u32string_view text,
                   const NormalizerOptions &options) const;
  static std::u32string unit_text(const Units &units);
  static NormalizedText to_normalized_text(const Units &units);

  const FoldTables &tables_;
};

} // namespace wordguard

#endif // NORMALIZER_HPP
