#ifndef FOLD_TABLES_HPP
#define FOLD_TABLES_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace wordguard {

// Immutable character substitution data consumed by the Normalizer.
// Built once by build_default_fold_tables(); never mutated afterwards.
struct FoldTables {
  // Stage 3: script-specific letter variants -> canonical letterform
  std::unordered_map<char32_t, char32_t> script_variants;

  // Stage 5: look-alike glyphs keyed by their lowercase form
  std::unordered_map<char32_t, char32_t> confusables;

  // Stage 6: non-Latin letter -> Latin phonetic equivalent
  std::unordered_map<char32_t, std::u32string> phonetic;

  // Stage 7: decorative/leet symbol -> letter, or empty to drop it
  std::unordered_map<char32_t, std::u32string> leet_symbols;

  // Stage 8: non-whitespace characters used as artificial word spacing
  std::unordered_set<char32_t> separators;

  // Table lookups plus the computed ranges (fullwidth, circled, squared and
  // regional indicator letters)
  std::optional<char32_t> fold_confusable(char32_t c) const;

  bool is_separator(char32_t c) const;

  // True for any code point an evader would use in place of a plain letter
  bool is_known_substitute(char32_t c) const;
};

FoldTables build_default_fold_tables();

// Process-wide instance, constructed on first use
const FoldTables &default_fold_tables();

} // namespace wordguard

#endif // FOLD_TABLES_HPP
