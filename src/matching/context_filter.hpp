#ifndef CONTEXT_FILTER_HPP
#define CONTEXT_FILTER_HPP

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace wordguard {

// Suppresses matches that only occur inside innocent longer words
// ("class", "Scunthorpe", ...).
class ContextFilter {
public:
  ContextFilter();
  explicit ContextFilter(const std::vector<std::string> &safe_words);

  // True when `word` occurs in `text` at least once, never as a standalone
  // token, and every token containing it is a safe word.
  bool is_only_in_safe_context(std::u32string_view text,
                               std::u32string_view word) const;

  bool is_safe_word(std::u32string_view token) const;
  size_t size() const { return safe_words_.size(); }

  static bool exists_as_standalone_word(std::u32string_view text,
                                        std::u32string_view word);

private:
  std::unordered_set<std::u32string> safe_words_;
};

const std::vector<std::string> &default_safe_words();

} // namespace wordguard

#endif // CONTEXT_FILTER_HPP
