#include "context_filter.hpp"
#include "utils/unicode.hpp"

#include <utility>

namespace wordguard {

namespace {

bool is_token_delimiter(char32_t c) {
  if (Utils::is_whitespace(c))
    return true;
  switch (c) {
  case U',':
  case U'.':
  case U'-':
  case U';':
  case U':':
  case U'!':
  case U'?':
  case U'"':
  case U'\'':
  case U'(':
  case U')':
  case U'[':
  case U']':
  case U'{':
  case U'}':
    return true;
  default:
    return false;
  }
}

// Lowercased tokens, reduced to their letters and digits
std::vector<std::u32string> clean_tokens(std::u32string_view text) {
  std::vector<std::u32string> tokens;
  std::u32string current;
  for (char32_t c : text) {
    if (is_token_delimiter(c)) {
      if (!current.empty())
        tokens.push_back(std::move(current));
      current.clear();
      continue;
    }
    if (Utils::is_letter_or_digit(c))
      current.push_back(Utils::to_lower(c));
  }
  if (!current.empty())
    tokens.push_back(std::move(current));
  return tokens;
}

} // namespace

const std::vector<std::string> &default_safe_words() {
  static const std::vector<std::string> words = {
      // "ass"
      "assessment", "assassin", "assign", "assist", "assume", "associate",
      "assemble", "class", "classic", "mass", "massive", "pass", "passage",
      "passenger", "passion", "compass", "embassy", "harass", "brass", "grass",
      "glass", "bypass", "trespass", "cassette", "bassoon", "lasso", "molasses",
      "sassafras", "ambassador", "embarrass",
      // "hell"
      "hello", "shell", "shellfish", "michelle", "seashell", "nutshell",
      "eggshell",
      // "damn"
      "goddamn", "amsterdam",
      // "cock"
      "cocktail", "peacock", "hancock", "cockpit", "cockatoo", "cocoon",
      "weathercock",
      // "dick"
      "dickens", "dictate", "dictionary", "predict", "verdict", "addiction",
      "benediction",
      // "cum"
      "document", "cucumber", "accumulate", "circumstance", "circumference",
      "incumbent",
      // "sex"
      "sextant", "sextet", "essex", "sussex", "middlesex",
      // "tit"
      "title", "entitled", "institution", "constitution", "attitude",
      "gratitude", "competitive", "repetitive", "appetizer", "titanium",
      "titan",
      // "piss"
      "mississippi",
      // "anal"
      "analysis", "analyze", "analyst", "analytical", "canal", "banal", "final",
      "signal",
      // "nig"
      "night", "nightmare", "knight", "ignite", "significant", "benign",
      "malignant",
      // "fag"
      "fagot",
      // "ho"
      "honest", "honor", "horse", "hospital", "host", "hotel", "hope",
      "horizon",
      // "crap", "scum"
      "scrap", "scrape", "scumble",
      // Place names
      "scunthorpe", "penistone", "shitterton", "cockermouth", "clitheroe",
      "lightwater", "arsenal"};
  return words;
}

ContextFilter::ContextFilter() : ContextFilter(default_safe_words()) {}

ContextFilter::ContextFilter(const std::vector<std::string> &safe_words) {
  for (const auto &word : safe_words)
    safe_words_.insert(Utils::to_lower(Utils::to_utf32(word)));
}

bool ContextFilter::is_safe_word(std::u32string_view token) const {
  return safe_words_.count(Utils::to_lower(token)) > 0;
}

bool ContextFilter::exists_as_standalone_word(std::u32string_view text,
                                              std::u32string_view word) {
  if (word.empty())
    return false;
  std::u32string lower_text = Utils::to_lower(text);
  std::u32string lower_word = Utils::to_lower(word);

  size_t pos = lower_text.find(lower_word);
  while (pos != std::u32string::npos) {
    size_t end = pos + lower_word.size();
    bool before_ok = pos == 0 || !Utils::is_word_char(lower_text[pos - 1]);
    bool after_ok =
        end >= lower_text.size() || !Utils::is_word_char(lower_text[end]);
    if (before_ok && after_ok)
      return true;
    pos = lower_text.find(lower_word, pos + 1);
  }
  return false;
}

bool ContextFilter::is_only_in_safe_context(std::u32string_view text,
                                            std::u32string_view word) const {
  if (word.empty() || exists_as_standalone_word(text, word))
    return false;

  std::u32string lower_word = Utils::to_lower(word);
  size_t occurrences = 0;
  for (const auto &token : clean_tokens(text)) {
    if (token.find(lower_word) == std::u32string::npos)
      continue;
    if (token == lower_word || safe_words_.count(token) == 0)
      return false;
    ++occurrences;
  }
  return occurrences > 0;
}

} // namespace wordguard
