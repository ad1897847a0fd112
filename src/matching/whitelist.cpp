#include "whitelist.hpp"
#include "core/errors.hpp"
#include "utils/unicode.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace wordguard {

namespace {

std::u32string fold(std::string_view word) {
  return Utils::to_lower(Utils::to_utf32(word));
}

} // namespace

void Whitelist::add(const WhitelistEntry &entry) {
  WhitelistEntry cleaned = entry;
  cleaned.word = Utils::trim_copy(entry.word);
  if (cleaned.word.empty())
    throw InvalidPatternError("Whitelist entries must not be empty");

  std::u32string key = fold(cleaned.word);
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const WhitelistEntry &e) {
                           return fold(e.word) == key;
                         });
  if (it != entries_.end())
    *it = std::move(cleaned);
  else
    entries_.push_back(std::move(cleaned));
}

void Whitelist::add(const std::string &word) { add(WhitelistEntry{word}); }

void Whitelist::add_many(const std::vector<WhitelistEntry> &entries) {
  for (const auto &entry : entries) {
    if (Utils::trim_copy(entry.word).empty())
      throw InvalidPatternError("Whitelist entries must not be empty");
  }
  for (const auto &entry : entries)
    add(entry);
}

bool Whitelist::remove(std::string_view word) {
  std::u32string key = fold(Utils::trim_copy(word));
  auto before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const WhitelistEntry &e) {
                                  return fold(e.word) == key;
                                }),
                 entries_.end());
  return entries_.size() != before;
}

bool Whitelist::contains(std::string_view word) const {
  std::u32string key = fold(Utils::trim_copy(word));
  return std::any_of(entries_.begin(), entries_.end(),
                     [&](const WhitelistEntry &e) {
                       return fold(e.word) == key;
                     });
}

bool Whitelist::is_whitelisted(std::string_view match_word) const {
  std::u32string exact = Utils::to_utf32(match_word);
  std::u32string folded = Utils::to_lower(exact);

  for (const auto &entry : entries_) {
    std::u32string word = Utils::to_utf32(entry.word);
    const std::u32string &subject = entry.case_sensitive ? exact : folded;
    if (!entry.case_sensitive)
      word = Utils::to_lower(word);

    if (entry.whole_word ? subject == word
                         : subject.find(word) != std::u32string::npos)
      return true;
  }
  return false;
}

} // namespace wordguard
