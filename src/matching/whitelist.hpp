#ifndef WHITELIST_HPP
#define WHITELIST_HPP

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wordguard {

// Words that must never be reported. Entries are unique by their
// case-insensitive word; adding an existing word replaces its entry.
class Whitelist {
public:
  void add(const WhitelistEntry &entry);
  void add(const std::string &word);
  void add_many(const std::vector<WhitelistEntry> &entries);

  // Case-insensitive; returns false when nothing was removed
  bool remove(std::string_view word);
  bool contains(std::string_view word) const;
  void clear() { entries_.clear(); }

  // Whole-word entries suppress an equal match word; the others suppress any
  // match word containing them
  bool is_whitelisted(std::string_view match_word) const;

  const std::vector<WhitelistEntry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  std::vector<WhitelistEntry> entries_;
};

} // namespace wordguard

#endif // WHITELIST_HPP
