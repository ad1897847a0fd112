#ifndef WORD_LIST_CODEC_HPP
#define WORD_LIST_CODEC_HPP

#include "core/types.hpp"
#include "nlohmann/json.hpp"

#include <string>
#include <vector>

namespace wordguard {

// All decoding functions throw WordListFormatError on malformed input.

nlohmann::json pattern_to_json(const Pattern &pattern);
Pattern pattern_from_json(const nlohmann::json &j);

nlohmann::json word_list_to_json(const WordListExport &list);
WordListExport word_list_from_json(const nlohmann::json &j);

std::string serialize_word_list(const WordListExport &list);
WordListExport parse_word_list(const std::string &json_text);

nlohmann::json whitelist_to_json(const std::vector<WhitelistEntry> &entries);
std::vector<WhitelistEntry> whitelist_from_json(const nlohmann::json &j);

// {"en": {"profanity": [{"word": ..., "severity": ..., "variations": [...]}]}}
// Every variation becomes a pattern of its own.
std::vector<Pattern> load_word_database(const nlohmann::json &j);
std::vector<Pattern> load_word_database_file(const std::string &path);

// One word per line; blank lines and '#' comments are skipped
std::vector<WhitelistEntry> load_whitelist_file(const std::string &path);

// Current time as ISO-8601 UTC with milliseconds
std::string current_timestamp_iso8601();

} // namespace wordguard

#endif // WORD_LIST_CODEC_HPP
