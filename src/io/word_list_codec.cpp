#include "word_list_codec.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace wordguard {

namespace {

const nlohmann::json &require(const nlohmann::json &j, const char *key,
                              const char *what) {
  auto it = j.find(key);
  if (it == j.end())
    throw WordListFormatError(std::string(what) + " is missing '" + key + "'");
  return *it;
}

std::string require_string(const nlohmann::json &j, const char *key,
                           const char *what) {
  const auto &value = require(j, key, what);
  if (!value.is_string())
    throw WordListFormatError(std::string(what) + " field '" + key +
                              "' must be a string");
  return value.get<std::string>();
}

SeverityLevel severity_from_json(const nlohmann::json &value) {
  if (!value.is_number_integer())
    throw WordListFormatError("severity must be an integer");
  auto severity = value.get<int64_t>();
  if (severity < 1 || severity > 4)
    throw WordListFormatError("severity " + std::to_string(severity) +
                              " is outside 1..4");
  return static_cast<SeverityLevel>(severity);
}

Language language_from_tag(const std::string &tag) {
  auto language = parse_language(tag);
  if (!language)
    throw WordListFormatError("unsupported language '" + tag + "'");
  return *language;
}

bool optional_bool(const nlohmann::json &j, const char *key, bool fallback) {
  auto it = j.find(key);
  if (it == j.end())
    return fallback;
  if (!it->is_boolean())
    throw WordListFormatError(std::string("'") + key + "' must be a boolean");
  return it->get<bool>();
}

std::ifstream open_or_throw(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw WordListFormatError("Could not open '" + path + "'");
  return file;
}

} // namespace

nlohmann::json pattern_to_json(const Pattern &pattern) {
  nlohmann::json j;
  j["word"] = pattern.word;
  j["severity"] = static_cast<int>(pattern.severity);
  if (!pattern.category.empty())
    j["category"] = pattern.category;
  if (pattern.language != Language::UNSPECIFIED)
    j["language"] = language_to_string(pattern.language);
  return j;
}

Pattern pattern_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw WordListFormatError("word entries must be objects");

  Pattern pattern;
  pattern.word = require_string(j, "word", "word entry");
  if (Utils::trim_copy(pattern.word).empty())
    throw WordListFormatError("word entry has an empty 'word'");
  pattern.severity = severity_from_json(require(j, "severity", "word entry"));
  if (j.contains("category")) {
    if (!j["category"].is_string())
      throw WordListFormatError("word entry field 'category' must be a string");
    pattern.category = j["category"].get<std::string>();
  }
  if (j.contains("language")) {
    if (!j["language"].is_string())
      throw WordListFormatError("word entry field 'language' must be a string");
    pattern.language = language_from_tag(j["language"].get<std::string>());
  }
  return pattern;
}

nlohmann::json word_list_to_json(const WordListExport &list) {
  nlohmann::json j;
  j["version"] = list.version;
  j["exportedAt"] = list.exported_at;
  j["words"] = nlohmann::json::array();
  for (const auto &pattern : list.words)
    j["words"].push_back(pattern_to_json(pattern));
  return j;
}

WordListExport word_list_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw WordListFormatError("word list must be a JSON object");

  WordListExport list;
  list.version = require_string(j, "version", "word list");
  if (list.version.empty())
    throw WordListFormatError("word list has an empty 'version'");
  if (j.contains("exportedAt") && j["exportedAt"].is_string())
    list.exported_at = j["exportedAt"].get<std::string>();

  const auto &words = require(j, "words", "word list");
  if (!words.is_array())
    throw WordListFormatError("word list field 'words' must be an array");
  for (const auto &entry : words)
    list.words.push_back(pattern_from_json(entry));
  return list;
}

std::string serialize_word_list(const WordListExport &list) {
  return word_list_to_json(list).dump(2);
}

WordListExport parse_word_list(const std::string &json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error &e) {
    throw WordListFormatError(std::string("Invalid JSON: ") + e.what());
  }
  return word_list_from_json(j);
}

nlohmann::json whitelist_to_json(const std::vector<WhitelistEntry> &entries) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &entry : entries) {
    j.push_back({{"word", entry.word},
                 {"caseSensitive", entry.case_sensitive},
                 {"wholeWord", entry.whole_word}});
  }
  return j;
}

std::vector<WhitelistEntry> whitelist_from_json(const nlohmann::json &j) {
  if (!j.is_array())
    throw WordListFormatError("whitelist must be a JSON array");

  std::vector<WhitelistEntry> entries;
  for (const auto &item : j) {
    WhitelistEntry entry;
    if (item.is_string()) {
      entry.word = item.get<std::string>();
    } else if (item.is_object()) {
      entry.word = require_string(item, "word", "whitelist entry");
      entry.case_sensitive = optional_bool(item, "caseSensitive", false);
      entry.whole_word = optional_bool(item, "wholeWord", true);
    } else {
      throw WordListFormatError("whitelist entries must be strings or objects");
    }
    if (Utils::trim_copy(entry.word).empty())
      throw WordListFormatError("whitelist entry has an empty 'word'");
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<Pattern> load_word_database(const nlohmann::json &j) {
  if (!j.is_object())
    throw WordListFormatError("word database must be a JSON object");

  std::vector<Pattern> patterns;
  for (const auto &[tag, categories] : j.items()) {
    Language language = language_from_tag(tag);
    if (!categories.is_object())
      throw WordListFormatError("language '" + tag +
                                "' must map categories to word arrays");

    for (const auto &[category, words] : categories.items()) {
      if (!words.is_array())
        throw WordListFormatError("category '" + category +
                                  "' must be an array");
      for (const auto &item : words) {
        if (!item.is_object())
          throw WordListFormatError("word entries must be objects");
        Pattern pattern;
        pattern.word = require_string(item, "word", "word entry");
        pattern.severity =
            severity_from_json(require(item, "severity", "word entry"));
        pattern.category = category;
        pattern.language = language;
        patterns.push_back(pattern);

        if (!item.contains("variations"))
          continue;
        const auto &variations = item["variations"];
        if (!variations.is_array())
          throw WordListFormatError("'variations' must be an array");
        for (const auto &variation : variations) {
          if (!variation.is_string())
            throw WordListFormatError("variations must be strings");
          Pattern variant = pattern;
          variant.word = variation.get<std::string>();
          patterns.push_back(std::move(variant));
        }
      }
    }
  }
  return patterns;
}

std::vector<Pattern> load_word_database_file(const std::string &path) {
  std::ifstream file = open_or_throw(path);
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error &e) {
    throw WordListFormatError("Invalid JSON in '" + path + "': " + e.what());
  }
  std::vector<Pattern> patterns = load_word_database(j);
  LOG(LogLevel::INFO, LogComponent::WORDLIST,
      "Loaded " << patterns.size() << " patterns from " << path);
  return patterns;
}

std::vector<WhitelistEntry> load_whitelist_file(const std::string &path) {
  std::ifstream file = open_or_throw(path);
  std::vector<WhitelistEntry> entries;
  std::string line;
  while (std::getline(file, line)) {
    std::string word = Utils::trim_copy(line);
    if (word.empty() || word[0] == '#')
      continue;
    entries.push_back(WhitelistEntry{word});
  }
  LOG(LogLevel::INFO, LogComponent::WORDLIST,
      "Loaded " << entries.size() << " whitelist entries from " << path);
  return entries;
}

std::string current_timestamp_iso8601() {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
  return oss.str();
}

} // namespace wordguard
