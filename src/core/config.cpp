#include "config.hpp"
#include "logger.hpp"
#include "utils/unicode.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

using wordguard::DetectionStrictness;
using wordguard::Language;
using wordguard::SeverityLevel;

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::toupper(ch));
                 });
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"text.normalizer", LogComponent::NORMALIZER},
    {"match.automaton", LogComponent::AUTOMATON},
    {"match.fuzzy", LogComponent::FUZZY},
    {"match.reconciler", LogComponent::RECONCILER},
    {"filter", LogComponent::FILTER},
    {"io.wordlist", LogComponent::WORDLIST}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_ascii(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

DetectionStrictness string_to_strictness(const std::string &value) {
  std::string s = Utils::to_lower_ascii(Utils::trim_copy(value));
  if (s == "low" || s == "1")
    return DetectionStrictness::LOW;
  if (s == "medium" || s == "2")
    return DetectionStrictness::MEDIUM;
  if (s == "high" || s == "3")
    return DetectionStrictness::HIGH;
  if (s == "paranoid" || s == "4")
    return DetectionStrictness::PARANOID;
  throw std::invalid_argument("expected low, medium, high or paranoid");
}

SeverityLevel string_to_severity(const std::string &value) {
  std::string s = Utils::to_lower_ascii(Utils::trim_copy(value));
  if (s == "mild" || s == "1")
    return SeverityLevel::MILD;
  if (s == "moderate" || s == "2")
    return SeverityLevel::MODERATE;
  if (s == "severe" || s == "3")
    return SeverityLevel::SEVERE;
  if (s == "extreme" || s == "4")
    return SeverityLevel::EXTREME;
  throw std::invalid_argument("expected a severity between 1 and 4");
}

std::vector<Language> string_to_languages(const std::string &value) {
  std::vector<Language> languages;
  for (const auto &part : Utils::split_string(value, ',')) {
    std::string tag = Utils::trim_copy(part);
    if (tag.empty())
      continue;
    auto language = wordguard::parse_language(tag);
    if (!language)
      throw std::invalid_argument("unsupported language '" + tag + "'");
    languages.push_back(*language);
  }
  return languages;
}

std::vector<std::string> string_to_list(const std::string &value) {
  std::vector<std::string> items;
  for (const auto &part : Utils::split_string(value, ',')) {
    std::string item = Utils::trim_copy(part);
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

FilterConfig make_balanced_config() {
  FilterConfig config;
  config.enable_fuzzy_matching = true;
  config.strictness = DetectionStrictness::MEDIUM;
  config.context_aware = true;
  return config;
}

FilterConfig make_strict_config() {
  FilterConfig config;
  config.enable_fuzzy_matching = true;
  config.strictness = DetectionStrictness::HIGH;
  return config;
}

FilterConfig make_paranoid_config() {
  FilterConfig config;
  config.enable_fuzzy_matching = true;
  config.strictness = DetectionStrictness::PARANOID;
  config.max_edit_distance = 3;
  return config;
}

bool validate_filter_config(const FilterConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (Utils::to_utf32(config.replacement_char).size() != 1) {
    errors.push_back("Replacement character must be exactly one character");
    valid = false;
  }

  int min_severity = static_cast<int>(config.min_severity);
  int max_severity = static_cast<int>(config.max_severity);
  if (min_severity < 1 || min_severity > 4 || max_severity < 1 ||
      max_severity > 4) {
    errors.push_back("Severity bounds must be between 1 and 4");
    valid = false;
  } else if (min_severity > max_severity) {
    errors.push_back("Minimum severity must not exceed maximum severity");
    valid = false;
  }

  int strictness = static_cast<int>(config.strictness);
  if (strictness < 1 || strictness > 4) {
    errors.push_back("Strictness must be between 1 (low) and 4 (paranoid)");
    valid = false;
  }

  if (config.max_edit_distance > 10) {
    errors.push_back("Max edit distance must be between 0 and 10");
    valid = false;
  }

  for (const auto &category : config.categories) {
    if (Utils::trim_copy(category).empty()) {
      errors.push_back("Category filters must not be empty");
      valid = false;
      break;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  return validate_filter_config(config.filter, errors);
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::WORD_LIST_PATH)
          config.word_list_path = value;
        else if (key == Keys::WHITELIST_PATH)
          config.whitelist_path = value;
        else
          config.custom_settings[key] = value;

        // Filter settings
      } else if (current_section == "Filter") {
        FilterConfig &f = config.filter;
        if (key == Keys::F_NORMALIZE)
          f.normalize = string_to_bool(value);
        else if (key == Keys::F_PARTIAL_MATCH)
          f.partial_match = string_to_bool(value);
        else if (key == Keys::F_REPLACE_MATCHES)
          f.replace_matches = string_to_bool(value);
        else if (key == Keys::F_REPLACEMENT_CHAR)
          f.replacement_char = value;
        else if (key == Keys::F_LANGUAGES)
          f.languages = string_to_languages(value);
        else if (key == Keys::F_CATEGORIES)
          f.categories = string_to_list(value);
        else if (key == Keys::F_MIN_SEVERITY)
          f.min_severity = string_to_severity(value);
        else if (key == Keys::F_MAX_SEVERITY)
          f.max_severity = string_to_severity(value);
        else if (key == Keys::F_ENABLE_FUZZY_MATCHING)
          f.enable_fuzzy_matching = string_to_bool(value);
        else if (key == Keys::F_STRICTNESS)
          f.strictness = string_to_strictness(value);
        else if (key == Keys::F_MAX_EDIT_DISTANCE)
          f.max_edit_distance = Utils::string_to_number<size_t>(value).value_or(
              f.max_edit_distance);
        else if (key == Keys::F_DETECT_SYMBOL_REPLACEMENT)
          f.detect_symbol_replacement = string_to_bool(value);
        else if (key == Keys::F_DETECT_SPACE_INSERTION)
          f.detect_space_insertion = string_to_bool(value);
        else if (key == Keys::F_DETECT_REPEATED_LETTERS)
          f.detect_repeated_letters = string_to_bool(value);
        else if (key == Keys::F_DETECT_LANGUAGE_MIXING)
          f.detect_language_mixing = string_to_bool(value);
        else if (key == Keys::F_CONTEXT_AWARE)
          f.context_aware = string_to_bool(value);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown key '" << key << "' in [Filter]."
                    << std::endl;

        // Logging settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "match.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }
      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown section [" << current_section << "]."
                  << std::endl;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
