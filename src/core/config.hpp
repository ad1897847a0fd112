#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *WORD_LIST_PATH = "word_list_path";
constexpr const char *WHITELIST_PATH = "whitelist_path";

// Filter Settings
constexpr const char *F_NORMALIZE = "normalize";
constexpr const char *F_PARTIAL_MATCH = "partial_match";
constexpr const char *F_REPLACE_MATCHES = "replace_matches";
constexpr const char *F_REPLACEMENT_CHAR = "replacement_char";
constexpr const char *F_LANGUAGES = "languages";
constexpr const char *F_CATEGORIES = "categories";
constexpr const char *F_MIN_SEVERITY = "min_severity";
constexpr const char *F_MAX_SEVERITY = "max_severity";
constexpr const char *F_ENABLE_FUZZY_MATCHING = "enable_fuzzy_matching";
constexpr const char *F_STRICTNESS = "strictness";
constexpr const char *F_MAX_EDIT_DISTANCE = "max_edit_distance";
constexpr const char *F_DETECT_SYMBOL_REPLACEMENT = "detect_symbol_replacement";
constexpr const char *F_DETECT_SPACE_INSERTION = "detect_space_insertion";
constexpr const char *F_DETECT_REPEATED_LETTERS = "detect_repeated_letters";
constexpr const char *F_DETECT_LANGUAGE_MIXING = "detect_language_mixing";
constexpr const char *F_CONTEXT_AWARE = "context_aware";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct FilterConfig {
  bool normalize = true;
  bool partial_match = false;
  bool replace_matches = false;
  std::string replacement_char = "*";

  // Patterns without a language are always active
  std::vector<wordguard::Language> languages = {wordguard::Language::ENGLISH,
                                                wordguard::Language::ARABIC};
  // Empty means every category
  std::vector<std::string> categories;
  wordguard::SeverityLevel min_severity = wordguard::SeverityLevel::MILD;
  wordguard::SeverityLevel max_severity = wordguard::SeverityLevel::EXTREME;

  bool enable_fuzzy_matching = false;
  wordguard::DetectionStrictness strictness =
      wordguard::DetectionStrictness::MEDIUM;
  size_t max_edit_distance = 2;
  bool detect_symbol_replacement = true;
  bool detect_space_insertion = true;
  bool detect_repeated_letters = true;
  bool detect_language_mixing = true;

  // Suppress matches found only inside known innocent words
  bool context_aware = false;
};

struct AppConfig {
  std::string word_list_path;
  std::string whitelist_path;

  FilterConfig filter;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Medium strictness with fuzzy matching and context awareness
FilterConfig make_balanced_config();
// High strictness with fuzzy matching
FilterConfig make_strict_config();
// Maximum recall
FilterConfig make_paranoid_config();

LogLevel string_to_log_level(const std::string &level_str_raw);

// Validation functions for configuration parameters
bool validate_filter_config(const FilterConfig &config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Parses an INI file on top of the defaults already in `config`. Problems are
// reported on stderr; returns false only when the file cannot be read.
bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
