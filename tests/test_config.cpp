#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include "core/config.hpp"
#include "core/logger.hpp"

using wordguard::DetectionStrictness;
using wordguard::Language;
using wordguard::SeverityLevel;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "wordguard_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultValues) {
    Config::ConfigManager manager;
    auto config = manager.get_config();

    EXPECT_TRUE(config->filter.normalize);
    EXPECT_FALSE(config->filter.partial_match);
    EXPECT_FALSE(config->filter.replace_matches);
    EXPECT_EQ(config->filter.replacement_char, "*");
    EXPECT_EQ(config->filter.languages.size(), 2u);
    EXPECT_TRUE(config->filter.categories.empty());
    EXPECT_EQ(config->filter.min_severity, SeverityLevel::MILD);
    EXPECT_EQ(config->filter.max_severity, SeverityLevel::EXTREME);
    EXPECT_FALSE(config->filter.enable_fuzzy_matching);
    EXPECT_EQ(config->filter.strictness, DetectionStrictness::MEDIUM);
    EXPECT_EQ(config->filter.max_edit_distance, 2u);
    EXPECT_FALSE(config->filter.context_aware);
}

// Test [Filter] section parsing
TEST_F(ConfigTest, FilterConfigParsing) {
    std::string config_content = R"(
word_list_path = data/words.json
whitelist_path = data/whitelist.txt

[Filter]
normalize = false
partial_match = yes
replace_matches = on
replacement_char = #
languages = en
categories = profanity, insult
min_severity = moderate
max_severity = 3
enable_fuzzy_matching = true
strictness = high
max_edit_distance = 4
detect_symbol_replacement = false
detect_space_insertion = 0
detect_repeated_letters = true
detect_language_mixing = no
context_aware = true
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->word_list_path, "data/words.json");
    EXPECT_EQ(config->whitelist_path, "data/whitelist.txt");

    const auto& f = config->filter;
    EXPECT_FALSE(f.normalize);
    EXPECT_TRUE(f.partial_match);
    EXPECT_TRUE(f.replace_matches);
    EXPECT_EQ(f.replacement_char, "#");
    ASSERT_EQ(f.languages.size(), 1u);
    EXPECT_EQ(f.languages[0], Language::ENGLISH);
    ASSERT_EQ(f.categories.size(), 2u);
    EXPECT_EQ(f.categories[1], "insult");
    EXPECT_EQ(f.min_severity, SeverityLevel::MODERATE);
    EXPECT_EQ(f.max_severity, SeverityLevel::SEVERE);
    EXPECT_TRUE(f.enable_fuzzy_matching);
    EXPECT_EQ(f.strictness, DetectionStrictness::HIGH);
    EXPECT_EQ(f.max_edit_distance, 4u);
    EXPECT_FALSE(f.detect_symbol_replacement);
    EXPECT_FALSE(f.detect_space_insertion);
    EXPECT_TRUE(f.detect_repeated_letters);
    EXPECT_FALSE(f.detect_language_mixing);
    EXPECT_TRUE(f.context_aware);
}

// Invalid values are reported and the defaults are kept
TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    std::string config_content = R"(
[Filter]
strictness = extreme
languages = en, fr
max_edit_distance = lots
unknown_key = 1
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->filter.strictness, DetectionStrictness::MEDIUM);
    EXPECT_EQ(config->filter.languages.size(), 2u);
    EXPECT_EQ(config->filter.max_edit_distance, 2u);
}

TEST_F(ConfigTest, ValidationFailureKeepsPreviousConfig) {
    std::string good = createTestConfigFile("[Filter]\npartial_match = true\n");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(good));

    std::string bad = createTestConfigFile(R"(
[Filter]
partial_match = false
min_severity = 4
max_severity = 1
)");
    EXPECT_FALSE(manager.load_configuration(bad));
    EXPECT_TRUE(manager.get_config()->filter.partial_match);
}

TEST_F(ConfigTest, MissingFileFails) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "missing.ini").string()));
}

TEST_F(ConfigTest, ValidateFilterConfig) {
    std::vector<std::string> errors;
    Config::FilterConfig config;
    EXPECT_TRUE(Config::validate_filter_config(config, errors));
    EXPECT_TRUE(errors.empty());

    config.replacement_char = "**";
    EXPECT_FALSE(Config::validate_filter_config(config, errors));

    // One code point, several bytes
    config.replacement_char = "█";
    errors.clear();
    EXPECT_TRUE(Config::validate_filter_config(config, errors));

    config.max_edit_distance = 11;
    EXPECT_FALSE(Config::validate_filter_config(config, errors));

    config = Config::FilterConfig{};
    config.categories = {"profanity", " "};
    EXPECT_FALSE(Config::validate_filter_config(config, errors));

    config = Config::FilterConfig{};
    config.strictness = static_cast<DetectionStrictness>(7);
    EXPECT_FALSE(Config::validate_filter_config(config, errors));
}

TEST_F(ConfigTest, Presets) {
    auto balanced = Config::make_balanced_config();
    EXPECT_TRUE(balanced.enable_fuzzy_matching);
    EXPECT_EQ(balanced.strictness, DetectionStrictness::MEDIUM);
    EXPECT_TRUE(balanced.context_aware);

    auto strict = Config::make_strict_config();
    EXPECT_EQ(strict.strictness, DetectionStrictness::HIGH);

    auto paranoid = Config::make_paranoid_config();
    EXPECT_EQ(paranoid.strictness, DetectionStrictness::PARANOID);
    EXPECT_EQ(paranoid.max_edit_distance, 3u);

    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_filter_config(paranoid, errors));
}

// Test [Logging] section parsing
TEST_F(ConfigTest, LoggingConfigParsing) {
    std::string config_content = R"(
[Logging]
default_level = ERROR
match.* = DEBUG
filter = trace
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto& levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::NORMALIZER), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::AUTOMATON), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::FUZZY), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::RECONCILER), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::FILTER), LogLevel::TRACE);
}

TEST_F(ConfigTest, LogLevelNamesIgnoreCaseAndNonAsciiBytes) {
    EXPECT_EQ(Config::string_to_log_level(" warn "), LogLevel::WARN);
    EXPECT_EQ(Config::string_to_log_level("Fatal"), LogLevel::FATAL);
    EXPECT_EQ(Config::string_to_log_level("d\xC3\xA9" "bug"), LogLevel::INFO);
    EXPECT_EQ(Config::string_to_log_level("\xFF\xFE"), LogLevel::INFO);
}

TEST_F(ConfigTest, LoggingDefaults) {
    std::string config_file = createTestConfigFile("\n");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto& levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::INFO);
    EXPECT_EQ(levels.at(LogComponent::WORDLIST), LogLevel::WARN);
}

TEST_F(ConfigTest, CustomSettings) {
    std::string config_file = createTestConfigFile("site_name = forum\n");
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    ASSERT_EQ(config->custom_settings.count("site_name"), 1u);
    EXPECT_EQ(config->custom_settings.at("site_name"), "forum");
}
