#include "core/errors.hpp"
#include "io/word_list_codec.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace wordguard;

class WordListCodecTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "wordguard_codec_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir))
      std::filesystem::remove_all(test_dir);
  }

  std::string write_file(const std::string &name, const std::string &content) {
    auto path = test_dir / name;
    std::ofstream file(path);
    file << content;
    file.close();
    return path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(WordListCodecTest, ExportedListParsesBack) {
  WordListExport list;
  list.exported_at = "2024-01-01T00:00:00.000Z";
  list.words = {{"damn", SeverityLevel::MILD, "profanity", Language::ENGLISH},
                {"كلب", SeverityLevel::MODERATE, "insult", Language::ARABIC},
                {"heck", SeverityLevel::MILD, "", Language::UNSPECIFIED}};

  std::string text = serialize_word_list(list);
  auto j = nlohmann::json::parse(text);
  EXPECT_EQ(j["version"].get<std::string>(), "1.0.0");
  EXPECT_EQ(j["exportedAt"].get<std::string>(), "2024-01-01T00:00:00.000Z");
  EXPECT_FALSE(j["words"][2].contains("language"));
  EXPECT_FALSE(j["words"][2].contains("category"));

  WordListExport parsed = parse_word_list(text);
  ASSERT_EQ(parsed.words.size(), 3u);
  EXPECT_EQ(parsed.words[1].word, "كلب");
  EXPECT_EQ(parsed.words[1].language, Language::ARABIC);
  EXPECT_EQ(parsed.words[1].severity, SeverityLevel::MODERATE);
  EXPECT_EQ(parsed.words[2].language, Language::UNSPECIFIED);
}

TEST_F(WordListCodecTest, RejectsMalformedLists) {
  EXPECT_THROW(parse_word_list("not json"), WordListFormatError);
  EXPECT_THROW(parse_word_list("[]"), WordListFormatError);
  EXPECT_THROW(parse_word_list(R"({"words": []})"), WordListFormatError);
  EXPECT_THROW(parse_word_list(R"({"version": "1.0.0"})"), WordListFormatError);
  EXPECT_THROW(parse_word_list(R"({"version": "1.0.0", "words": {}})"),
               WordListFormatError);
}

TEST_F(WordListCodecTest, RejectsMalformedWords) {
  auto with_word = [](const std::string &word_json) {
    return R"({"version": "1.0.0", "words": [)" + word_json + "]}";
  };
  EXPECT_THROW(parse_word_list(with_word(R"({"severity": 1})")),
               WordListFormatError);
  EXPECT_THROW(parse_word_list(with_word(R"({"word": "x"})")),
               WordListFormatError);
  EXPECT_THROW(parse_word_list(with_word(R"({"word": "x", "severity": 7})")),
               WordListFormatError);
  EXPECT_THROW(parse_word_list(with_word(R"({"word": "x", "severity": "1"})")),
               WordListFormatError);
  EXPECT_THROW(
      parse_word_list(with_word(R"({"word": "x", "severity": 1, "language": "fr"})")),
      WordListFormatError);
  EXPECT_THROW(parse_word_list(with_word(R"({"word": " ", "severity": 1})")),
               WordListFormatError);
  EXPECT_NO_THROW(parse_word_list(with_word(R"({"word": "x", "severity": 4})")));
}

TEST_F(WordListCodecTest, LoadsWordDatabaseWithVariations) {
  auto j = nlohmann::json::parse(R"({
    "en": {"profanity": [{"word": "damn", "severity": 1, "variations": ["dammit"]}]},
    "ar": {"insult": [{"word": "كلب", "severity": 2}]}
  })");

  auto patterns = load_word_database(j);
  ASSERT_EQ(patterns.size(), 3u);

  // nlohmann::json objects iterate in key order
  EXPECT_EQ(patterns[0].word, "كلب");
  EXPECT_EQ(patterns[0].language, Language::ARABIC);
  EXPECT_EQ(patterns[0].category, "insult");

  EXPECT_EQ(patterns[2].word, "dammit");
  EXPECT_EQ(patterns[2].severity, SeverityLevel::MILD);
  EXPECT_EQ(patterns[2].category, "profanity");
  EXPECT_EQ(patterns[2].language, Language::ENGLISH);
}

TEST_F(WordListCodecTest, RejectsUnknownDatabaseLanguage) {
  auto j = nlohmann::json::parse(R"({"xx": {"profanity": []}})");
  EXPECT_THROW(load_word_database(j), WordListFormatError);
  EXPECT_THROW(load_word_database(nlohmann::json::array()), WordListFormatError);
}

TEST_F(WordListCodecTest, LoadsWordDatabaseFile) {
  std::string path = write_file(
      "words.json", R"({"en": {"mild": [{"word": "heck", "severity": 1}]}})");
  auto patterns = load_word_database_file(path);
  ASSERT_EQ(patterns.size(), 1u);
  EXPECT_EQ(patterns[0].word, "heck");

  EXPECT_THROW(load_word_database_file(write_file("bad.json", "{")),
               WordListFormatError);
  EXPECT_THROW(load_word_database_file((test_dir / "missing.json").string()),
               WordListFormatError);
}

TEST_F(WordListCodecTest, WhitelistJson) {
  auto j = nlohmann::json::parse(
      R"(["scunthorpe", {"word": "Damn", "caseSensitive": true, "wholeWord": false}])");
  auto entries = whitelist_from_json(j);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].word, "scunthorpe");
  EXPECT_FALSE(entries[0].case_sensitive);
  EXPECT_TRUE(entries[0].whole_word);
  EXPECT_TRUE(entries[1].case_sensitive);
  EXPECT_FALSE(entries[1].whole_word);

  auto out = whitelist_to_json(entries);
  EXPECT_EQ(out[1]["word"].get<std::string>(), "Damn");
  EXPECT_TRUE(out[1]["caseSensitive"].get<bool>());

  EXPECT_THROW(whitelist_from_json(nlohmann::json::parse("[1]")),
               WordListFormatError);
  EXPECT_THROW(whitelist_from_json(nlohmann::json::parse(R"([{"word": ""}])")),
               WordListFormatError);
}

TEST_F(WordListCodecTest, LoadsWhitelistFile) {
  std::string path =
      write_file("whitelist.txt", "# place names\n\n  scunthorpe  \npenistone\n");
  auto entries = load_whitelist_file(path);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].word, "scunthorpe");
  EXPECT_EQ(entries[1].word, "penistone");
}

TEST_F(WordListCodecTest, TimestampFormat) {
  std::string timestamp = current_timestamp_iso8601();
  ASSERT_EQ(timestamp.size(), 24u);
  EXPECT_EQ(timestamp[10], 'T');
  EXPECT_EQ(timestamp.back(), 'Z');
}
