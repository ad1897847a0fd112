#include "matching/fuzzy_matcher.hpp"
#include "text/evasion_detector.hpp"
#include "utils/unicode.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace wordguard;

namespace {

bool contains(const std::vector<EvasionTechnique> &techniques,
              EvasionTechnique technique) {
  return std::find(techniques.begin(), techniques.end(), technique) !=
         techniques.end();
}

} // namespace

class FuzzyMatcherTest : public ::testing::Test {
protected:
  FuzzyMatcher matcher_at(DetectionStrictness strictness) const {
    FuzzyMatchOptions options;
    options.strictness = strictness;
    return FuzzyMatcher(normalizer, options);
  }

  Normalizer normalizer;
};

TEST(LevenshteinTest, Distances) {
  EXPECT_EQ(FuzzyMatcher::levenshtein_distance(U"kitten", U"sitting"), 3u);
  EXPECT_EQ(FuzzyMatcher::levenshtein_distance(U"", U"abc"), 3u);
  EXPECT_EQ(FuzzyMatcher::levenshtein_distance(U"fuck", U"fuck"), 0u);
  EXPECT_EQ(FuzzyMatcher::levenshtein_distance(U"كلب", U"قلب"), 1u);
}

TEST_F(FuzzyMatcherTest, LowIsCaseInsensitiveEquality) {
  auto matcher = matcher_at(DetectionStrictness::LOW);

  auto result = matcher.fuzzy_match("FUCK", "fuck");
  EXPECT_TRUE(result.matched);
  EXPECT_DOUBLE_EQ(result.confidence, 1.0);

  EXPECT_FALSE(matcher.fuzzy_match("f@ck", "fuck").matched);
  EXPECT_FALSE(matcher.contains_word("f u c k", "fuck").matched);
}

TEST_F(FuzzyMatcherTest, MediumMatchesAfterEvasionNormalization) {
  auto matcher = matcher_at(DetectionStrictness::MEDIUM);

  auto dotted = matcher.fuzzy_match("f.u.c.k", "fuck");
  EXPECT_TRUE(dotted.matched);
  EXPECT_DOUBLE_EQ(dotted.confidence, 0.95);
  EXPECT_TRUE(
      contains(dotted.evasion_techniques, EvasionTechnique::SPACE_INSERTION));

  EXPECT_TRUE(matcher.fuzzy_match("$h1t", "shit").matched);
  EXPECT_FALSE(matcher.fuzzy_match("f@ck", "fuck").matched);
}

TEST_F(FuzzyMatcherTest, HighAllowsBoundedEditDistance) {
  auto matcher = matcher_at(DetectionStrictness::HIGH);

  auto result = matcher.fuzzy_match("fuk", "fuck");
  EXPECT_TRUE(result.matched);
  EXPECT_DOUBLE_EQ(result.confidence, 0.75);

  EXPECT_TRUE(matcher.fuzzy_match("f@ck", "fuck").matched);
  EXPECT_FALSE(matcher.fuzzy_match("hello", "fuck").matched);
}

TEST_F(FuzzyMatcherTest, ParanoidUsesStrictNormalization) {
  auto matcher = matcher_at(DetectionStrictness::PARANOID);

  auto equal = matcher.fuzzy_match("fuuuuuck", "fuck");
  EXPECT_TRUE(equal.matched);
  EXPECT_DOUBLE_EQ(equal.confidence, 0.99);
  EXPECT_EQ(equal.searched_text, SearchedText::STRICT_NORMALIZED);

  auto inside = matcher.fuzzy_match("xxfuckxx", "fuck");
  EXPECT_TRUE(inside.matched);
  EXPECT_DOUBLE_EQ(inside.confidence, 0.95);
  EXPECT_EQ(inside.span.begin, 2u);
  EXPECT_EQ(inside.span.end, 6u);
  EXPECT_EQ(inside.searched_position, 1u);

  auto near = matcher.fuzzy_match("f@ck", "fuck");
  EXPECT_TRUE(near.matched);
  EXPECT_DOUBLE_EQ(near.confidence, 0.75);
}

TEST_F(FuzzyMatcherTest, ContainsWordReportsTokenSpan) {
  auto matcher = matcher_at(DetectionStrictness::MEDIUM);

  auto result = matcher.contains_word("you are a f.u.c.k idiot", "fuck");
  ASSERT_TRUE(result.matched);
  EXPECT_EQ(result.span.begin, 10u);
  EXPECT_EQ(result.span.end, 17u);
  EXPECT_EQ(result.searched_text, SearchedText::ORIGINAL);
  EXPECT_EQ(result.searched_position, 10u);
}

TEST_F(FuzzyMatcherTest, ContainsWordFallsBackToWholeText) {
  auto matcher = matcher_at(DetectionStrictness::MEDIUM);

  auto result = matcher.contains_word("f u c k you", "fuck");
  ASSERT_TRUE(result.matched);
  EXPECT_DOUBLE_EQ(result.confidence, 0.9);
  EXPECT_EQ(result.span.begin, 0u);
  EXPECT_EQ(result.span.end, 7u);
  EXPECT_EQ(result.searched_text, SearchedText::EVASION_NORMALIZED);
  EXPECT_TRUE(
      contains(result.evasion_techniques, EvasionTechnique::SPACE_INSERTION));

  EXPECT_FALSE(matcher.contains_word("have a nice day", "fuck").matched);
}

TEST_F(FuzzyMatcherTest, FindAllReportsOneMatchPerPattern) {
  auto matcher = matcher_at(DetectionStrictness::MEDIUM);
  std::vector<Pattern> patterns = {{"fuck", SeverityLevel::SEVERE, "profanity",
                                    Language::ENGLISH},
                                   {"shit", SeverityLevel::MODERATE,
                                    "profanity", Language::ENGLISH},
                                   {"damn", SeverityLevel::MILD, "profanity",
                                    Language::ENGLISH}};

  auto matches = matcher.find_all(U"what the $h1t", patterns);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].word, "shit");
  EXPECT_EQ(matches[0].position, 9u);
  EXPECT_EQ(matches[0].length, 4u);
  EXPECT_EQ(matches[0].source, MatchSource::FUZZY);
  ASSERT_TRUE(matches[0].confidence.has_value());
  EXPECT_DOUBLE_EQ(*matches[0].confidence, 0.95);
  EXPECT_TRUE(contains(matches[0].evasion_techniques,
                       EvasionTechnique::SYMBOL_REPLACEMENT));
  EXPECT_TRUE(contains(matches[0].evasion_techniques,
                       EvasionTechnique::NUMERAL_SUBSTITUTION));

  EXPECT_EQ(matcher.find_all(U"shit shit", patterns).size(), 1u);
}

TEST_F(FuzzyMatcherTest, ArabicTokenWithPunctuationKeepsItsScript) {
  auto matcher = matcher_at(DetectionStrictness::PARANOID);

  auto result = matcher.fuzzy_match("كلب!", "كلب");
  EXPECT_TRUE(result.matched);
  EXPECT_DOUBLE_EQ(result.confidence, 0.99);
  EXPECT_FALSE(matcher.contains_word("هذه أسس مهمة!", "ass").matched);
}

TEST_F(FuzzyMatcherTest, FindAllAgreesWithContainsWord) {
  const std::u32string text = U"you f.u.c.k, what the $h1t and f u c k again";
  std::vector<Pattern> patterns = {
      {"fuck", SeverityLevel::SEVERE, "profanity", Language::ENGLISH},
      {"shit", SeverityLevel::MODERATE, "profanity", Language::ENGLISH},
      {"damn", SeverityLevel::MILD, "profanity", Language::ENGLISH}};

  for (auto strictness :
       {DetectionStrictness::LOW, DetectionStrictness::MEDIUM,
        DetectionStrictness::HIGH, DetectionStrictness::PARANOID}) {
    auto matcher = matcher_at(strictness);
    auto matches = matcher.find_all(text, patterns);
    for (const auto &pattern : patterns) {
      auto single = matcher.contains_word(
          text, std::u32string_view(Utils::to_utf32(pattern.word)));
      auto found = std::find_if(
          matches.begin(), matches.end(),
          [&](const Match &m) { return m.word == pattern.word; });
      ASSERT_EQ(found != matches.end(), single.matched) << pattern.word;
      if (!single.matched)
        continue;
      EXPECT_EQ(found->position, single.span.begin) << pattern.word;
      EXPECT_EQ(found->length, single.span.length()) << pattern.word;
      EXPECT_EQ(found->searched_text, single.searched_text) << pattern.word;
      EXPECT_DOUBLE_EQ(*found->confidence, single.confidence) << pattern.word;
    }
  }
}

TEST_F(FuzzyMatcherTest, FindAllScalesWithManyPatternsAndLongText) {
  std::vector<Pattern> patterns;
  for (int i = 0; i < 200; ++i)
    patterns.push_back({"xq" + std::to_string(i), SeverityLevel::MILD,
                        "profanity", Language::ENGLISH});
  patterns.push_back(
      {"fuck", SeverityLevel::SEVERE, "profanity", Language::ENGLISH});

  std::u32string text;
  for (int i = 0; i < 650; ++i)
    text += U"the quick brown fox jumps over the lazy dog ";
  text += U"f.u.c.k";

  for (auto strictness :
       {DetectionStrictness::MEDIUM, DetectionStrictness::HIGH}) {
    auto matcher = matcher_at(strictness);
    auto start = std::chrono::steady_clock::now();
    auto matches = matcher.find_all(text, patterns);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].word, "fuck");
    EXPECT_LT(elapsed.count(), 1000);
  }
}

// --- Tests for evasion technique tagging ---
TEST(EvasionDetectorTest, TagsTechniques) {
  using T = EvasionTechnique;
  EXPECT_EQ(detect_evasion_techniques(U"f@ck"),
            (std::vector<T>{T::SYMBOL_REPLACEMENT, T::CHARACTER_SUBSTITUTION}));
  EXPECT_EQ(detect_evasion_techniques(U"fuuuuck"),
            std::vector<T>{T::REPEATED_LETTERS});
  EXPECT_TRUE(detect_evasion_techniques(U"fuuuck").empty());
  EXPECT_EQ(
      detect_evasion_techniques(U"sh1t"),
      (std::vector<T>{T::NUMERAL_SUBSTITUTION, T::CHARACTER_SUBSTITUTION}));
  EXPECT_EQ(detect_evasion_techniques(U"شit"),
            std::vector<T>{T::LANGUAGE_MIXING});
  EXPECT_EQ(detect_evasion_techniques(U"f u c k"),
            std::vector<T>{T::SPACE_INSERTION});
  EXPECT_TRUE(detect_evasion_techniques(U"plain").empty());
}
