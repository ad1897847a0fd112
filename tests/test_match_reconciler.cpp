#include "core/errors.hpp"
#include "matching/context_filter.hpp"
#include "matching/match_reconciler.hpp"
#include "matching/whitelist.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace wordguard;

namespace {

Match make_match(const std::string &word, size_t position, size_t length,
                 MatchSource source = MatchSource::AUTOMATON) {
  Match match;
  match.word = word;
  match.position = position;
  match.length = length;
  match.source = source;
  return match;
}

} // namespace

// --- Tests for Whitelist ---
TEST(WhitelistTest, AddAndRemoveIgnoreCase) {
  Whitelist whitelist;
  whitelist.add("damn");
  EXPECT_TRUE(whitelist.is_whitelisted("DAMN"));
  EXPECT_TRUE(whitelist.contains("Damn"));

  EXPECT_TRUE(whitelist.remove("DaMn"));
  EXPECT_FALSE(whitelist.is_whitelisted("damn"));
  EXPECT_FALSE(whitelist.remove("damn"));
}

TEST(WhitelistTest, CaseSensitiveEntries) {
  Whitelist whitelist;
  whitelist.add(WhitelistEntry{"Damn", true, true});
  EXPECT_TRUE(whitelist.is_whitelisted("Damn"));
  EXPECT_FALSE(whitelist.is_whitelisted("damn"));
}

TEST(WhitelistTest, WholeWordVersusContainment) {
  Whitelist whole;
  whole.add(WhitelistEntry{"ass", false, true});
  EXPECT_TRUE(whole.is_whitelisted("ass"));
  EXPECT_FALSE(whole.is_whitelisted("asshole"));

  Whitelist partial;
  partial.add(WhitelistEntry{"ass", false, false});
  EXPECT_TRUE(partial.is_whitelisted("asshole"));
}

TEST(WhitelistTest, EntriesAreUnique) {
  Whitelist whitelist;
  whitelist.add("damn");
  whitelist.add(WhitelistEntry{"DAMN", true, true});
  ASSERT_EQ(whitelist.size(), 1u);
  EXPECT_TRUE(whitelist.entries()[0].case_sensitive);
}

TEST(WhitelistTest, RejectsEmptyWords) {
  Whitelist whitelist;
  EXPECT_THROW(whitelist.add("   "), InvalidPatternError);
  EXPECT_THROW(whitelist.add_many({WhitelistEntry{"ok"}, WhitelistEntry{""}}),
               InvalidPatternError);
  EXPECT_TRUE(whitelist.empty());
}

// --- Tests for ContextFilter ---
TEST(ContextFilterTest, SafeContainingWordsOnly) {
  ContextFilter filter;
  EXPECT_TRUE(filter.is_only_in_safe_context(U"this assessment is fine", U"ass"));
  EXPECT_TRUE(filter.is_only_in_safe_context(U"Scunthorpe United", U"cunt"));
  EXPECT_TRUE(filter.is_only_in_safe_context(U"A classic, massive pass.", U"ass"));
}

TEST(ContextFilterTest, StandaloneOrUnsafeOccurrences) {
  ContextFilter filter;
  EXPECT_FALSE(filter.is_only_in_safe_context(U"you ass", U"ass"));
  EXPECT_FALSE(filter.is_only_in_safe_context(U"the class and my ass", U"ass"));
  EXPECT_FALSE(filter.is_only_in_safe_context(U"badass", U"ass"));
}

TEST(ContextFilterTest, AbsentWordIsNotSafeContext) {
  ContextFilter filter;
  EXPECT_FALSE(filter.is_only_in_safe_context(U"hello world", U"ass"));
  EXPECT_FALSE(filter.is_only_in_safe_context(U"", U"ass"));
}

TEST(ContextFilterTest, StandaloneWord) {
  EXPECT_TRUE(
      ContextFilter::exists_as_standalone_word(U"what the HELL!", U"hell"));
  EXPECT_FALSE(
      ContextFilter::exists_as_standalone_word(U"hello shell", U"hell"));
}

TEST(ContextFilterTest, CustomSafeWords) {
  ContextFilter filter(std::vector<std::string>{"Grasshopper"});
  EXPECT_EQ(filter.size(), 1u);
  EXPECT_TRUE(filter.is_safe_word(U"grasshopper"));
  EXPECT_FALSE(filter.is_safe_word(U"class"));
}

// --- Tests for MatchReconciler ---
class MatchReconcilerTest : public ::testing::Test {
protected:
  MatchReconcilerTest() : reconciler(whitelist, context_filter) {}

  Whitelist whitelist;
  ContextFilter context_filter;
  MatchReconciler reconciler;
};

TEST_F(MatchReconcilerTest, MergesOnlyNewWords) {
  std::vector<Match> into = {make_match("damn", 0, 4)};
  MatchReconciler::merge_new_words(
      into, {make_match("DAMN", 0, 4, MatchSource::FUZZY),
             make_match("shit", 5, 4, MatchSource::FUZZY)});
  ASSERT_EQ(into.size(), 2u);
  EXPECT_EQ(into[0].source, MatchSource::AUTOMATON);
  EXPECT_EQ(into[1].word, "shit");
}

TEST_F(MatchReconcilerTest, OrdersByPositionLongestFirst) {
  MatchSets sets;
  sets.automaton = {make_match("ass", 3, 3), make_match("ass", 0, 3),
                    make_match("assassin", 0, 8)};
  auto matches = reconciler.reconcile(U"assassin", std::move(sets), false);

  ASSERT_EQ(matches.size(), 3u);
  EXPECT_EQ(matches[0].length, 8u);
  EXPECT_EQ(matches[1].position, 0u);
  EXPECT_EQ(matches[1].length, 3u);
  EXPECT_EQ(matches[2].position, 3u);
}

TEST_F(MatchReconcilerTest, FuzzyAndStrictAddMissingWords) {
  MatchSets sets;
  sets.automaton = {make_match("damn", 6, 4)};
  sets.fuzzy = {make_match("damn", 6, 4, MatchSource::FUZZY),
                make_match("shit", 0, 5, MatchSource::FUZZY)};
  sets.strict_automaton = {make_match("shit", 0, 5, MatchSource::STRICT_AUTOMATON)};

  auto matches = reconciler.reconcile(U"sh!it damn", std::move(sets), false);
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].word, "shit");
  EXPECT_EQ(matches[0].source, MatchSource::FUZZY);
  EXPECT_EQ(matches[1].source, MatchSource::AUTOMATON);
}

TEST_F(MatchReconcilerTest, DropsWhitelistedWords) {
  whitelist.add("damn");
  MatchSets sets;
  sets.automaton = {make_match("damn", 0, 4), make_match("hell", 5, 4)};

  auto matches = reconciler.reconcile(U"damn hell", std::move(sets), false);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].word, "hell");
}

TEST_F(MatchReconcilerTest, ContextAwareDropsSafeContainment) {
  MatchSets kept_sets;
  kept_sets.fuzzy = {make_match("ass", 4, 3, MatchSource::FUZZY)};
  auto kept =
      reconciler.reconcile(U"the assessment", std::move(kept_sets), false);
  EXPECT_EQ(kept.size(), 1u);

  MatchSets dropped_sets;
  dropped_sets.fuzzy = {make_match("ass", 4, 3, MatchSource::FUZZY)};
  auto dropped =
      reconciler.reconcile(U"the assessment", std::move(dropped_sets), true);
  EXPECT_TRUE(dropped.empty());
}

TEST_F(MatchReconcilerTest, AppliesReplacement) {
  EXPECT_EQ(MatchReconciler::apply_replacement(
                U"X damn Y", {make_match("damn", 2, 4)}, U"*"),
            U"X **** Y");

  std::vector<Match> overlapping = {make_match("ass", 0, 3),
                                    make_match("ass", 3, 3),
                                    make_match("assassin", 0, 8)};
  EXPECT_EQ(MatchReconciler::apply_replacement(U"assassin!", overlapping, U"#"),
            U"########!");

  EXPECT_EQ(MatchReconciler::apply_replacement(U"clean", {}, U"*"), U"clean");
}
