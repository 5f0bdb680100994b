// Tests for text/pattern_set.h -- compiled ICU patterns.

#include "text/pattern_set.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_helpers.h"

namespace quill {
namespace {

using test_helpers::sharedPatterns;
using test_helpers::toStrings;

TEST(PatternSetTest, CompileSucceeds) {
  std::string error;
  auto patterns = PatternSet::compile(&error);
  ASSERT_TRUE(patterns.has_value());
  EXPECT_TRUE(error.empty());
}

TEST(PatternSetTest, PatternNames) {
  EXPECT_STREQ(patternIdToString(PatternId::Word), "word");
  EXPECT_STREQ(patternIdToString(PatternId::PassiveVoice), "passive_voice");
  EXPECT_STREQ(patternIdToString(PatternId::Dialogue), "dialogue");
  EXPECT_STREQ(patternSource(PatternId::SentenceTerminator), "[.!?]+");
}

// ---------------------------------------------------------------------------
// Word
// ---------------------------------------------------------------------------

TEST(PatternSetTest, WordSpansAreByteOffsets) {
  std::vector<TextSpan> spans = sharedPatterns().findAll(PatternId::Word, "caf\xC3\xA9 au lait");
  ASSERT_EQ(spans.size(), 3u);
  EXPECT_EQ(spans[0], (TextSpan{0, 5}));
  EXPECT_EQ(spans[1], (TextSpan{6, 8}));
  EXPECT_EQ(spans[2], (TextSpan{9, 13}));
}

TEST(PatternSetTest, ApostropheSplitsWords) {
  EXPECT_EQ(sharedPatterns().countMatches(PatternId::Word, "Don't stop"), 3u);
}

TEST(PatternSetTest, NoMatchesInPunctuation) {
  EXPECT_EQ(sharedPatterns().countMatches(PatternId::Word, "... !? --"), 0u);
  EXPECT_EQ(sharedPatterns().countMatches(PatternId::Word, ""), 0u);
}

// ---------------------------------------------------------------------------
// Passive voice
// ---------------------------------------------------------------------------

TEST(PatternSetTest, PassiveVoiceSpan) {
  std::vector<TextSpan> spans =
      sharedPatterns().findAll(PatternId::PassiveVoice, "The ball was kicked");
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0], (TextSpan{9, 19}));
}

TEST(PatternSetTest, PassiveVoiceAuxiliaries) {
  std::vector<TextSpan> spans =
      sharedPatterns().findAll(PatternId::PassiveVoice, "They were being watched");
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0], (TextSpan{10, 23}));
  EXPECT_EQ(sharedPatterns().countMatches(PatternId::PassiveVoice, "It was   tired"), 1u);
}

TEST(PatternSetTest, PassiveVoiceNonMatches) {
  const PatternSet& patterns = sharedPatterns();
  EXPECT_EQ(patterns.countMatches(PatternId::PassiveVoice, "Was kicked"), 0u);
  EXPECT_EQ(patterns.countMatches(PatternId::PassiveVoice, "wasted time"), 0u);
  EXPECT_EQ(patterns.countMatches(PatternId::PassiveVoice, "The ball was thrown"), 0u);
}

// ---------------------------------------------------------------------------
// Adverb / dialogue
// ---------------------------------------------------------------------------

TEST(PatternSetTest, AdverbSpans) {
  std::vector<TextSpan> spans =
      sharedPatterns().findAll(PatternId::Adverb, "He ran quickly and fly");
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0], (TextSpan{7, 14}));
  EXPECT_EQ(spans[1], (TextSpan{19, 22}));
}

TEST(PatternSetTest, AdverbIsCaseSensitive) {
  EXPECT_EQ(sharedPatterns().countMatches(PatternId::Adverb, "QUICKLY"), 0u);
}

TEST(PatternSetTest, DialogueSpans) {
  std::string text = "\"Hi,\" she said. \"Bye.\"";
  std::vector<TextSpan> spans = sharedPatterns().findAll(PatternId::Dialogue, text);
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_EQ(spans[0], (TextSpan{0, 5}));
  EXPECT_EQ(spans[1], (TextSpan{16, 22}));
  EXPECT_EQ(sharedPatterns().countMatches(PatternId::Dialogue, "an \"open quote"), 0u);
}

// ---------------------------------------------------------------------------
// split
// ---------------------------------------------------------------------------

TEST(PatternSetTest, SplitKeepsEmptyFragments) {
  std::vector<std::string> fragments =
      toStrings(sharedPatterns().split(PatternId::SentenceTerminator, "One. Two!"));
  EXPECT_EQ(fragments, (std::vector<std::string>{"One", " Two", ""}));
}

TEST(PatternSetTest, SplitGroupsTerminatorRuns) {
  std::vector<std::string> fragments =
      toStrings(sharedPatterns().split(PatternId::SentenceTerminator, "Wait...what?!"));
  EXPECT_EQ(fragments, (std::vector<std::string>{"Wait", "what", ""}));
}

TEST(PatternSetTest, SplitWithoutMatch) {
  std::vector<std::string> fragments =
      toStrings(sharedPatterns().split(PatternId::SentenceTerminator, "no terminator"));
  EXPECT_EQ(fragments, (std::vector<std::string>{"no terminator"}));

  fragments = toStrings(sharedPatterns().split(PatternId::SentenceTerminator, ""));
  EXPECT_EQ(fragments, (std::vector<std::string>{""}));
}

TEST(PatternSetTest, SplitParagraphs) {
  std::vector<std::string> fragments =
      toStrings(sharedPatterns().split(PatternId::ParagraphBreak, "A.\n \t\nB.\nC."));
  EXPECT_EQ(fragments, (std::vector<std::string>{"A.", "B.\nC."}));
}

}  // namespace
}  // namespace quill
