// Tests for engine.h -- TextEngine construction and the four operations.

#include "engine.h"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "test_helpers.h"

namespace quill {
namespace {

using test_helpers::repeatWord;

constexpr const char* kSampleText = "This is a test. This is another test!";

TextEngine makeEngine(const EngineConfig& config = EngineConfig()) {
  std::string error;
  std::optional<TextEngine> engine = TextEngine::create(config, &error);
  EXPECT_TRUE(engine.has_value()) << error;
  return std::move(engine.value());
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(EngineConfigTest, DefaultsAreValid) {
  EngineConfig config;
  EXPECT_EQ(config.long_sentence_word_limit, 25u);
  EXPECT_EQ(config.suggestion_position_stride, 50u);
  EXPECT_FALSE(config.verbose);
  EXPECT_TRUE(validateConfig(config));
}

TEST(EngineConfigTest, RejectsZeroLimit) {
  EngineConfig config;
  config.long_sentence_word_limit = 0;
  std::string error;
  EXPECT_FALSE(validateConfig(config, &error));
  EXPECT_EQ(error, "long_sentence_word_limit must be positive");

  EXPECT_FALSE(TextEngine::create(config).has_value());
}

TEST(EngineConfigTest, RejectsZeroStride) {
  EngineConfig config;
  config.suggestion_position_stride = 0;
  std::string error;
  EXPECT_FALSE(TextEngine::create(config, &error).has_value());
  EXPECT_EQ(error, "suggestion_position_stride must be positive");
}

TEST(EngineTest, KeepsConfig) {
  EngineConfig config;
  config.long_sentence_word_limit = 10;
  TextEngine engine = makeEngine(config);
  EXPECT_EQ(engine.config().long_sentence_word_limit, 10u);
}

// ---------------------------------------------------------------------------
// analyzeText
// ---------------------------------------------------------------------------

TEST(EngineTest, AnalyzeSampleText) {
  TextEngine engine = makeEngine();
  AnalysisResult result = engine.analyzeText(kSampleText);

  EXPECT_EQ(result.word_count, 8u);
  EXPECT_EQ(result.sentence_count, 2u);
  EXPECT_EQ(result.paragraph_count, 1u);
  EXPECT_EQ(result.character_count, 37u);
  EXPECT_NEAR(result.readability_score, 97.025, 1e-9);
  EXPECT_DOUBLE_EQ(result.readability_score, result.complexity_metrics.flesch_reading_ease);
  EXPECT_DOUBLE_EQ(result.complexity_metrics.avg_words_per_sentence, 4.0);
  EXPECT_DOUBLE_EQ(result.complexity_metrics.avg_syllables_per_word, 1.25);
  EXPECT_NEAR(result.complexity_metrics.fog_index, 6.6, 1e-9);
  EXPECT_DOUBLE_EQ(result.complexity_metrics.unique_word_ratio, 0.625);
  EXPECT_DOUBLE_EQ(result.style_metrics.passive_voice_ratio, 0.0);
  EXPECT_DOUBLE_EQ(result.style_metrics.adverb_ratio, 0.0);
  EXPECT_EQ(result.content_hash, "5XpJJnlB/5V8l4Vn1sNIq0wh7IJ6mvsDqyYjmmPIZd0=");
}

TEST(EngineTest, AnalyzeEmptyText) {
  TextEngine engine = makeEngine();
  AnalysisResult result = engine.analyzeText("");

  EXPECT_EQ(result.word_count, 0u);
  EXPECT_EQ(result.sentence_count, 0u);
  EXPECT_EQ(result.paragraph_count, 0u);
  EXPECT_EQ(result.character_count, 0u);
  EXPECT_DOUBLE_EQ(result.readability_score, 206.835);
  EXPECT_DOUBLE_EQ(result.complexity_metrics.fog_index, 0.0);
  EXPECT_DOUBLE_EQ(result.complexity_metrics.unique_word_ratio, 0.0);
  EXPECT_DOUBLE_EQ(result.style_metrics.dialogue_ratio, 0.0);
  EXPECT_EQ(result.content_hash, "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
}

TEST(EngineTest, AnalyzeCountsCodePoints) {
  TextEngine engine = makeEngine();
  AnalysisResult result = engine.analyzeText("Caf\xC3\xA9 na\xC3\xAFve.");
  EXPECT_EQ(result.character_count, 11u);
  EXPECT_EQ(result.word_count, 2u);
}

TEST(EngineTest, AnalyzeStyle) {
  TextEngine engine = makeEngine();
  AnalysisResult result = engine.analyzeText("The ball was kicked. It was quickly done.");
  EXPECT_EQ(result.word_count, 8u);
  EXPECT_EQ(result.sentence_count, 2u);
  EXPECT_DOUBLE_EQ(result.style_metrics.passive_voice_ratio, 0.5);
  EXPECT_DOUBLE_EQ(result.style_metrics.adverb_ratio, 0.125);
}

TEST(EngineTest, AnalyzeIsDeterministic) {
  TextEngine engine = makeEngine();
  AnalysisResult first = engine.analyzeText(kSampleText);
  AnalysisResult second = engine.analyzeText(kSampleText);
  EXPECT_EQ(first.content_hash, second.content_hash);
  EXPECT_EQ(first.word_count, second.word_count);
  EXPECT_DOUBLE_EQ(first.readability_score, second.readability_score);
}

// ---------------------------------------------------------------------------
// optimizeText
// ---------------------------------------------------------------------------

TEST(EngineTest, OptimizeUsesConfiguredLimit) {
  std::string text = repeatWord("word", 12) + ".";

  TextEngine default_engine = makeEngine();
  EXPECT_TRUE(default_engine.optimizeText(text).empty());

  EngineConfig config;
  config.long_sentence_word_limit = 10;
  config.suggestion_position_stride = 20;
  TextEngine strict_engine = makeEngine(config);
  std::vector<OptimizationSuggestion> found = strict_engine.optimizeText(text);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].type, SuggestionType::SentenceLength);
  EXPECT_EQ(found[0].end_pos, 20u);
}

TEST(EngineTest, OptimizePassiveVoice) {
  TextEngine engine = makeEngine();
  std::vector<OptimizationSuggestion> found = engine.optimizeText("The ball was kicked");
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].type, SuggestionType::PassiveVoice);
  EXPECT_EQ(found[0].start_pos, 9u);
  EXPECT_EQ(found[0].end_pos, 19u);
}

TEST(EngineTest, OptimizeEmptyText) {
  EXPECT_TRUE(makeEngine().optimizeText("").empty());
}

// ---------------------------------------------------------------------------
// resolveConflicts / generateContentHash
// ---------------------------------------------------------------------------

TEST(EngineTest, ResolveConflicts) {
  CollaborationConflict conflict;
  conflict.conflict_id = "c1";
  conflict.conflict_type = "text_insertion";
  conflict.user_a_change = "Hello";
  conflict.user_b_change = "World";

  std::vector<CollaborationConflict> resolved = makeEngine().resolveConflicts({conflict});
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].resolution_suggestion, "Hello World");
  EXPECT_EQ(resolved[0].conflict_id, "c1");
}

TEST(EngineTest, ContentHashMatchesAnalysis) {
  TextEngine engine = makeEngine();
  EXPECT_EQ(engine.generateContentHash(kSampleText), engine.analyzeText(kSampleText).content_hash);
  EXPECT_EQ(engine.generateContentHash("abc"), "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");
}

}  // namespace
}  // namespace quill
