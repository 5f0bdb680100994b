// Tests for core/result_json.h -- result and conflict marshaling.

#include "core/result_json.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/json_parser.h"

namespace quill {
namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

CollaborationConflict makeConflict(const std::string& id, const std::string& type) {
  CollaborationConflict conflict;
  conflict.conflict_id = id;
  conflict.conflict_type = type;
  conflict.start_pos = 3;
  conflict.end_pos = 9;
  conflict.user_a_change = "Hello";
  conflict.user_b_change = "World";
  conflict.timestamp = "2024-01-01T00:00:00Z";
  return conflict;
}

// ---------------------------------------------------------------------------
// analysisResultToJson
// ---------------------------------------------------------------------------

TEST(AnalysisResultJsonTest, TopLevelFields) {
  AnalysisResult result;
  result.word_count = 8;
  result.character_count = 37;
  result.paragraph_count = 1;
  result.sentence_count = 2;
  result.readability_score = 97.025;
  result.complexity_metrics.flesch_reading_ease = 97.025;
  result.complexity_metrics.unique_word_ratio = 0.625;
  result.style_metrics.adverb_ratio = 0.125;
  result.content_hash = "abc=";

  std::string json = analysisResultToJson(result);
  EXPECT_TRUE(contains(json, R"("word_count":8)"));
  EXPECT_TRUE(contains(json, R"("character_count":37)"));
  EXPECT_TRUE(contains(json, R"("paragraph_count":1)"));
  EXPECT_TRUE(contains(json, R"("sentence_count":2)"));
  EXPECT_TRUE(contains(json, R"("readability_score":97.025)"));
  EXPECT_TRUE(contains(json, R"("unique_word_ratio":0.625)"));
  EXPECT_TRUE(contains(json, R"("adverb_ratio":0.125)"));
  EXPECT_TRUE(contains(json, R"("content_hash":"abc=")"));
}

TEST(AnalysisResultJsonTest, NestedObjectsParseBack) {
  AnalysisResult result;
  result.complexity_metrics.fog_index = 6.6;
  result.style_metrics.dialogue_ratio = 1.0;

  std::string json = analysisResultToJson(result);
  JsonValue root;
  ASSERT_TRUE(parseJson(json.data(), json.size(), root));
  ASSERT_EQ(root.type, JsonValue::Object);

  const JsonValue* complexity = root.find("complexity_metrics");
  ASSERT_NE(complexity, nullptr);
  ASSERT_NE(complexity->find("fog_index"), nullptr);
  EXPECT_DOUBLE_EQ(complexity->find("fog_index")->number_val, 6.6);
  EXPECT_EQ(complexity->keys.size(), 5u);

  const JsonValue* style = root.find("style_metrics");
  ASSERT_NE(style, nullptr);
  EXPECT_DOUBLE_EQ(style->find("dialogue_ratio")->number_val, 1.0);
  EXPECT_NE(style->find("action_ratio"), nullptr);
  EXPECT_NE(style->find("description_ratio"), nullptr);
  EXPECT_EQ(style->keys.size(), 5u);
}

TEST(AnalysisResultJsonTest, PrettyOutputIsIndented) {
  AnalysisResult result;
  std::string pretty = analysisResultToJson(result, true);
  EXPECT_TRUE(contains(pretty, "\n  \"word_count\": 0"));
  EXPECT_TRUE(contains(pretty, "\n    \"fog_index\": 0"));

  JsonValue root;
  EXPECT_TRUE(parseJson(pretty.data(), pretty.size(), root));
}

// ---------------------------------------------------------------------------
// suggestionsToJson
// ---------------------------------------------------------------------------

TEST(SuggestionsJsonTest, EmptyList) {
  EXPECT_EQ(suggestionsToJson({}), "[]");
}

TEST(SuggestionsJsonTest, SingleSuggestion) {
  OptimizationSuggestion suggestion;
  suggestion.type = SuggestionType::PassiveVoice;
  suggestion.priority = SuggestionPriority::Low;
  suggestion.message = "Consider using active voice for more engaging writing.";
  suggestion.start_pos = 9;
  suggestion.end_pos = 19;

  std::string expected =
      R"([{"suggestion_type":"passive_voice","priority":"low",)"
      R"("message":"Consider using active voice for more engaging writing.",)"
      R"("start_pos":9,"end_pos":19,"suggested_replacement":null}])";
  EXPECT_EQ(suggestionsToJson({suggestion}), expected);
}

TEST(SuggestionsJsonTest, ReplacementWrittenWhenSet) {
  OptimizationSuggestion suggestion;
  suggestion.type = SuggestionType::SentenceLength;
  suggestion.priority = SuggestionPriority::Medium;
  suggestion.suggested_replacement = std::string("Split here.");

  std::string json = suggestionsToJson({suggestion});
  EXPECT_TRUE(contains(json, R"("suggestion_type":"sentence_length")"));
  EXPECT_TRUE(contains(json, R"("priority":"medium")"));
  EXPECT_TRUE(contains(json, R"("suggested_replacement":"Split here.")"));
}

// ---------------------------------------------------------------------------
// conflictsToJson / conflictsFromJson
// ---------------------------------------------------------------------------

TEST(ConflictsJsonTest, WriteThenRead) {
  std::vector<CollaborationConflict> conflicts = {
      makeConflict("c1", "text_insertion"),
      makeConflict("c2", "text_deletion"),
  };
  conflicts[1].resolution_suggestion = "World";

  std::string json = conflictsToJson(conflicts);
  std::vector<CollaborationConflict> parsed;
  std::string error;
  ASSERT_TRUE(conflictsFromJson(json.data(), json.size(), parsed, &error)) << error;
  EXPECT_EQ(parsed, conflicts);
}

TEST(ConflictsJsonTest, ReadWithoutResolutionField) {
  std::string json = R"([{"conflict_id":"c1","conflict_type":"text_modification",)"
                     R"("start_pos":0,"end_pos":4,"user_a_change":"a",)"
                     R"("user_b_change":"b","timestamp":"t","extra":[1,2]}])";
  std::vector<CollaborationConflict> parsed;
  ASSERT_TRUE(conflictsFromJson(json.data(), json.size(), parsed));
  ASSERT_EQ(parsed.size(), 1u);
  EXPECT_EQ(parsed[0].conflict_type, "text_modification");
  EXPECT_EQ(parsed[0].end_pos, 4u);
  EXPECT_TRUE(parsed[0].resolution_suggestion.empty());
}

TEST(ConflictsJsonTest, EmptyArray) {
  std::vector<CollaborationConflict> parsed = {makeConflict("old", "x")};
  ASSERT_TRUE(conflictsFromJson("[]", 2, parsed));
  EXPECT_TRUE(parsed.empty());
}

TEST(ConflictsJsonTest, RejectsMalformedJson) {
  std::string json = R"([{"conflict_id":)";
  std::vector<CollaborationConflict> parsed;
  std::string error;
  EXPECT_FALSE(conflictsFromJson(json.data(), json.size(), parsed, &error));
  EXPECT_EQ(error, "malformed JSON");
}

TEST(ConflictsJsonTest, RejectsNonArray) {
  std::string json = R"({"conflict_id":"c1"})";
  std::vector<CollaborationConflict> parsed;
  std::string error;
  EXPECT_FALSE(conflictsFromJson(json.data(), json.size(), parsed, &error));
  EXPECT_EQ(error, "expected a JSON array of conflicts");
}

TEST(ConflictsJsonTest, RejectsMissingField) {
  std::string json = R"([{"conflict_id":"c1","conflict_type":"text_insertion",)"
                     R"("start_pos":0,"end_pos":1,"user_a_change":"a","timestamp":"t"}])";
  std::vector<CollaborationConflict> parsed;
  std::string error;
  EXPECT_FALSE(conflictsFromJson(json.data(), json.size(), parsed, &error));
  EXPECT_EQ(error, "conflict 0: missing string user_b_change");
  EXPECT_TRUE(parsed.empty());
}

TEST(ConflictsJsonTest, RejectsNegativePosition) {
  std::string json = R"([{"conflict_id":"c1","conflict_type":"text_insertion",)"
                     R"("start_pos":-1,"end_pos":1,"user_a_change":"a",)"
                     R"("user_b_change":"b","timestamp":"t"}])";
  std::vector<CollaborationConflict> parsed;
  std::string error;
  EXPECT_FALSE(conflictsFromJson(json.data(), json.size(), parsed, &error));
  EXPECT_EQ(error, "conflict 0: missing or out-of-range start_pos");
}

TEST(ConflictsJsonTest, RejectsPositionBeyondSizeRange) {
  std::string json = R"([{"conflict_id":"c1","conflict_type":"text_insertion",)"
                     R"("start_pos":1e400,"end_pos":1,"user_a_change":"a",)"
                     R"("user_b_change":"b","timestamp":"t"}])";
  std::vector<CollaborationConflict> parsed;
  std::string error;
  EXPECT_FALSE(conflictsFromJson(json.data(), json.size(), parsed, &error));
  EXPECT_EQ(error, "conflict 0: missing or out-of-range start_pos");

  json = R"([{"conflict_id":"c1","conflict_type":"text_insertion",)"
         R"("start_pos":0,"end_pos":1e300,"user_a_change":"a",)"
         R"("user_b_change":"b","timestamp":"t"}])";
  EXPECT_FALSE(conflictsFromJson(json.data(), json.size(), parsed, &error));
  EXPECT_EQ(error, "conflict 0: missing or out-of-range end_pos");
}

TEST(ConflictsJsonTest, RejectsNonObjectElement) {
  std::vector<CollaborationConflict> parsed;
  std::string error;
  EXPECT_FALSE(conflictsFromJson("[1]", 3, parsed, &error));
  EXPECT_EQ(error, "conflict 0: expected an object");
}

}  // namespace
}  // namespace quill
