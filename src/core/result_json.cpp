// JSON marshaling implementation.

#include "core/result_json.h"

#include <cstdint>
#include <string_view>
#include <utility>

#include "core/json_helpers.h"
#include "core/json_parser.h"

namespace quill {

namespace {

void writeCount(JsonWriter& writer, const char* name, size_t value) {
  writer.key(name);
  writer.value(static_cast<uint64_t>(value));
}

void writeNumber(JsonWriter& writer, const char* name, double value) {
  writer.key(name);
  writer.value(value);
}

void writeString(JsonWriter& writer, const char* name, const std::string& value) {
  writer.key(name);
  writer.value(std::string_view(value));
}

bool fail(std::string* error, const std::string& message) {
  if (error != nullptr) *error = message;
  return false;
}

/// @brief Read a required string member.
bool readString(const JsonValue& record, const char* name, std::string& out) {
  const JsonValue* member = record.find(name);
  if (member == nullptr || member->type != JsonValue::String) return false;
  out = member->string_val;
  return true;
}

/// @brief Read a required non-negative number member that fits a TextPos.
bool readPosition(const JsonValue& record, const char* name, TextPos& out) {
  const JsonValue* member = record.find(name);
  if (member == nullptr || !member->isSize()) {
    return false;
  }
  out = member->asSize();
  return true;
}

}  // namespace

std::string analysisResultToJson(const AnalysisResult& result, bool pretty) {
  JsonWriter writer;
  writer.beginObject();

  writeCount(writer, "word_count", result.word_count);
  writeCount(writer, "character_count", result.character_count);
  writeCount(writer, "paragraph_count", result.paragraph_count);
  writeCount(writer, "sentence_count", result.sentence_count);
  writeNumber(writer, "readability_score", result.readability_score);

  const ComplexityMetrics& complexity = result.complexity_metrics;
  writer.key("complexity_metrics");
  writer.beginObject();
  writeNumber(writer, "avg_words_per_sentence", complexity.avg_words_per_sentence);
  writeNumber(writer, "avg_syllables_per_word", complexity.avg_syllables_per_word);
  writeNumber(writer, "fog_index", complexity.fog_index);
  writeNumber(writer, "flesch_reading_ease", complexity.flesch_reading_ease);
  writeNumber(writer, "unique_word_ratio", complexity.unique_word_ratio);
  writer.endObject();

  const StyleMetrics& style = result.style_metrics;
  writer.key("style_metrics");
  writer.beginObject();
  writeNumber(writer, "passive_voice_ratio", style.passive_voice_ratio);
  writeNumber(writer, "adverb_ratio", style.adverb_ratio);
  writeNumber(writer, "dialogue_ratio", style.dialogue_ratio);
  writeNumber(writer, "action_ratio", style.action_ratio);
  writeNumber(writer, "description_ratio", style.description_ratio);
  writer.endObject();

  writeString(writer, "content_hash", result.content_hash);

  writer.endObject();
  return pretty ? writer.toPrettyString() : writer.toString();
}

std::string suggestionsToJson(const std::vector<OptimizationSuggestion>& suggestions,
                              bool pretty) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& suggestion : suggestions) {
    writer.beginObject();
    writer.key("suggestion_type");
    writer.value(suggestionTypeToString(suggestion.type));
    writer.key("priority");
    writer.value(suggestionPriorityToString(suggestion.priority));
    writeString(writer, "message", suggestion.message);
    writeCount(writer, "start_pos", suggestion.start_pos);
    writeCount(writer, "end_pos", suggestion.end_pos);
    writer.key("suggested_replacement");
    writer.value(suggestion.suggested_replacement);
    writer.endObject();
  }
  writer.endArray();
  return pretty ? writer.toPrettyString() : writer.toString();
}

std::string conflictsToJson(const std::vector<CollaborationConflict>& conflicts,
                            bool pretty) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& conflict : conflicts) {
    writer.beginObject();
    writeString(writer, "conflict_id", conflict.conflict_id);
    writeString(writer, "conflict_type", conflict.conflict_type);
    writeCount(writer, "start_pos", conflict.start_pos);
    writeCount(writer, "end_pos", conflict.end_pos);
    writeString(writer, "user_a_change", conflict.user_a_change);
    writeString(writer, "user_b_change", conflict.user_b_change);
    writeString(writer, "timestamp", conflict.timestamp);
    writeString(writer, "resolution_suggestion", conflict.resolution_suggestion);
    writer.endObject();
  }
  writer.endArray();
  return pretty ? writer.toPrettyString() : writer.toString();
}

bool conflictsFromJson(const char* json, size_t length, std::vector<CollaborationConflict>& out,
                       std::string* error) {
  JsonValue root;
  if (!parseJson(json, length, root)) {
    return fail(error, "malformed JSON");
  }
  if (root.type != JsonValue::Array) {
    return fail(error, "expected a JSON array of conflicts");
  }

  std::vector<CollaborationConflict> conflicts;
  conflicts.reserve(root.items.size());
  for (size_t idx = 0; idx < root.items.size(); ++idx) {
    const JsonValue& record = root.items[idx];
    const std::string where = "conflict " + std::to_string(idx);
    if (record.type != JsonValue::Object) {
      return fail(error, where + ": expected an object");
    }

    CollaborationConflict conflict;
    if (!readString(record, "conflict_id", conflict.conflict_id)) {
      return fail(error, where + ": missing string conflict_id");
    }
    if (!readString(record, "conflict_type", conflict.conflict_type)) {
      return fail(error, where + ": missing string conflict_type");
    }
    if (!readPosition(record, "start_pos", conflict.start_pos)) {
      return fail(error, where + ": missing or out-of-range start_pos");
    }
    if (!readPosition(record, "end_pos", conflict.end_pos)) {
      return fail(error, where + ": missing or out-of-range end_pos");
    }
    if (!readString(record, "user_a_change", conflict.user_a_change)) {
      return fail(error, where + ": missing string user_a_change");
    }
    if (!readString(record, "user_b_change", conflict.user_b_change)) {
      return fail(error, where + ": missing string user_b_change");
    }
    if (!readString(record, "timestamp", conflict.timestamp)) {
      return fail(error, where + ": missing string timestamp");
    }
    if (const JsonValue* resolution = record.find("resolution_suggestion")) {
      conflict.resolution_suggestion = resolution->asString();
    }
    conflicts.push_back(std::move(conflict));
  }

  out = std::move(conflicts);
  return true;
}

}  // namespace quill
