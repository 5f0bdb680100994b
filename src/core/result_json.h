// JSON marshaling of engine results and conflict descriptors.

#ifndef QUILL_CORE_RESULT_JSON_H
#define QUILL_CORE_RESULT_JSON_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace quill {

/// @brief Serialize an AnalysisResult.
///
/// Output is compact unless pretty is set (2-space indentation).
///
/// Nested objects "complexity_metrics" and "style_metrics" use the field
/// names of the structs.
std::string analysisResultToJson(const AnalysisResult& result, bool pretty = false);

/// @brief Serialize a suggestion list as a JSON array.
///
/// Each element: suggestion_type, priority, message, start_pos, end_pos,
/// suggested_replacement (null when unset).
std::string suggestionsToJson(const std::vector<OptimizationSuggestion>& suggestions,
                              bool pretty = false);

/// @brief Serialize a conflict list as a JSON array.
std::string conflictsToJson(const std::vector<CollaborationConflict>& conflicts,
                            bool pretty = false);

/// @brief Parse a JSON array of conflict records.
///
/// Required per record: conflict_id, conflict_type, user_a_change,
/// user_b_change, timestamp (strings) and start_pos, end_pos (finite
/// non-negative numbers below SIZE_MAX). resolution_suggestion is optional. Unknown keys are ignored.
///
/// @param json JSON text.
/// @param length Length of json in bytes.
/// @param out Receives the records on success.
/// @param error Receives a description of the first problem (may be null).
/// @return False on malformed JSON or a record missing a required field.
bool conflictsFromJson(const char* json, size_t length, std::vector<CollaborationConflict>& out,
                       std::string* error = nullptr);

}  // namespace quill

#endif  // QUILL_CORE_RESULT_JSON_H
