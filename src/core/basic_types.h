// Basic types for quill text analysis.

#ifndef QUILL_CORE_BASIC_TYPES_H
#define QUILL_CORE_BASIC_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quill {

/// Byte offset into a UTF-8 input string.
using TextPos = size_t;

/// @brief Half-open byte range [start, end) into a UTF-8 input string.
struct TextSpan {
  TextPos start = 0;
  TextPos end = 0;

  /// @brief Length of the span in bytes.
  TextPos length() const { return end - start; }

  bool operator==(const TextSpan& other) const {
    return start == other.start && end == other.end;
  }
};

// ---------------------------------------------------------------------------
// Analysis result
// ---------------------------------------------------------------------------

/// @brief Readability and vocabulary measures derived from tokenized text.
///
/// Every ratio is 0.0 when its denominator is 0.
struct ComplexityMetrics {
  double avg_words_per_sentence = 0.0;
  double avg_syllables_per_word = 0.0;
  double fog_index = 0.0;
  double flesch_reading_ease = 0.0;
  double unique_word_ratio = 0.0;  ///< Distinct lower-cased words / words.
};

/// @brief Stylistic ratios from pattern scans over the raw text.
struct StyleMetrics {
  double passive_voice_ratio = 0.0;  ///< Passive matches per sentence.
  double adverb_ratio = 0.0;         ///< "-ly" words per word.
  double dialogue_ratio = 0.0;       ///< Quoted spans per paragraph.
  double action_ratio = 0.0;         ///< Not computed yet, always 0.0.
  double description_ratio = 0.0;    ///< Not computed yet, always 0.0.
};

/// @brief Complete result of one analyzeText() call.
struct AnalysisResult {
  size_t word_count = 0;
  size_t character_count = 0;  ///< Unicode code points.
  size_t paragraph_count = 0;
  size_t sentence_count = 0;
  double readability_score = 0.0;  ///< Same value as flesch_reading_ease.
  ComplexityMetrics complexity_metrics;
  StyleMetrics style_metrics;
  std::string content_hash;
};

// ---------------------------------------------------------------------------
// Suggestions
// ---------------------------------------------------------------------------

/// Kind of heuristic finding.
enum class SuggestionType : uint8_t {
  SentenceLength,
  PassiveVoice,
  AdverbUsage
};

/// Urgency of a finding.
enum class SuggestionPriority : uint8_t {
  Low,
  Medium,
  High
};

/// @brief Convert SuggestionType to its wire name (e.g. "passive_voice").
const char* suggestionTypeToString(SuggestionType type);

/// @brief Convert SuggestionPriority to its wire name (e.g. "low").
const char* suggestionPriorityToString(SuggestionPriority priority);

/// @brief One writing-improvement finding.
struct OptimizationSuggestion {
  SuggestionType type = SuggestionType::SentenceLength;
  SuggestionPriority priority = SuggestionPriority::Low;
  std::string message;
  TextPos start_pos = 0;
  TextPos end_pos = 0;
  std::optional<std::string> suggested_replacement;  ///< Unset by all current heuristics.
};

// ---------------------------------------------------------------------------
// Collaboration conflicts
// ---------------------------------------------------------------------------

/// @brief Externally detected edit disagreement between two users.
///
/// Only resolution_suggestion is written by the resolver; every other field
/// passes through unchanged.
struct CollaborationConflict {
  std::string conflict_id;
  std::string conflict_type;  ///< "text_insertion", "text_deletion", "text_modification", ...
  TextPos start_pos = 0;
  TextPos end_pos = 0;
  std::string user_a_change;
  std::string user_b_change;
  std::string timestamp;
  std::string resolution_suggestion;

  bool operator==(const CollaborationConflict& other) const {
    return conflict_id == other.conflict_id && conflict_type == other.conflict_type &&
           start_pos == other.start_pos && end_pos == other.end_pos &&
           user_a_change == other.user_a_change && user_b_change == other.user_b_change &&
           timestamp == other.timestamp &&
           resolution_suggestion == other.resolution_suggestion;
  }
};

}  // namespace quill

#endif  // QUILL_CORE_BASIC_TYPES_H
