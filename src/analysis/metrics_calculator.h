// Readability, vocabulary and style metrics over tokenized text.

#ifndef QUILL_ANALYSIS_METRICS_CALCULATOR_H
#define QUILL_ANALYSIS_METRICS_CALCULATOR_H

#include <cstddef>
#include <string_view>
#include <vector>

#include "core/basic_types.h"
#include "text/pattern_set.h"

namespace quill {

/// Flesch reading-ease constants.
constexpr double kFleschBase = 206.835;
constexpr double kFleschSentenceWeight = 1.015;
constexpr double kFleschSyllableWeight = 84.6;

/// Gunning fog constants.
constexpr double kFogScale = 0.4;
constexpr double kFogComplexPercent = 100.0;

/// @brief numerator / denominator, or 0.0 when denominator is 0.
double safeRatio(size_t numerator, size_t denominator);

/// @brief Flesch reading ease: 206.835 - 1.015 * wps - 84.6 * spw.
/// Higher is easier. Not clamped.
double fleschReadingEase(double avg_words_per_sentence, double avg_syllables_per_word);

/// @brief Gunning fog: 0.4 * (wps + 100 * complex_words / word_count).
/// The complex-word term is 0.0 when word_count is 0.
double fogIndex(double avg_words_per_sentence, size_t complex_words, size_t word_count);

/// @brief Number of distinct words after Unicode lower-casing.
size_t countUniqueWords(const std::vector<std::string_view>& words);

/// @brief Compute complexity metrics from the word list and sentence count.
///
/// @param words Word tokens.
/// @param sentence_count Number of sentences.
/// @return Metrics; every ratio is 0.0 when its denominator is 0, so empty
///         text gives flesch_reading_ease = 206.835 and zero elsewhere.
ComplexityMetrics computeComplexityMetrics(const std::vector<std::string_view>& words,
                                           size_t sentence_count);

/// @brief Compute style ratios by scanning the raw text.
///
/// passive matches / sentences, "-ly" words / words, quoted spans / paragraphs.
/// action_ratio and description_ratio are not computed and stay 0.0.
///
/// @param patterns Compiled patterns.
/// @param text Raw text.
/// @param word_count Words in text.
/// @param sentence_count Sentences in text.
/// @param paragraph_count Paragraphs in text.
StyleMetrics computeStyleMetrics(const PatternSet& patterns, std::string_view text,
                                 size_t word_count, size_t sentence_count,
                                 size_t paragraph_count);

}  // namespace quill

#endif  // QUILL_ANALYSIS_METRICS_CALCULATOR_H
