// Heuristic writing-improvement suggestions.

#ifndef QUILL_ANALYSIS_SUGGESTION_GENERATOR_H
#define QUILL_ANALYSIS_SUGGESTION_GENERATOR_H

#include <cstddef>
#include <string_view>
#include <vector>

#include "core/basic_types.h"
#include "text/pattern_set.h"

namespace quill {

/// @brief Tunables for the suggestion scans.
struct SuggestionConfig {
  size_t long_sentence_word_limit = 25;  ///< Flag fragments with more words than this.
  size_t position_stride = 50;           ///< Approximate span width per '.' fragment.
};

/// @brief Flag overly long sentences.
///
/// Splits on literal '.' (not the sentence tokenizer), so '!' and '?' do not
/// end a fragment. Positions are approximate: fragment i is reported as
/// [i * stride, (i + 1) * stride), not as its real byte range.
///
/// @return One medium-priority sentence_length suggestion per long fragment.
std::vector<OptimizationSuggestion> findLongSentences(const PatternSet& patterns,
                                                      std::string_view text,
                                                      const SuggestionConfig& config);

/// @brief One low-priority passive_voice suggestion per passive match,
/// with the exact byte range of the match.
std::vector<OptimizationSuggestion> findPassiveVoice(const PatternSet& patterns,
                                                     std::string_view text);

/// @brief One low-priority adverb_usage suggestion per "-ly" word,
/// with the exact byte range of the word.
std::vector<OptimizationSuggestion> findAdverbs(const PatternSet& patterns,
                                                std::string_view text);

/// @brief Run all scans.
///
/// Long-sentence findings come first, then passive voice, then adverbs.
/// Callers may rely on that grouping but on nothing finer.
/// No heuristic sets suggested_replacement.
std::vector<OptimizationSuggestion> generateSuggestions(const PatternSet& patterns,
                                                        std::string_view text,
                                                        const SuggestionConfig& config);

}  // namespace quill

#endif  // QUILL_ANALYSIS_SUGGESTION_GENERATOR_H
