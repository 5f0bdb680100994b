// Metrics calculator implementation.

#include "analysis/metrics_calculator.h"

#include <string>
#include <unordered_set>

#include "text/syllable_estimator.h"
#include "text/unicode_text.h"

namespace quill {

double safeRatio(size_t numerator, size_t denominator) {
  if (denominator == 0) return 0.0;
  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

double fleschReadingEase(double avg_words_per_sentence, double avg_syllables_per_word) {
  return kFleschBase - kFleschSentenceWeight * avg_words_per_sentence -
         kFleschSyllableWeight * avg_syllables_per_word;
}

double fogIndex(double avg_words_per_sentence, size_t complex_words, size_t word_count) {
  return kFogScale *
         (avg_words_per_sentence + kFogComplexPercent * safeRatio(complex_words, word_count));
}

size_t countUniqueWords(const std::vector<std::string_view>& words) {
  std::unordered_set<std::string> unique;
  unique.reserve(words.size());
  for (std::string_view word : words) {
    unique.insert(toLowerCase(word));
  }
  return unique.size();
}

ComplexityMetrics computeComplexityMetrics(const std::vector<std::string_view>& words,
                                           size_t sentence_count) {
  ComplexityMetrics metrics;
  const size_t word_count = words.size();

  metrics.avg_words_per_sentence = safeRatio(word_count, sentence_count);
  metrics.avg_syllables_per_word = averageSyllables(words);
  metrics.unique_word_ratio = safeRatio(countUniqueWords(words), word_count);
  metrics.flesch_reading_ease =
      fleschReadingEase(metrics.avg_words_per_sentence, metrics.avg_syllables_per_word);
  metrics.fog_index =
      fogIndex(metrics.avg_words_per_sentence, countComplexWords(words), word_count);
  return metrics;
}

StyleMetrics computeStyleMetrics(const PatternSet& patterns, std::string_view text,
                                 size_t word_count, size_t sentence_count,
                                 size_t paragraph_count) {
  StyleMetrics metrics;
  metrics.passive_voice_ratio =
      safeRatio(patterns.countMatches(PatternId::PassiveVoice, text), sentence_count);
  metrics.adverb_ratio = safeRatio(patterns.countMatches(PatternId::Adverb, text), word_count);
  metrics.dialogue_ratio =
      safeRatio(patterns.countMatches(PatternId::Dialogue, text), paragraph_count);
  // TODO: derive action_ratio and description_ratio once verb/adjective
  // classification exists; both stay 0.0 until then.
  return metrics;
}

}  // namespace quill
