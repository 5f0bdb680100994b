// Suggestion generator implementation.

#include "analysis/suggestion_generator.h"

#include <string>

namespace quill {

namespace {

constexpr const char* kLongSentenceMessage =
    "Consider breaking this long sentence into shorter ones for better readability.";
constexpr const char* kPassiveVoiceMessage =
    "Consider using active voice for more engaging writing.";
constexpr const char* kAdverbMessage = "Consider using stronger verbs instead of adverbs.";

OptimizationSuggestion makeSuggestion(SuggestionType type, SuggestionPriority priority,
                                      const char* message, TextPos start, TextPos end) {
  OptimizationSuggestion suggestion;
  suggestion.type = type;
  suggestion.priority = priority;
  suggestion.message = message;
  suggestion.start_pos = start;
  suggestion.end_pos = end;
  return suggestion;
}

/// @brief Split on every literal '.', keeping empty fragments.
std::vector<std::string_view> splitOnPeriods(std::string_view text) {
  std::vector<std::string_view> fragments;
  size_t start = 0;
  while (true) {
    size_t dot = text.find('.', start);
    if (dot == std::string_view::npos) {
      fragments.push_back(text.substr(start));
      break;
    }
    fragments.push_back(text.substr(start, dot - start));
    start = dot + 1;
  }
  return fragments;
}

}  // namespace

std::vector<OptimizationSuggestion> findLongSentences(const PatternSet& patterns,
                                                      std::string_view text,
                                                      const SuggestionConfig& config) {
  std::vector<OptimizationSuggestion> result;
  std::vector<std::string_view> fragments = splitOnPeriods(text);
  for (size_t idx = 0; idx < fragments.size(); ++idx) {
    if (patterns.countMatches(PatternId::Word, fragments[idx]) > config.long_sentence_word_limit) {
      result.push_back(makeSuggestion(SuggestionType::SentenceLength, SuggestionPriority::Medium,
                                      kLongSentenceMessage, idx * config.position_stride,
                                      (idx + 1) * config.position_stride));
    }
  }
  return result;
}

std::vector<OptimizationSuggestion> findPassiveVoice(const PatternSet& patterns,
                                                     std::string_view text) {
  std::vector<OptimizationSuggestion> result;
  for (const TextSpan& span : patterns.findAll(PatternId::PassiveVoice, text)) {
    result.push_back(makeSuggestion(SuggestionType::PassiveVoice, SuggestionPriority::Low,
                                    kPassiveVoiceMessage, span.start, span.end));
  }
  return result;
}

std::vector<OptimizationSuggestion> findAdverbs(const PatternSet& patterns,
                                                std::string_view text) {
  std::vector<OptimizationSuggestion> result;
  for (const TextSpan& span : patterns.findAll(PatternId::Adverb, text)) {
    result.push_back(makeSuggestion(SuggestionType::AdverbUsage, SuggestionPriority::Low,
                                    kAdverbMessage, span.start, span.end));
  }
  return result;
}

std::vector<OptimizationSuggestion> generateSuggestions(const PatternSet& patterns,
                                                        std::string_view text,
                                                        const SuggestionConfig& config) {
  std::vector<OptimizationSuggestion> result = findLongSentences(patterns, text, config);

  std::vector<OptimizationSuggestion> passive = findPassiveVoice(patterns, text);
  result.insert(result.end(), passive.begin(), passive.end());

  std::vector<OptimizationSuggestion> adverbs = findAdverbs(patterns, text);
  result.insert(result.end(), adverbs.begin(), adverbs.end());

  return result;
}

}  // namespace quill
