// Text engine implementation.

#include "engine.h"

#include <cstdio>
#include <utility>

#include "analysis/content_hash.h"
#include "analysis/metrics_calculator.h"
#include "analysis/suggestion_generator.h"
#include "collab/conflict_resolver.h"
#include "text/unicode_text.h"

namespace quill {

bool validateConfig(const EngineConfig& config, std::string* error) {
  const char* problem = nullptr;
  if (config.long_sentence_word_limit == 0) {
    problem = "long_sentence_word_limit must be positive";
  } else if (config.suggestion_position_stride == 0) {
    problem = "suggestion_position_stride must be positive";
  }
  if (problem != nullptr) {
    if (error != nullptr) *error = problem;
    return false;
  }
  return true;
}

std::optional<TextEngine> TextEngine::create(const EngineConfig& config, std::string* error) {
  if (!validateConfig(config, error)) {
    return std::nullopt;
  }

  std::optional<PatternSet> patterns = PatternSet::compile(error);
  if (!patterns) {
    std::fprintf(stderr, "[TextEngine] initialization aborted: pattern compilation failed\n");
    return std::nullopt;
  }

  if (config.verbose) {
    std::fprintf(stderr, "[TextEngine] initialized (%zu patterns, sentence limit %zu)\n",
                 kPatternCount, config.long_sentence_word_limit);
  }
  return TextEngine(config, std::move(*patterns));
}

TextEngine::TextEngine(const EngineConfig& config, PatternSet patterns)
    : config_(config), patterns_(patterns), tokenizer_(std::move(patterns)) {}

AnalysisResult TextEngine::analyzeText(std::string_view text) const {
  if (config_.verbose) {
    std::fprintf(stderr, "[TextEngine] analyzing %zu bytes\n", text.size());
  }

  TokenizedText tokens = tokenizer_.tokenize(text);

  AnalysisResult result;
  result.word_count = tokens.words.size();
  result.character_count = countCodePoints(text);
  result.sentence_count = tokens.sentences.size();
  result.paragraph_count = tokens.paragraphs.size();

  result.complexity_metrics = computeComplexityMetrics(tokens.words, result.sentence_count);
  result.readability_score = result.complexity_metrics.flesch_reading_ease;
  result.style_metrics = computeStyleMetrics(patterns_, text, result.word_count,
                                             result.sentence_count, result.paragraph_count);
  result.content_hash = generateContentHash(text);
  return result;
}

std::vector<OptimizationSuggestion> TextEngine::optimizeText(std::string_view text) const {
  SuggestionConfig suggestion_config;
  suggestion_config.long_sentence_word_limit = config_.long_sentence_word_limit;
  suggestion_config.position_stride = config_.suggestion_position_stride;

  std::vector<OptimizationSuggestion> suggestions =
      generateSuggestions(patterns_, text, suggestion_config);
  if (config_.verbose) {
    std::fprintf(stderr, "[TextEngine] %zu suggestions for %zu bytes\n", suggestions.size(),
                 text.size());
  }
  return suggestions;
}

std::vector<CollaborationConflict> TextEngine::resolveConflicts(
    std::vector<CollaborationConflict> conflicts) const {
  return ::quill::resolveConflicts(std::move(conflicts));
}

std::string TextEngine::generateContentHash(std::string_view text) const {
  return ::quill::generateContentHash(text);
}

}  // namespace quill
