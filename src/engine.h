// Text engine: the four host-facing operations over one compiled PatternSet.

#ifndef QUILL_ENGINE_H
#define QUILL_ENGINE_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/basic_types.h"
#include "text/pattern_set.h"
#include "text/tokenizer.h"

namespace quill {

/// @brief Engine configuration.
struct EngineConfig {
  size_t long_sentence_word_limit = 25;    ///< Words per '.' fragment before flagging.
  size_t suggestion_position_stride = 50;  ///< Approximate span width for long sentences.
  bool verbose = false;                    ///< Diagnostic lines on stderr.
};

/// @brief Check a configuration.
/// @param config Configuration to check.
/// @param error Receives a description of the first problem (may be null).
/// @return False if a limit or stride is zero.
bool validateConfig(const EngineConfig& config, std::string* error = nullptr);

/// @brief Stateless text-analysis engine.
///
/// Holds only the configuration and the compiled patterns, both read-only
/// after create(), so one engine may be shared across threads. Every
/// operation is total over its input.
class TextEngine {
 public:
  /// @brief Build an engine.
  /// @param config Engine configuration (validated).
  /// @param error Receives the failure reason (may be null).
  /// @return The engine, or nullopt if the config is invalid or a pattern
  ///         failed to compile. A partially built engine is never returned.
  static std::optional<TextEngine> create(const EngineConfig& config = EngineConfig(),
                                          std::string* error = nullptr);

  /// @brief Counts, complexity metrics, style metrics and content hash.
  /// Empty text gives zero counts and ratios with readability 206.835.
  AnalysisResult analyzeText(std::string_view text) const;

  /// @brief Heuristic suggestions (long sentences, passive voice, adverbs).
  std::vector<OptimizationSuggestion> optimizeText(std::string_view text) const;

  /// @brief Overwrite resolution_suggestion of every conflict.
  std::vector<CollaborationConflict> resolveConflicts(
      std::vector<CollaborationConflict> conflicts) const;

  /// @brief Base64 SHA-256 of the raw bytes.
  std::string generateContentHash(std::string_view text) const;

  const EngineConfig& config() const { return config_; }

 private:
  TextEngine(const EngineConfig& config, PatternSet patterns);

  EngineConfig config_;
  PatternSet patterns_;
  Tokenizer tokenizer_;
};

}  // namespace quill

#endif  // QUILL_ENGINE_H
