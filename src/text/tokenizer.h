// Tokenizer: splits raw text into words, sentences and paragraphs.

#ifndef QUILL_TEXT_TOKENIZER_H
#define QUILL_TEXT_TOKENIZER_H

#include <string_view>
#include <utility>
#include <vector>

#include "text/pattern_set.h"

namespace quill {

/// @brief The three token views of one text.
///
/// Every view points into the text passed to Tokenizer::tokenize() and is
/// valid only as long as that text.
struct TokenizedText {
  std::vector<std::string_view> words;
  std::vector<std::string_view> sentences;   ///< Untrimmed, never blank.
  std::vector<std::string_view> paragraphs;  ///< Untrimmed, never blank.
};

/// @brief Boundary-rule tokenizer over a compiled PatternSet.
///
/// Stateless apart from the shared patterns; every text (including the empty
/// text) yields zero or more tokens of each kind.
class Tokenizer {
 public:
  explicit Tokenizer(PatternSet patterns) : patterns_(std::move(patterns)) {}

  /// @brief Every maximal run of word characters, in order of appearance.
  std::vector<std::string_view> words(std::string_view text) const;

  /// @brief Fragments between runs of '.', '!' and '?', blank ones dropped.
  std::vector<std::string_view> sentences(std::string_view text) const;

  /// @brief Fragments between blank lines, blank ones dropped.
  std::vector<std::string_view> paragraphs(std::string_view text) const;

  /// @brief All three views at once.
  TokenizedText tokenize(std::string_view text) const;

 private:
  /// Split on a pattern and drop fragments that are blank after trimming.
  std::vector<std::string_view> splitNonBlank(PatternId id, std::string_view text) const;

  PatternSet patterns_;
};

}  // namespace quill

#endif  // QUILL_TEXT_TOKENIZER_H
