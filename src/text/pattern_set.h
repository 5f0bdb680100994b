// Compiled text patterns shared by the tokenizer, metrics and suggestions.

#ifndef QUILL_TEXT_PATTERN_SET_H
#define QUILL_TEXT_PATTERN_SET_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/regex.h>

#include "core/basic_types.h"

namespace quill {

/// Identifies one pattern in a PatternSet.
enum class PatternId : uint8_t {
  Word,                ///< Maximal run of word characters.
  SentenceTerminator,  ///< Run of '.', '!' or '?'.
  ParagraphBreak,      ///< Newline, optional white space, newline.
  PassiveVoice,        ///< was|were|been|being + white space + word ending in "ed".
  Adverb,              ///< Word ending in "ly".
  Dialogue             ///< Double-quoted span without embedded quotes.
};

constexpr size_t kPatternCount = 6;

/// @brief Get a short name for a pattern (e.g. "passive_voice").
const char* patternIdToString(PatternId id);

/// @brief Get the regular expression source of a pattern (ICU syntax).
const char* patternSource(PatternId id);

/// @brief Immutable set of compiled patterns.
///
/// Compiled once and then only read: copies share the compiled patterns and
/// each query builds its own matcher, so one set may serve concurrent calls.
/// Matching is Unicode-aware (\w, \b and White_Space follow Unicode
/// properties). Returned offsets are byte offsets into the UTF-8 input.
class PatternSet {
 public:
  /// @brief Compile every pattern.
  /// @param error Receives a description of the first failure (may be null).
  /// @return The compiled set, or nullopt if any pattern failed to compile.
  static std::optional<PatternSet> compile(std::string* error = nullptr);

  /// @brief Find all non-overlapping matches, leftmost first.
  /// @param id Pattern to match.
  /// @param text UTF-8 input.
  /// @return Match spans in order of appearance.
  std::vector<TextSpan> findAll(PatternId id, std::string_view text) const;

  /// @brief Count non-overlapping matches.
  size_t countMatches(PatternId id, std::string_view text) const;

  /// @brief Split text on every match of a pattern.
  ///
  /// Returns the fragments between matches, including empty ones. Text with
  /// no match yields one fragment (the whole text, possibly empty).
  std::vector<std::string_view> split(PatternId id, std::string_view text) const;

 private:
  PatternSet() = default;

  const icu::RegexPattern& pattern(PatternId id) const;

  std::array<std::shared_ptr<const icu::RegexPattern>, kPatternCount> patterns_;
};

}  // namespace quill

#endif  // QUILL_TEXT_PATTERN_SET_H
