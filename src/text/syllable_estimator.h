// Syllable estimation by vowel-group counting.

#ifndef QUILL_TEXT_SYLLABLE_ESTIMATOR_H
#define QUILL_TEXT_SYLLABLE_ESTIMATOR_H

#include <cstddef>
#include <string_view>
#include <vector>

namespace quill {

/// Words with at least this many estimated syllables count as complex.
constexpr size_t kComplexWordSyllables = 3;

/// @brief Estimate the syllable count of a single word.
///
/// Counts transitions into a vowel group (a, e, i, o, u, y in either case),
/// then drops one for a trailing lower-case 'e' when more than one group was
/// found. This is a heuristic, not a dictionary lookup: "queue" gives 1 and
/// silent consonant clusters are not modelled. Non-ASCII characters are
/// treated as consonants.
///
/// @param word A single word (UTF-8).
/// @return Estimated syllables, never less than 1.
size_t countSyllables(std::string_view word);

/// @brief Mean syllable estimate over a word list.
/// @return 0.0 for an empty list.
double averageSyllables(const std::vector<std::string_view>& words);

/// @brief Number of words whose estimate is at least kComplexWordSyllables.
size_t countComplexWords(const std::vector<std::string_view>& words);

}  // namespace quill

#endif  // QUILL_TEXT_SYLLABLE_ESTIMATOR_H
