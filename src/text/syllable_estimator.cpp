// Syllable estimation implementation.

#include "text/syllable_estimator.h"

#include <algorithm>

namespace quill {

namespace {

bool isVowel(char chr) {
  switch (chr) {
    case 'a': case 'e': case 'i': case 'o': case 'u': case 'y':
    case 'A': case 'E': case 'I': case 'O': case 'U': case 'Y':
      return true;
    default:
      return false;
  }
}

}  // namespace

size_t countSyllables(std::string_view word) {
  // UTF-8 continuation and lead bytes are never vowels, so scanning bytes
  // gives the same transitions as scanning code points.
  size_t groups = 0;
  bool prev_was_vowel = false;
  for (char chr : word) {
    bool vowel = isVowel(chr);
    if (vowel && !prev_was_vowel) {
      ++groups;
    }
    prev_was_vowel = vowel;
  }

  // Silent 'e'.
  if (!word.empty() && word.back() == 'e' && groups > 1) {
    --groups;
  }

  return std::max<size_t>(groups, 1);
}

double averageSyllables(const std::vector<std::string_view>& words) {
  if (words.empty()) return 0.0;
  size_t total = 0;
  for (std::string_view word : words) {
    total += countSyllables(word);
  }
  return static_cast<double>(total) / static_cast<double>(words.size());
}

size_t countComplexWords(const std::vector<std::string_view>& words) {
  return static_cast<size_t>(std::count_if(words.begin(), words.end(), [](std::string_view word) {
    return countSyllables(word) >= kComplexWordSyllables;
  }));
}

}  // namespace quill
