// UTF-8 helpers backed by ICU character properties.

#ifndef QUILL_TEXT_UNICODE_TEXT_H
#define QUILL_TEXT_UNICODE_TEXT_H

#include <cstddef>
#include <string>
#include <string_view>

namespace quill {

/// @brief Count Unicode code points in UTF-8 text.
///
/// Each ill-formed byte sequence counts as one code point (U+FFFD).
/// @param text UTF-8 bytes.
/// @return Number of code points.
size_t countCodePoints(std::string_view text);

/// @brief Check whether text is empty after trimming white space.
///
/// White space is the Unicode White_Space property.
/// @param text UTF-8 bytes.
/// @return True if text holds nothing but White_Space code points.
bool isBlank(std::string_view text);

/// @brief Lower-case a word with Unicode (root locale) rules.
/// @param word UTF-8 bytes.
/// @return Lower-cased UTF-8 string.
std::string toLowerCase(std::string_view word);

}  // namespace quill

#endif  // QUILL_TEXT_UNICODE_TEXT_H
