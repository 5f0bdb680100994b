// UTF-8 helpers implementation.

#include "text/unicode_text.h"

#include <cstdint>

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace quill {

size_t countCodePoints(std::string_view text) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  const auto length = static_cast<int64_t>(text.size());
  size_t count = 0;
  int64_t pos = 0;
  while (pos < length) {
    UChar32 code = 0;
    U8_NEXT(bytes, pos, length, code);
    ++count;
  }
  return count;
}

bool isBlank(std::string_view text) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  const auto length = static_cast<int64_t>(text.size());
  int64_t pos = 0;
  while (pos < length) {
    UChar32 code = 0;
    U8_NEXT(bytes, pos, length, code);
    if (code < 0 || !u_isUWhiteSpace(code)) return false;
  }
  return true;
}

std::string toLowerCase(std::string_view word) {
  icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(
      icu::StringPiece(word.data(), static_cast<int32_t>(word.size())));
  ustr.toLower(icu::Locale::getRoot());
  std::string result;
  ustr.toUTF8String(result);
  return result;
}

}  // namespace quill
