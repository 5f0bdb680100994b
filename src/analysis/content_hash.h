// Content fingerprint of raw text.

#ifndef QUILL_ANALYSIS_CONTENT_HASH_H
#define QUILL_ANALYSIS_CONTENT_HASH_H

#include <string>
#include <string_view>

namespace quill {

/// @brief SHA-256 of the raw bytes, encoded as standard base64 with padding.
///
/// Pure function of the input bytes; the result is always 44 characters.
/// @param text Raw text (any bytes).
/// @return Base64 digest, e.g. "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=" for "".
std::string generateContentHash(std::string_view text);

}  // namespace quill

#endif  // QUILL_ANALYSIS_CONTENT_HASH_H
