// Content hash implementation (OpenSSL libcrypto).

#include "analysis/content_hash.h"

#include <cstdio>

#include <openssl/evp.h>

namespace quill {

std::string generateContentHash(std::string_view text) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(text.data(), text.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    std::fprintf(stderr, "[ContentHash] SHA-256 digest failed for %zu bytes\n", text.size());
    return std::string();
  }

  // Base64 output: 4 chars per 3 input bytes plus a terminating NUL.
  unsigned char encoded[((EVP_MAX_MD_SIZE + 2) / 3) * 4 + 1];
  int encoded_len = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
  return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(encoded_len));
}

}  // namespace quill
