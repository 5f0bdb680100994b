// C API for WASM and FFI bindings.

#ifndef QUILL_C_H
#define QUILL_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a quill engine instance.
typedef void* QuillHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  QUILL_OK = 0,
  QUILL_ERROR_INVALID_PARAM = 1,
  QUILL_ERROR_INVALID_CONFIG = 2,
  QUILL_ERROR_INIT_FAILED = 3,
  QUILL_ERROR_INVALID_JSON = 4,
} QuillError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Text output of the last operation.
typedef struct {
  char* data;     ///< NUL-terminated output (JSON, or the bare hash string)
  size_t length;  ///< Length without the terminator
} QuillOutput;

/// @brief Summary of the last quill_analyze_text / quill_optimize_text call.
typedef struct {
  uint64_t word_count;        ///< Words (analyze only)
  uint64_t sentence_count;    ///< Sentences (analyze only)
  uint64_t paragraph_count;   ///< Paragraphs (analyze only)
  uint64_t character_count;   ///< Code points (analyze only)
  uint64_t suggestion_count;  ///< Suggestions (optimize only)
  double readability_score;   ///< Flesch reading ease (analyze only)
} QuillInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create an engine with default configuration.
/// @return Handle (must be freed with quill_destroy), or NULL if initialization failed
QuillHandle quill_create(void);

/// @brief Create an engine from a JSON config string.
///
/// JSON fields (all optional, defaults applied):
///   long_sentence_word_limit: number (> 0, default 25)
///   suggestion_position_stride: number (> 0, default 50)
///   verbose: boolean (diagnostics on stderr)
///
/// @param json JSON config string
/// @param length Length of the JSON string
/// @param error Receives the error code (may be NULL)
/// @return Handle, or NULL on error
QuillHandle quill_create_from_json(const char* json, size_t length, QuillError* error);

/// @brief Destroy an engine instance.
/// @param handle Handle to destroy
void quill_destroy(QuillHandle handle);

// ============================================================================
// Operations
// ============================================================================

/// @brief Analyze text. Output: AnalysisResult JSON object.
/// @param handle Quill handle
/// @param text UTF-8 text (may be NULL when length is 0)
/// @param length Length in bytes
/// @return QUILL_OK on success
QuillError quill_analyze_text(QuillHandle handle, const char* text, size_t length);

/// @brief Generate suggestions. Output: JSON array of suggestions.
QuillError quill_optimize_text(QuillHandle handle, const char* text, size_t length);

/// @brief Resolve conflicts. Input and output: JSON array of conflict records.
/// @return QUILL_ERROR_INVALID_JSON if the input is malformed or a record
///         misses a required field
QuillError quill_resolve_conflicts(QuillHandle handle, const char* json, size_t length);

/// @brief Hash text. Output: base64 SHA-256 string (not JSON-quoted).
QuillError quill_content_hash(QuillHandle handle, const char* text, size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get the output of the last successful operation.
/// @param handle Quill handle
/// @return Output copy (must be freed with quill_free_output), or NULL
QuillOutput* quill_get_output(QuillHandle handle);

/// @brief Free output data.
/// @param output Pointer returned by quill_get_output
void quill_free_output(QuillOutput* output);

/// @brief Get the summary of the last analyze/optimize call.
/// @param handle Quill handle
/// @return Pointer owned by the handle (valid until the next call, do not free).
///         All-zero if nothing has run yet.
const QuillInfo* quill_get_info(QuillHandle handle);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* quill_error_string(QuillError error);

/// @brief Get the message of the last failed call on a handle.
/// @return Message owned by the handle, "" if none
const char* quill_last_error_detail(QuillHandle handle);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* quill_version(void);

#ifdef __cplusplus
}
#endif

#endif  // QUILL_C_H
