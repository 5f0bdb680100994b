// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the C API
// payloads and the CLI --json output. Parsing lives in core/json_parser.h.

#ifndef QUILL_CORE_JSON_HELPERS_H
#define QUILL_CORE_JSON_HELPERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("word_count");
///   writer.value(uint64_t{8});
///   writer.key("priority");
///   writer.value("low");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"word_count":8,"priority":"low"}
/// @endcode
///
/// Tracks comma insertion automatically. Does not validate structure
/// (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C string value. Resolves literals that would otherwise
  /// match both the string_view and optional overloads. Null writes null.
  void value(const char* val);

  void value(uint64_t val);

  /// @brief Write a floating-point value. NaN and infinities become null.
  void value(double val);

  void valueNull();

  /// @brief Write a string value, or null when unset.
  void value(const std::optional<std::string>& val);

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if the current container already holds an element.
  void maybeComma();

  /// Mark the current container as holding at least one element.
  void markWritten();

  /// Append a raw token (number, literal) as one value.
  void rawValue(std::string_view token);

  void closeContainer(char closer);

  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> needs_comma_;
};

}  // namespace quill

#endif  // QUILL_CORE_JSON_HELPERS_H
