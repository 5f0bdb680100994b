// Minimal JSON parser for C API input (no external dependencies).
//
// Handles the subset the host boundary needs: objects, arrays, strings
// (including \uXXXX escapes), numbers, booleans and null.

#ifndef QUILL_CORE_JSON_PARSER_H
#define QUILL_CORE_JSON_PARSER_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

/// @brief A parsed JSON value.
///
/// Arrays keep their elements in `items`. Objects keep their values in
/// `items` and the matching keys, in document order, in `keys`.
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array, Object };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<std::string> keys;
  std::vector<JsonValue> items;

  /// @brief Check that the value is a number representable as size_t.
  /// False for negative, non-finite or too-large numbers.
  bool isSize() const;

  /// @brief Get value as a size (byte offset), with default.
  /// Numbers failing isSize() yield the default. Fractions are truncated.
  size_t asSize(size_t default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Look up an object member.
  /// @return Pointer to the member value, or nullptr if absent or not an object.
  ///         With duplicate keys the last one wins.
  const JsonValue* find(std::string_view key) const;
};

/// @brief Parse a complete JSON document.
/// @param json Pointer to JSON text.
/// @param length Length of JSON text in bytes.
/// @param out Receives the parsed value on success.
/// @return False on malformed input or trailing garbage.
bool parseJson(const char* json, size_t length, JsonValue& out);

/// @brief Parse a flat JSON object into a key-value map.
///
/// Nested objects and arrays are kept as JsonValue members but are not
/// flattened.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @return Map of key-value pairs. Empty map on parse error or non-object input.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length);

}  // namespace quill

#endif  // QUILL_CORE_JSON_PARSER_H
