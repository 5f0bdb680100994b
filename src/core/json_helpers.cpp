/// @file
/// @brief Implementation of the minimal JSON writer.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace quill {

namespace {

/// Significant digits for double output. Keeps 206.835 as "206.835".
constexpr int kDoublePrecision = 12;

}  // namespace

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() {
  closeContainer('}');
}

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() {
  closeContainer(']');
}

void JsonWriter::closeContainer(char closer) {
  buffer_ += closer;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  markWritten();
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value that follows belongs to this key and takes no comma.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(std::string_view val) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  markWritten();
}

void JsonWriter::value(const char* val) {
  if (val == nullptr) {
    valueNull();
    return;
  }
  value(std::string_view(val));
}

void JsonWriter::value(uint64_t val) {
  rawValue(std::to_string(val));
}

void JsonWriter::value(double val) {
  if (std::isnan(val) || std::isinf(val)) {
    rawValue("null");
    return;
  }
  std::ostringstream oss;
  oss << std::setprecision(kDoublePrecision) << val;
  rawValue(oss.str());
}

void JsonWriter::valueNull() {
  rawValue("null");
}

void JsonWriter::value(const std::optional<std::string>& val) {
  if (val.has_value()) {
    value(std::string_view(*val));
  } else {
    valueNull();
  }
}

std::string JsonWriter::toString() const {
  return buffer_;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;

      case '{':
      case '[':
        result += chr;
        ++depth;
        // Empty containers stay compact: {} or [].
        if (pos + 1 < buffer_.size() && (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']')) {
          break;
        }
        newline();
        break;

      case '}':
      case ']':
        --depth;
        if (!result.empty() && (result.back() == '{' || result.back() == '[')) {
          result += chr;
        } else {
          newline();
          result += chr;
        }
        break;

      case ',':
        result += chr;
        newline();
        break;

      case ':':
        result += ": ";
        break;

      default:
        result += chr;
        break;
    }
  }

  return result;
}

void JsonWriter::maybeComma() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

void JsonWriter::markWritten() {
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

void JsonWriter::rawValue(std::string_view token) {
  maybeComma();
  buffer_ += token;
  markWritten();
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          // UTF-8 multibyte sequences pass through unchanged.
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace quill
