// Implementation of the minimal JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

namespace quill {

bool JsonValue::isSize() const {
  // max() rounds up to 2^64 as a double, so the bound is exclusive.
  constexpr double kSizeLimit = static_cast<double>(std::numeric_limits<size_t>::max());
  return type == Number && std::isfinite(number_val) && number_val >= 0.0 &&
         number_val < kSizeLimit;
}

size_t JsonValue::asSize(size_t default_val) const {
  if (isSize()) return static_cast<size_t>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != Object) return nullptr;
  for (size_t idx = keys.size(); idx > 0; --idx) {
    if (keys[idx - 1] == key) return &items[idx - 1];
  }
  return nullptr;
}

namespace {

/// Nesting limit; deeper documents are rejected rather than recursed into.
constexpr int kMaxDepth = 64;

/// @brief Cursor over the input text.
class Parser {
 public:
  Parser(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    return pos_ == length_;
  }

 private:
  void skipWhitespace() {
    while (pos_ < length_ && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(const char* literal) {
    size_t len = std::strlen(literal);
    if (length_ - pos_ < len || std::strncmp(json_ + pos_, literal, len) != 0) {
      return false;
    }
    pos_ += len;
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (pos_ >= length_ || depth > kMaxDepth) return false;

    switch (json_[pos_]) {
      case '{':
        return parseObject(out, depth);
      case '[':
        return parseArray(out, depth);
      case '"':
        out.type = JsonValue::String;
        return parseString(out.string_val);
      case 't':
        out.type = JsonValue::Bool;
        out.bool_val = true;
        return consumeLiteral("true");
      case 'f':
        out.type = JsonValue::Bool;
        out.bool_val = false;
        return consumeLiteral("false");
      case 'n':
        out.type = JsonValue::Null;
        return consumeLiteral("null");
      default:
        return parseNumber(out);
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // skip '{'
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (pos_ < length_) {
      skipWhitespace();
      std::string key;
      if (pos_ >= length_ || json_[pos_] != '"' || !parseString(key)) return false;

      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != ':') return false;
      ++pos_;
      skipWhitespace();

      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.keys.push_back(std::move(key));
      out.items.push_back(std::move(member));

      skipWhitespace();
      if (pos_ >= length_) return false;
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // skip '['
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (pos_ < length_) {
      skipWhitespace();
      JsonValue element;
      if (!parseValue(element, depth + 1)) return false;
      out.items.push_back(std::move(element));

      skipWhitespace();
      if (pos_ >= length_) return false;
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  /// @brief Parse four hex digits at the cursor.
  bool parseHex4(uint32_t& code) {
    if (length_ - pos_ < 4) return false;
    code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char chr = json_[pos_++];
      code <<= 4;
      if (chr >= '0' && chr <= '9') {
        code |= static_cast<uint32_t>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        code |= static_cast<uint32_t>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        code |= static_cast<uint32_t>(chr - 'A' + 10);
      } else {
        return false;
      }
    }
    return true;
  }

  static void appendUtf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (code >> 18));
      out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
  }

  /// @brief Decode a \u escape (cursor just past the 'u'), joining surrogate pairs.
  /// Lone surrogates decode to U+FFFD.
  bool parseUnicodeEscape(std::string& out) {
    uint32_t code = 0;
    if (!parseHex4(code)) return false;

    if (code >= 0xD800 && code <= 0xDBFF) {
      if (length_ - pos_ >= 6 && json_[pos_] == '\\' && json_[pos_ + 1] == 'u') {
        size_t saved = pos_;
        pos_ += 2;
        uint32_t low = 0;
        if (!parseHex4(low)) return false;
        if (low >= 0xDC00 && low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        } else {
          pos_ = saved;
          code = 0xFFFD;
        }
      } else {
        code = 0xFFFD;
      }
    } else if (code >= 0xDC00 && code <= 0xDFFF) {
      code = 0xFFFD;
    }

    appendUtf8(out, code);
    return true;
  }

  /// @brief Parse a string literal (cursor at the opening quote).
  bool parseString(std::string& out) {
    ++pos_;  // skip opening quote
    out.clear();

    while (pos_ < length_) {
      char chr = json_[pos_++];
      if (chr == '"') return true;
      if (static_cast<unsigned char>(chr) < 0x20) return false;
      if (chr != '\\') {
        out += chr;
        continue;
      }

      if (pos_ >= length_) return false;
      char esc = json_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u':
          if (!parseUnicodeEscape(out)) return false;
          break;
        default:
          return false;
      }
    }
    return false;  // unterminated
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (pos_ < length_ && json_[pos_] == '-') ++pos_;
    size_t digits_start = pos_;
    while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    if (pos_ == digits_start) return false;
    if (pos_ < length_ && json_[pos_] == '.') {
      ++pos_;
      size_t frac_start = pos_;
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
      if (pos_ == frac_start) return false;
    }
    if (pos_ < length_ && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < length_ && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
      size_t exp_start = pos_;
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
      if (pos_ == exp_start) return false;
    }

    std::string num_str(json_ + start, pos_ - start);
    out.type = JsonValue::Number;
    out.number_val = std::strtod(num_str.c_str(), nullptr);
    return true;
  }

  const char* json_;
  size_t length_;
  size_t pos_ = 0;
};

}  // namespace

bool parseJson(const char* json, size_t length, JsonValue& out) {
  if (!json || length == 0) return false;
  JsonValue parsed;
  Parser parser(json, length);
  if (!parser.parseDocument(parsed)) return false;
  out = std::move(parsed);
  return true;
}

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length) {
  std::map<std::string, JsonValue> result;
  JsonValue root;
  if (!parseJson(json, length, root) || root.type != JsonValue::Object) {
    return result;
  }
  for (size_t idx = 0; idx < root.keys.size(); ++idx) {
    result[root.keys[idx]] = root.items[idx];
  }
  return result;
}

}  // namespace quill
