/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace Riposte {

// ============================================================================
// JsonValue
// ============================================================================

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 0:
    return JsonType::Null;
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  default:
    return JsonType::Object;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *value = std::get_if<bool>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *value = std::get_if<double>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  const double *value = std::get_if<double>(&m_value);
  if (value == nullptr || std::trunc(*value) != *value ||
      *value < static_cast<double>(std::numeric_limits<int>::min()) ||
      *value > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *value = std::get_if<std::string>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (object == nullptr) {
    return nullptr;
  }
  auto it = object->find(key);
  return it != object->end() ? &it->second : nullptr;
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray()) {
    return array->size();
  }
  if (const JsonObject *object = tryAsObject()) {
    return object->size();
  }
  return 0;
}

// ============================================================================
// Cursor: single pass recursive descent over the input text
// ============================================================================

class JsonReader::Cursor {
public:
  explicit Cursor(std::string_view text) : m_text(text) {}

  std::optional<JsonValue> parseDocument() {
    auto value = parseValue(0);
    if (!value) {
      return std::nullopt;
    }
    skipWhitespace();
    if (!atEnd()) {
      return fail("unexpected trailing characters");
    }
    return value;
  }

  const std::string &error() const { return m_error; }

private:
  std::optional<JsonValue> parseValue(size_t depth) {
    if (depth > MAX_DEPTH) {
      return fail("nesting too deep");
    }
    skipWhitespace();
    if (atEnd()) {
      return fail("unexpected end of input");
    }

    switch (peek()) {
    case '{':
      return parseObject(depth);
    case '[':
      return parseArray(depth);
    case '"': {
      auto text = parseString();
      if (!text) {
        return std::nullopt;
      }
      return JsonValue(std::move(*text));
    }
    case 't':
      return parseLiteral("true", JsonValue(true));
    case 'f':
      return parseLiteral("false", JsonValue(false));
    case 'n':
      return parseLiteral("null", JsonValue());
    default:
      return parseNumber();
    }
  }

  std::optional<JsonValue> parseObject(size_t depth) {
    advance(); // {
    JsonObject object;
    skipWhitespace();
    if (consume('}')) {
      return JsonValue(std::move(object));
    }

    while (true) {
      skipWhitespace();
      if (atEnd() || peek() != '"') {
        return fail("expected string key");
      }
      auto key = parseString();
      if (!key) {
        return std::nullopt;
      }
      skipWhitespace();
      if (!consume(':')) {
        return fail("expected ':' after key");
      }
      auto value = parseValue(depth + 1);
      if (!value) {
        return std::nullopt;
      }
      object.insert_or_assign(std::move(*key), std::move(*value));

      skipWhitespace();
      if (consume('}')) {
        return JsonValue(std::move(object));
      }
      if (!consume(',')) {
        return fail("expected ',' or '}' in object");
      }
    }
  }

  std::optional<JsonValue> parseArray(size_t depth) {
    advance(); // [
    JsonArray array;
    skipWhitespace();
    if (consume(']')) {
      return JsonValue(std::move(array));
    }

    while (true) {
      auto value = parseValue(depth + 1);
      if (!value) {
        return std::nullopt;
      }
      array.push_back(std::move(*value));

      skipWhitespace();
      if (consume(']')) {
        return JsonValue(std::move(array));
      }
      if (!consume(',')) {
        return fail("expected ',' or ']' in array");
      }
    }
  }

  std::optional<std::string> parseString() {
    advance(); // opening quote
    std::string result;
    while (!atEnd()) {
      const char c = advance();
      if (c == '"') {
        return result;
      }
      if (static_cast<unsigned char>(c) < 0x20) {
        failMessage("control character in string");
        return std::nullopt;
      }
      if (c != '\\') {
        result += c;
        continue;
      }
      if (atEnd()) {
        break;
      }
      switch (advance()) {
      case '"':
        result += '"';
        break;
      case '\\':
        result += '\\';
        break;
      case '/':
        result += '/';
        break;
      case 'b':
        result += '\b';
        break;
      case 'f':
        result += '\f';
        break;
      case 'n':
        result += '\n';
        break;
      case 'r':
        result += '\r';
        break;
      case 't':
        result += '\t';
        break;
      case 'u': {
        auto codepoint = parseCodepoint();
        if (!codepoint) {
          return std::nullopt;
        }
        appendUtf8(result, *codepoint);
        break;
      }
      default:
        failMessage("invalid escape sequence");
        return std::nullopt;
      }
    }
    failMessage("unterminated string");
    return std::nullopt;
  }

  // \uXXXX, combining surrogate pairs
  std::optional<uint32_t> parseCodepoint() {
    auto high = parseHex4();
    if (!high) {
      return std::nullopt;
    }
    if (*high < 0xD800 || *high > 0xDBFF) {
      return *high;
    }
    if (!consume('\\') || !consume('u')) {
      failMessage("unpaired surrogate");
      return std::nullopt;
    }
    auto low = parseHex4();
    if (!low) {
      return std::nullopt;
    }
    if (*low < 0xDC00 || *low > 0xDFFF) {
      failMessage("invalid low surrogate");
      return std::nullopt;
    }
    return 0x10000 + ((*high - 0xD800) << 10) + (*low - 0xDC00);
  }

  std::optional<uint32_t> parseHex4() {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      if (atEnd()) {
        failMessage("truncated unicode escape");
        return std::nullopt;
      }
      const char c = advance();
      value <<= 4;
      if (c >= '0' && c <= '9') {
        value |= static_cast<uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        value |= static_cast<uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        value |= static_cast<uint32_t>(c - 'A' + 10);
      } else {
        failMessage("invalid hex digit in unicode escape");
        return std::nullopt;
      }
    }
    return value;
  }

  static void appendUtf8(std::string &out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
      out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
      out += static_cast<char>(0xC0 | (codepoint >> 6));
      out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
      out += static_cast<char>(0xE0 | (codepoint >> 12));
      out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (codepoint >> 18));
      out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
  }

  std::optional<JsonValue> parseNumber() {
    const size_t start = m_pos;
    consume('-');
    if (atEnd() || !isDigit(peek())) {
      return fail("invalid value");
    }
    // No leading zeros
    if (peek() == '0') {
      advance();
    } else {
      skipDigits();
    }
    if (consume('.')) {
      if (atEnd() || !isDigit(peek())) {
        return fail("expected digit after decimal point");
      }
      skipDigits();
    }
    if (!atEnd() && (peek() == 'e' || peek() == 'E')) {
      advance();
      if (!consume('+')) {
        consume('-');
      }
      if (atEnd() || !isDigit(peek())) {
        return fail("expected digit in exponent");
      }
      skipDigits();
    }

    double value = 0.0;
    const char *first = m_text.data() + start;
    const char *last = m_text.data() + m_pos;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
      return fail("number out of range");
    }
    return JsonValue(value);
  }

  std::optional<JsonValue> parseLiteral(std::string_view word, JsonValue value) {
    if (m_text.substr(m_pos, word.size()) != word) {
      return fail("invalid literal");
    }
    for (size_t i = 0; i < word.size(); ++i) {
      advance();
    }
    return value;
  }

  void skipWhitespace() {
    while (!atEnd()) {
      const char c = peek();
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        return;
      }
      advance();
    }
  }

  void skipDigits() {
    while (!atEnd() && isDigit(peek())) {
      advance();
    }
  }

  static bool isDigit(char c) { return c >= '0' && c <= '9'; }

  bool atEnd() const { return m_pos >= m_text.size(); }
  char peek() const { return m_text[m_pos]; }

  char advance() {
    const char c = m_text[m_pos++];
    if (c == '\n') {
      ++m_line;
      m_column = 1;
    } else {
      ++m_column;
    }
    return c;
  }

  bool consume(char expected) {
    if (atEnd() || peek() != expected) {
      return false;
    }
    advance();
    return true;
  }

  void failMessage(const char *message) {
    if (m_error.empty()) {
      m_error = std::format("{} at line {}, column {}", message, m_line, m_column);
    }
  }

  std::optional<JsonValue> fail(const char *message) {
    failMessage(message);
    return std::nullopt;
  }

  std::string_view m_text;
  size_t m_pos{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_error;
};

// ============================================================================
// JsonReader
// ============================================================================

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!parse(buffer.str())) {
    m_lastError = path + ": " + m_lastError;
    return false;
  }
  return true;
}

bool JsonReader::parse(std::string_view text) {
  m_lastError.clear();

  Cursor cursor(text);
  auto root = cursor.parseDocument();
  if (!root) {
    m_lastError = cursor.error();
    return false;
  }
  m_root = std::move(*root);
  return true;
}

} // namespace Riposte
