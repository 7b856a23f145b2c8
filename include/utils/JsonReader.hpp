/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Riposte {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

constexpr const char *toString(JsonType type) {
  switch (type) {
  case JsonType::Null:
    return "null";
  case JsonType::Boolean:
    return "boolean";
  case JsonType::Number:
    return "number";
  case JsonType::String:
    return "string";
  case JsonType::Array:
    return "array";
  case JsonType::Object:
    return "object";
  }
  return "unknown";
}

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  return os << toString(type);
}

/**
 * @brief Immutable-by-convention JSON document node.
 *
 * Numbers are stored as double. Checked accessors return std::optional (or
 * a null pointer for containers) instead of throwing on a type mismatch.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // Only succeeds for integral numbers that fit in an int
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Object member lookup; nullptr if not an object or the key is missing
  const JsonValue *find(const std::string &key) const;
  bool hasKey(const std::string &key) const { return find(key) != nullptr; }

  size_t size() const;

private:
  ValueType m_value;
};

/**
 * @brief Strict RFC 8259 reader (no comments, no trailing commas).
 *
 * Parse failures leave the previous root untouched and describe the first
 * error, with its line and column, in getLastError().
 */
class JsonReader {
public:
  static constexpr size_t MAX_DEPTH{64};

  bool loadFromFile(const std::string &path);
  bool parse(std::string_view text);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }

private:
  class Cursor;

  JsonValue m_root;
  std::string m_lastError;
};

} // namespace Riposte

#endif // JSONREADER_HPP
