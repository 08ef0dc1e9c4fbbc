// Small recursive-descent JSON parser for profile and map files (no external
// dependencies).
//
// Supports the full value grammar (objects, arrays, strings, numbers, booleans,
// null). Object members keep their file order. \u escapes outside ASCII are
// not decoded.

#ifndef CAVEWALK_CORE_JSON_PARSER_H
#define CAVEWALK_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cavewalk {

/// @brief A parsed JSON value.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  bool bool_val = false;
  double number_val = 0.0;
  std::string string_val;
  std::vector<JsonValue> array_val;
  std::vector<std::pair<std::string, JsonValue>> object_val;

  bool isNumber() const { return type == Number; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as unsigned integer, with default (negative numbers
  /// also yield the default).
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as size, with default (negative numbers also yield the
  /// default).
  size_t asSize(size_t default_val = 0) const;

  /// @brief Get value as float, with default.
  float asFloat(float default_val = 0.0f) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Look up an object member.
  /// @return The first member with that key, or nullptr if missing or not an object.
  const JsonValue* find(std::string_view key) const;
};

/// @brief Outcome of parsing a JSON document.
struct JsonParseResult {
  bool success = false;
  JsonValue value;
  std::string error_message;
  size_t error_offset = 0;  ///< Byte offset of the first error.
};

/// @brief Parse a complete JSON document.
///
/// Trailing non-whitespace after the top-level value is an error.
///
/// @param text JSON source.
/// @return Parsed value, or an error with its byte offset.
JsonParseResult parseJson(std::string_view text);

}  // namespace cavewalk

#endif  // CAVEWALK_CORE_JSON_PARSER_H
