// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for profile and map
// files and for the generation report. Parsing lives in json_parser.h.

#ifndef CAVEWALK_CORE_JSON_HELPERS_H
#define CAVEWALK_CORE_JSON_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cavewalk {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.field("width", 300);
///   writer.key("spawn");
///   writer.beginObject();
///   writer.field("x", 50);
///   writer.endObject();
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"width":300,"spawn":{"x":50}}
/// @endcode
///
/// Tracks comma insertion automatically. Does not validate structure (caller
/// must match begin/end pairs).
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
  void value(const char* val) { value(std::string_view(val)); }
  void value(int val);
  void value(uint32_t val);
  void value(size_t val);

  /// @brief Write a floating-point value; NaN and infinity become null.
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Write key and value in one call.
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the JSON string with pretty-print indentation.
  ///
  /// Arrays that contain only scalars stay on one line, so weight lists and
  /// grid rows remain readable.
  ///
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Append a scalar token and mark the current level as needing a comma.
  void writeScalar(std::string_view token);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open object/array: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace cavewalk

#endif  // CAVEWALK_CORE_JSON_HELPERS_H
