/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace cavewalk {

namespace {

/// @brief True if the array opening at buffer[open] contains no nested
/// object or array before its closing bracket.
bool isScalarArray(const std::string& buffer, size_t open) {
  bool in_string = false;
  bool escaped = false;
  for (size_t pos = open + 1; pos < buffer.size(); ++pos) {
    char chr = buffer[pos];
    if (escaped) {
      escaped = false;
    } else if (in_string) {
      if (chr == '\\') escaped = true;
      if (chr == '"') in_string = false;
    } else if (chr == '"') {
      in_string = true;
    } else if (chr == '{' || chr == '[') {
      return false;
    } else if (chr == ']') {
      return true;
    }
  }
  return true;
}

}  // namespace

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The next element is this key's value and takes no comma.
  if (!needs_comma_.empty()) needs_comma_.back() = false;
}

void JsonWriter::value(std::string_view val) {
  writeScalar("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(int val) {
  writeScalar(std::to_string(val));
}

void JsonWriter::value(uint32_t val) {
  writeScalar(std::to_string(val));
}

void JsonWriter::value(size_t val) {
  writeScalar(std::to_string(val));
}

void JsonWriter::value(double val) {
  if (std::isnan(val) || std::isinf(val)) {
    writeScalar("null");
    return;
  }
  std::ostringstream oss;
  oss << val;
  writeScalar(oss.str());
}

void JsonWriter::value(bool val) {
  writeScalar(val ? "true" : "false");
}

void JsonWriter::valueNull() {
  writeScalar("null");
}

std::string JsonWriter::toString() const {
  return buffer_;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  int inline_depth = 0;  // > 0 while inside a scalar-only array
  bool in_string = false;
  bool escaped = false;

  auto indent = [&]() {
    result += '\n';
    for (int idx = 0; idx < depth * indent_size; ++idx) {
      result += ' ';
    }
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (escaped) {
      result += chr;
      escaped = false;
      continue;
    }
    if (chr == '\\' && in_string) {
      result += chr;
      escaped = true;
      continue;
    }
    if (chr == '"') {
      in_string = !in_string;
      result += chr;
      continue;
    }
    if (in_string) {
      result += chr;
      continue;
    }

    switch (chr) {
      case '[':
        if (isScalarArray(buffer_, pos)) {
          ++inline_depth;
          result += chr;
          break;
        }
        [[fallthrough]];
      case '{':
        result += chr;
        ++depth;
        if (pos + 1 < buffer_.size() && (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']')) {
          // Keep empty containers compact: {} or [].
        } else {
          indent();
        }
        break;

      case '}':
      case ']':
        if (chr == ']' && inline_depth > 0) {
          --inline_depth;
          result += chr;
        } else if (!result.empty() && (result.back() == '{' || result.back() == '[')) {
          --depth;
          result += chr;
        } else {
          --depth;
          indent();
          result += chr;
        }
        break;

      case ',':
        result += chr;
        if (inline_depth > 0) {
          result += ' ';
        } else {
          indent();
        }
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

void JsonWriter::writeScalar(std::string_view token) {
  maybeComma();
  buffer_ += token;
  if (!needs_comma_.empty()) needs_comma_.back() = true;
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
        // Control characters (0x00-0x1F) as \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace cavewalk
