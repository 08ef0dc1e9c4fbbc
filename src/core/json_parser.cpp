// Implementation of the recursive-descent JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace cavewalk {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type == Number && number_val >= 0.0) return static_cast<uint32_t>(number_val);
  return default_val;
}

size_t JsonValue::asSize(size_t default_val) const {
  if (type == Number && number_val >= 0.0) return static_cast<size_t>(number_val);
  return default_val;
}

float JsonValue::asFloat(float default_val) const {
  if (type == Number) return static_cast<float>(number_val);
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
  for (const auto& member : object_val) {
    if (member.first == key) return &member.second;
  }
  return nullptr;
}

namespace {

/// Nesting limit so hostile input cannot exhaust the stack.
constexpr int kMaxDepth = 64;

class Parser {
 public:
  explicit Parser(std::string_view text) : text_(text) {}

  JsonParseResult run() {
    JsonParseResult result;
    skipWhitespace();
    if (!parseValue(result.value, 0)) {
      result.error_message = error_;
      result.error_offset = pos_;
      return result;
    }
    skipWhitespace();
    if (pos_ != text_.size()) {
      result.error_message = "unexpected trailing characters";
      result.error_offset = pos_;
      return result;
    }
    result.success = true;
    return result;
  }

 private:
  bool fail(const char* message) {
    error_ = message;
    return false;
  }

  void skipWhitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) return false;
    pos_ += literal.size();
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    if (pos_ >= text_.size()) return fail("unexpected end of input");

    char chr = text_[pos_];
    if (chr == '{') return parseObject(out, depth);
    if (chr == '[') return parseArray(out, depth);
    if (chr == '"') {
      out.type = JsonValue::String;
      return parseString(out.string_val);
    }
    if (chr == 't' || chr == 'f') {
      out.type = JsonValue::Bool;
      out.bool_val = (chr == 't');
      if (!consumeLiteral(out.bool_val ? "true" : "false")) return fail("invalid literal");
      return true;
    }
    if (chr == 'n') {
      out.type = JsonValue::Null;
      if (!consumeLiteral("null")) return fail("invalid literal");
      return true;
    }
    return parseNumber(out);
  }

  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    while (pos_ < text_.size() && text_[pos_] != '"') {
      char chr = text_[pos_];
      if (chr != '\\') {
        out += chr;
        ++pos_;
        continue;
      }
      if (++pos_ >= text_.size()) break;
      switch (text_[pos_]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          if (pos_ + 4 >= text_.size()) return fail("truncated \\u escape");
          std::string hex(text_.substr(pos_ + 1, 4));
          char* end = nullptr;
          long code = std::strtol(hex.c_str(), &end, 16);
          if (end != hex.c_str() + 4) return fail("invalid \\u escape");
          out += code < 0x80 ? static_cast<char>(code) : '?';
          pos_ += 4;
          break;
        }
        default:
          return fail("invalid escape");
      }
      ++pos_;
    }
    if (pos_ >= text_.size()) return fail("unterminated string");
    ++pos_;  // closing quote
    return true;
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (pos_ < text_.size() && text_[pos_] == '-') ++pos_;
    while (pos_ < text_.size() &&
           (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.' ||
            text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '+' ||
            text_[pos_] == '-')) {
      ++pos_;
    }
    std::string num_str(text_.substr(start, pos_ - start));
    char* end = nullptr;
    double val = std::strtod(num_str.c_str(), &end);
    if (num_str.empty() || end != num_str.c_str() + num_str.size() || !std::isfinite(val)) {
      pos_ = start;
      return fail("invalid number");
    }
    out.type = JsonValue::Number;
    out.number_val = val;
    return true;
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // '['
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      skipWhitespace();
      JsonValue element;
      if (!parseValue(element, depth + 1)) return false;
      out.array_val.push_back(std::move(element));
      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated array");
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      if (text_[pos_] != ',') return fail("expected ',' or ']'");
      ++pos_;
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // '{'
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') return fail("expected object key");
      std::string key;
      if (!parseString(key)) return false;
      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      skipWhitespace();
      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.object_val.emplace_back(std::move(key), std::move(member));
      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated object");
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      if (text_[pos_] != ',') return fail("expected ',' or '}'");
      ++pos_;
    }
  }

  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

JsonParseResult parseJson(std::string_view text) {
  return Parser(text).run();
}

}  // namespace cavewalk
