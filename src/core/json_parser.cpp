// Implementation of the recursive-descent JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace tessitura {

int JsonValue::asInt(int default_val) const {
  // Numbers outside int (and NaN) keep the default.
  if (type == Number && number_val >= static_cast<double>(std::numeric_limits<int>::min()) &&
      number_val <= static_cast<double>(std::numeric_limits<int>::max())) {
    return static_cast<int>(number_val);
  }
  return default_val;
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type == Number && number_val >= 0.0 &&
      number_val <= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
    return static_cast<uint32_t>(number_val);
  }
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
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

const JsonValue* JsonValue::find(std::string_view name) const {
  if (type != Object) return nullptr;
  for (const auto& member : object_members) {
    if (member.first == name) return &member.second;
  }
  return nullptr;
}

namespace {

/// Nesting limit guarding the recursive descent against hostile input.
constexpr int kMaxDepth = 256;

/// @brief Cursor over the JSON text with error tracking.
class Parser {
 public:
  explicit Parser(std::string_view text) : text_(text) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != text_.size()) return fail("unexpected trailing content");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  bool fail(const char* what) {
    if (error_.empty()) {
      error_ = std::string(what) + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  void skipWhitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) return fail("invalid literal");
    pos_ += literal.size();
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    if (pos_ >= text_.size()) return fail("unexpected end of input");

    char chr = text_[pos_];
    switch (chr) {
      case '{': return parseObject(out, depth);
      case '[': return parseArray(out, depth);
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
        if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
          return parseNumber(out);
        }
        return fail("unexpected character");
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // skip '{'
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
      storeMember(out, std::move(key), std::move(member));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // skip '['
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      JsonValue item;
      if (!parseValue(item, depth + 1)) return false;
      out.array_items.push_back(std::move(item));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  static void storeMember(JsonValue& object, std::string key, JsonValue member) {
    for (auto& existing : object.object_members) {
      if (existing.first == key) {
        existing.second = std::move(member);
        return;
      }
    }
    object.object_members.emplace_back(std::move(key), std::move(member));
  }

  bool parseHex4(uint32_t& code) {
    if (pos_ + 4 > text_.size()) return fail("truncated unicode escape");
    code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char chr = text_[pos_++];
      code <<= 4;
      if (chr >= '0' && chr <= '9') {
        code |= static_cast<uint32_t>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        code |= static_cast<uint32_t>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        code |= static_cast<uint32_t>(chr - 'A' + 10);
      } else {
        return fail("invalid unicode escape");
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

  bool parseString(std::string& out) {
    ++pos_;  // skip opening quote
    out.clear();
    while (pos_ < text_.size()) {
      char chr = text_[pos_++];
      if (chr == '"') return true;
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (pos_ >= text_.size()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t code = 0;
          if (!parseHex4(code)) return false;
          // Combine a UTF-16 surrogate pair when present.
          if (code >= 0xD800 && code <= 0xDBFF && pos_ + 1 < text_.size() &&
              text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
            pos_ += 2;
            uint32_t low = 0;
            if (!parseHex4(low)) return false;
            if (low >= 0xDC00 && low <= 0xDFFF) {
              code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            }
          }
          appendUtf8(out, code);
          break;
        }
        default:
          return fail("invalid escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (text_[pos_] == '-') ++pos_;
    auto digits = [&]() {
      size_t first = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
        ++pos_;
      }
      return pos_ > first;
    };
    if (!digits()) return fail("invalid number");
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digits()) return fail("invalid number");
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (!digits()) return fail("invalid number");
    }

    std::string num_str(text_.substr(start, pos_ - start));
    out.type = JsonValue::Number;
    out.number_val = std::strtod(num_str.c_str(), nullptr);
    return true;
  }

  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJson(std::string_view text, JsonValue& out, std::string* error_message) {
  Parser parser(text);
  JsonValue result;
  if (!parser.parseDocument(result)) {
    if (error_message) *error_message = parser.error();
    return false;
  }
  out = std::move(result);
  return true;
}

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length,
                                                 std::string* error_message) {
  std::map<std::string, JsonValue> result;
  if (!json || length == 0) {
    if (error_message) *error_message = "empty document";
    return result;
  }

  JsonValue root;
  if (!parseJson(std::string_view(json, length), root, error_message)) return result;
  if (!root.isObject()) {
    if (error_message) *error_message = "expected an object";
    return result;
  }
  for (auto& member : root.object_members) {
    result[member.first] = std::move(member.second);
  }
  return result;
}

}  // namespace tessitura
