/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tessitura {

std::string formatDecimal(double val, int decimals) {
  if (decimals < 1) decimals = 1;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, val);
  std::string text(buf);

  // Trim trailing zeros but keep one digit after the point.
  size_t dot = text.find('.');
  if (dot != std::string::npos) {
    size_t last = text.size() - 1;
    while (last > dot + 1 && text[last] == '0') --last;
    text.erase(last + 1);
  }
  if (text == "-0.0") text = "0.0";
  return text;
}

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The next element is this key's value and takes no comma prefix.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(std::string_view val) {
  appendScalar("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(int val) {
  appendScalar(std::to_string(val));
}

void JsonWriter::value(uint32_t val) {
  appendScalar(std::to_string(val));
}

void JsonWriter::value(uint64_t val) {
  appendScalar(std::to_string(val));
}

void JsonWriter::value(double val) {
  if (!std::isfinite(val)) {
    appendScalar("null");
    return;
  }
  // Shortest of %.15g / %.17g that reads back to the same double.
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", val);
  if (std::strtod(buf, nullptr) != val) {
    std::snprintf(buf, sizeof(buf), "%.17g", val);
  }
  std::string text(buf);
  // Keep integral doubles recognizable as floating point ("2.0", not "2").
  if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
  appendScalar(text);
}

void JsonWriter::value(double val, int decimals) {
  if (!std::isfinite(val)) {
    appendScalar("null");
    return;
  }
  appendScalar(formatDecimal(val, decimals));
}

void JsonWriter::value(bool val) {
  appendScalar(val ? "true" : "false");
}

void JsonWriter::valueNull() {
  appendScalar("null");
}

void JsonWriter::valuePair(double first, double second, int decimals) {
  beginArray();
  value(first, decimals);
  value(second, decimals);
  endArray();
}

std::string JsonWriter::toString() const {
  return buffer_;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  // Simple pretty-printer: add newlines and indentation after structural chars.
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
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
      case '{':
      case '[':
        result += chr;
        ++depth;
        // Keep empty containers compact: {} or [].
        if (pos + 1 >= buffer_.size() ||
            (buffer_[pos + 1] != '}' && buffer_[pos + 1] != ']')) {
          indent();
        }
        break;

      case '}':
      case ']':
        --depth;
        if (result.empty() || (result.back() != '{' && result.back() != '[')) {
          indent();
        }
        result += chr;
        break;

      case ',':
        result += chr;
        indent();
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

void JsonWriter::appendScalar(const std::string& token) {
  maybeComma();
  buffer_ += token;
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
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
        // Escape control characters (0x00-0x1F) as \u00XX.
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

}  // namespace tessitura
