// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the song library
// round-trip format, recommendation output and experiment reports. Does not
// parse JSON (see core/json_parser.h).

#ifndef TESSITURA_CORE_JSON_HELPERS_H
#define TESSITURA_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tessitura {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("rank");
///   writer.value(1);
///   writer.key("final_score");
///   writer.value(0.87654321, 4);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"rank":1,"final_score":0.8765}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  /// @brief Begin a JSON object '{'.
  void beginObject();

  /// @brief End a JSON object '}'.
  void endObject();

  /// @brief Begin a JSON array '['.
  void beginArray();

  /// @brief End a JSON array ']'.
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  /// @param name Key string.
  void key(std::string_view name);

  /// @brief Write a string value.
  /// @param val String to write (will be JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C string value (avoids the bool overload for literals).
  void value(const char* val) { value(std::string_view(val)); }

  /// @brief Write an integer value.
  void value(int val);

  /// @brief Write an unsigned integer value.
  void value(uint32_t val);

  /// @brief Write a size/count value.
  void value(uint64_t val);

  /// @brief Write a floating-point value at full round-trip precision.
  /// NaN and infinity are written as null.
  void value(double val);

  /// @brief Write a floating-point value rounded to a fixed number of decimals.
  /// @param val Value to write.
  /// @param decimals Digits after the decimal point (trailing zeros trimmed).
  void value(double val, int decimals);

  /// @brief Write a boolean value.
  void value(bool val);

  /// @brief Write a null value.
  void valueNull();

  /// @brief Write a [lo, hi] pair rounded to a fixed number of decimals.
  void valuePair(double first, double second, int decimals);

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Append a raw scalar token and mark the current level as needing a comma.
  void appendScalar(const std::string& token);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // Track whether we need a comma before the next element.
  // Each nesting level pushes a new entry.
  std::vector<bool> needs_comma_;
};

/// @brief Format a double with fixed decimals, trimming trailing zeros.
///
/// Keeps at least one digit after the point ("1.0", "0.25", "-0.1235").
/// Negative zero is written as "0.0".
std::string formatDecimal(double val, int decimals);

}  // namespace tessitura

#endif  // TESSITURA_CORE_JSON_HELPERS_H
