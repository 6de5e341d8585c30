// Minimal JSON parser for library files and config input (no external dependencies).
//
// Parses a complete JSON document into a JsonValue tree. Object members keep
// document order; a repeated key keeps its last value. Parsing never throws:
// malformed input is reported through the return value.

#ifndef TESSITURA_CORE_JSON_PARSER_H
#define TESSITURA_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessitura {

/// @brief A JSON value of any type.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<JsonValue> array_items;
  std::vector<std::pair<std::string, JsonValue>> object_members;

  bool isNull() const { return type == Null; }
  bool isNumber() const { return type == Number; }
  bool isString() const { return type == String; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as integer, with default (outside int range -> default).
  int asInt(int default_val = 0) const;

  /// @brief Get value as unsigned integer, with default (negative or too large -> default).
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Look up an object member.
  /// @param name Member key.
  /// @return Pointer to the member value, or nullptr if absent or not an object.
  const JsonValue* find(std::string_view name) const;
};

/// @brief Parse a complete JSON document.
/// @param text JSON text.
/// @param out Receives the parsed value on success.
/// @param error_message Optional; receives a description with byte offset on failure.
/// @return True on success. Trailing non-whitespace content is an error.
bool parseJson(std::string_view text, JsonValue& out, std::string* error_message = nullptr);

/// @brief Parse a JSON object into a key-value map of its top-level members.
///
/// Intended for flat config objects; nested values are kept as JsonValue trees.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @param error_message Optional; set when the text is empty, malformed or not an object.
/// @return Map of key-value pairs. Empty map on parse error or non-object input.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length,
                                                 std::string* error_message = nullptr);

}  // namespace tessitura

#endif  // TESSITURA_CORE_JSON_PARSER_H
