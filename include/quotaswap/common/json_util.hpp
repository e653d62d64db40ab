#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quotaswap::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (handles \uXXXX as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// `value` escaped and wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Shortest round-trippable text for a finite double.
[[nodiscard]] std::string json_number(double value);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Strict syntax check of a complete JSON document.
[[nodiscard]] bool json_is_valid(const std::string &json);

/// One top-level member of an object, value kept as raw JSON text.
struct JsonField {
  std::string key;
  std::string raw;
};

using JsonFields = std::vector<JsonField>;

/// Members of a JSON object in document order; nullopt unless `json` is a valid object.
[[nodiscard]] std::optional<JsonFields> json_object_fields(const std::string &json);

/// Raw elements of a JSON array; nullopt unless `json` is a valid array.
[[nodiscard]] std::optional<std::vector<std::string>> json_array_elements(const std::string &json);

[[nodiscard]] const std::string *json_find_field(const JsonFields &fields, const std::string &key);

/// Replace the member named `key`, or append it if absent.
void json_set_field(JsonFields &fields, const std::string &key, std::string raw);

[[nodiscard]] std::optional<std::string> json_string_value(const std::string &raw);
[[nodiscard]] std::optional<double> json_number_value(const std::string &raw);
[[nodiscard]] bool json_is_null(const std::string &raw);

/// Render members as an indented object. `indent` is the nesting depth of the braces.
[[nodiscard]] std::string json_render_object(const JsonFields &fields, std::size_t indent = 0);

} // namespace quotaswap::common
