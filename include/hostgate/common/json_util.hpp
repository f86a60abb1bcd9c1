#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostgate::common {

/// Escape a string for embedding inside a JSON string literal. Control bytes become \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string, including \uXXXX (emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Field lookups on the top level of an object. Missing or mistyped fields yield "".
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

struct JsonToken {
  JsonKind kind = JsonKind::Null;
  /// Unescaped text for strings, raw text for everything else.
  std::string text;
};

using JsonTypedMap = std::unordered_map<std::string, JsonToken>;
using JsonFlatMap = std::unordered_map<std::string, std::string>;

/// Parse the top level of a JSON object. Nested objects and arrays are kept as raw text.
[[nodiscard]] JsonTypedMap json_parse_flat_typed(const std::string &json);
/// Same as json_parse_flat_typed, dropping the kinds.
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

} // namespace hostgate::common
