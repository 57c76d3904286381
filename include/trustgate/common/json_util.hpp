#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustgate::common {

// Handles \n \r \t \b \f and \uXXXX, including surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

struct JsonField {
  JsonKind kind = JsonKind::Null;
  std::string value; // unescaped for strings, raw text otherwise
};

using JsonFieldMap = std::unordered_map<std::string, JsonField>;

// Top-level members only. nullopt unless the whole text is one object.
[[nodiscard]] std::optional<JsonFieldMap> json_parse_fields(const std::string &json);

[[nodiscard]] std::vector<std::string> json_split_array(const std::string &array_json);

} // namespace trustgate::common
