#include "trustgate/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

namespace trustgate::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

bool parse_hex4(const std::string &raw, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  std::uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data() + pos, raw.data() + pos + 4, value, 16);
  if (ec != std::errc() || ptr != raw.data() + pos + 4) {
    return false;
  }
  out = value;
  return true;
}

std::size_t scan_scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  return pos;
}

// Returns the position one past the value starting at pos, or npos.
std::size_t skip_value(const std::string &json, std::size_t pos, JsonField *field) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    if (field != nullptr) {
      field->kind = JsonKind::String;
      field->value = json_unescape(json.substr(pos + 1, end - pos - 1));
    }
    return end + 1;
  }
  if (ch == '{' || ch == '[') {
    const char close = ch == '{' ? '}' : ']';
    const auto end = json_find_matching_token(json, pos, ch, close);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    if (field != nullptr) {
      field->kind = ch == '{' ? JsonKind::Object : JsonKind::Array;
      field->value = json.substr(pos, end - pos + 1);
    }
    return end + 1;
  }

  const auto end = scan_scalar_end(json, pos);
  if (end == pos) {
    return std::string::npos;
  }
  const std::string token = json.substr(pos, end - pos);
  JsonKind kind = JsonKind::Number;
  if (token == "true" || token == "false") {
    kind = JsonKind::Bool;
  } else if (token == "null") {
    kind = JsonKind::Null;
  } else {
    for (const char c : token) {
      if (std::isdigit(static_cast<unsigned char>(c)) == 0 && c != '-' && c != '+' && c != '.' &&
          c != 'e' && c != 'E') {
        return std::string::npos;
      }
    }
  }
  if (field != nullptr) {
    field->kind = kind;
    field->value = token;
  }
  return end;
}

} // namespace

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back(next);
        break;
      }
      i += 4;
      if (cp >= 0xD800U && cp <= 0xDBFFU && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00U && low <= 0xDFFFU) {
          cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<JsonFieldMap> json_parse_fields(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  const auto close = json_find_matching_token(json, pos, '{', '}');
  if (close == std::string::npos || json_skip_ws(json, close + 1) != json.size()) {
    return std::nullopt;
  }

  JsonFieldMap fields;
  pos = json_skip_ws(json, pos + 1);
  if (pos == close) {
    return fields;
  }

  while (pos < close) {
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= close) {
      return std::nullopt;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= close || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);

    JsonField field;
    const auto value_end = skip_value(json, pos, &field);
    if (value_end == std::string::npos || value_end > close) {
      return std::nullopt;
    }
    fields[key] = std::move(field);

    pos = json_skip_ws(json, value_end);
    if (pos == close) {
      return fields;
    }
    if (json[pos] != ',') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
  }
  return std::nullopt;
}

std::vector<std::string> json_split_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  const auto close = json_find_matching_token(array_json, pos, '[', ']');
  if (close == std::string::npos) {
    return out;
  }

  pos = json_skip_ws(array_json, pos + 1);
  while (pos < close) {
    const auto end = skip_value(array_json, pos, nullptr);
    if (end == std::string::npos || end > close) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = json_skip_ws(array_json, end);
    if (pos < close && array_json[pos] == ',') {
      pos = json_skip_ws(array_json, pos + 1);
    } else {
      break;
    }
  }
  return out;
}

} // namespace trustgate::common
