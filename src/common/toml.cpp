#include "trustgate/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace trustgate::common {

namespace {

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

// Reads one line left to right. Every read either consumes input or reports
// why it could not.
class LineReader {
public:
  LineReader(const std::string &line, const std::size_t number) : line_(line), number_(number) {}

  void skip_blanks() {
    while (pos_ < line_.size() && (line_[pos_] == ' ' || line_[pos_] == '\t')) {
      ++pos_;
    }
  }

  [[nodiscard]] bool at_end_or_comment() {
    skip_blanks();
    return pos_ >= line_.size() || line_[pos_] == '#' || line_[pos_] == '\r';
  }

  [[nodiscard]] bool consume(const char ch) {
    skip_blanks();
    if (pos_ < line_.size() && line_[pos_] == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  [[nodiscard]] std::string bare_key() {
    skip_blanks();
    const std::size_t start = pos_;
    while (pos_ < line_.size() && is_bare_key_char(line_[pos_])) {
      ++pos_;
    }
    return line_.substr(start, pos_ - start);
  }

  // Dotted name inside [ ]; empty when malformed.
  [[nodiscard]] std::string section_name() {
    std::string name = bare_key();
    while (!name.empty() && consume('.')) {
      const std::string part = bare_key();
      if (part.empty()) {
        return "";
      }
      name += "." + part;
    }
    return name;
  }

  [[nodiscard]] Result<TomlValue> value() {
    skip_blanks();
    if (pos_ >= line_.size()) {
      return fail("Missing value");
    }
    const char ch = line_[pos_];
    if (ch == '"') {
      auto text = quoted();
      if (!text.ok()) {
        return Result<TomlValue>::failure(text.error());
      }
      return Result<TomlValue>::success(TomlValue(text.take()));
    }
    if (ch == '[') {
      return array();
    }
    if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      return integer();
    }
    return fail("Invalid value");
  }

  [[nodiscard]] std::string where() const { return " at line " + std::to_string(number_); }

private:
  [[nodiscard]] Result<TomlValue> fail(const std::string &what) const {
    return Result<TomlValue>::failure(what + where());
  }

  [[nodiscard]] Result<std::string> quoted() {
    ++pos_;
    std::string out;
    while (pos_ < line_.size()) {
      const char ch = line_[pos_++];
      if (ch == '"') {
        return Result<std::string>::success(std::move(out));
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= line_.size()) {
        break;
      }
      switch (line_[pos_++]) {
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        return Result<std::string>::failure("Invalid escape sequence" + where());
      }
    }
    return Result<std::string>::failure("Unterminated string" + where());
  }

  [[nodiscard]] Result<TomlValue> integer() {
    std::string digits;
    while (pos_ < line_.size() &&
           (std::isalnum(static_cast<unsigned char>(line_[pos_])) != 0 || line_[pos_] == '_')) {
      if (line_[pos_] != '_') {
        digits.push_back(line_[pos_]);
      }
      ++pos_;
    }
    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      return fail("Invalid value");
    }
    return Result<TomlValue>::success(TomlValue(parsed));
  }

  // Single-line array of strings. A trailing comma is allowed.
  [[nodiscard]] Result<TomlValue> array() {
    ++pos_;
    std::vector<std::string> items;
    while (true) {
      if (consume(']')) {
        return Result<TomlValue>::success(TomlValue(std::move(items)));
      }
      skip_blanks();
      if (pos_ >= line_.size() || line_[pos_] != '"') {
        return fail("Arrays may only hold strings");
      }
      auto item = quoted();
      if (!item.ok()) {
        return Result<TomlValue>::failure(item.error());
      }
      items.push_back(item.take());
      if (!consume(',')) {
        if (consume(']')) {
          return Result<TomlValue>::success(TomlValue(std::move(items)));
        }
        return fail("Unterminated array");
      }
    }
  }

  const std::string &line_;
  std::size_t number_;
  std::size_t pos_ = 0;
};

template <typename T> const T *typed(const TomlDocument &doc, const std::string &key) {
  const auto it = doc.values.find(key);
  return it == doc.values.end() ? nullptr : std::get_if<T>(&it->second);
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = typed<std::string>(*this, key);
  return value != nullptr ? *value : fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto *value = typed<std::uint64_t>(*this, key);
  return value != nullptr ? *value : fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto *value = typed<std::vector<std::string>>(*this, key);
  return value != nullptr ? *value : fallback;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::string section;
  std::istringstream input(content);
  std::string line;
  std::size_t number = 0;

  while (std::getline(input, line)) {
    ++number;
    LineReader reader(line, number);
    if (reader.at_end_or_comment()) {
      continue;
    }

    if (reader.consume('[')) {
      section = reader.section_name();
      if (section.empty() || !reader.consume(']') || !reader.at_end_or_comment()) {
        return Result<TomlDocument>::failure("Invalid section header" + reader.where());
      }
      continue;
    }

    const std::string key = reader.bare_key();
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key" + reader.where());
    }
    if (!reader.consume('=')) {
      return Result<TomlDocument>::failure("Expected '=' after " + key + reader.where());
    }
    auto value = reader.value();
    if (!value.ok()) {
      return Result<TomlDocument>::failure(value.error());
    }
    if (!reader.at_end_or_comment()) {
      return Result<TomlDocument>::failure("Unexpected text after value" + reader.where());
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, value.take()).second) {
      return Result<TomlDocument>::failure("Duplicate key " + full_key + reader.where());
    }
  }
  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(ch);
    }
  }
  out += '"';
  return out;
}

} // namespace trustgate::common
