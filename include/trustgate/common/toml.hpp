#pragma once

#include "trustgate/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace trustgate::common {

// The config file only needs strings, unsigned integers and string arrays.
using TomlValue = std::variant<std::string, std::uint64_t, std::vector<std::string>>;

// Values are typed at parse time and keyed "section.key". A getter falls back
// when the key is absent or holds another type.
struct TomlDocument {
  std::unordered_map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace trustgate::common
