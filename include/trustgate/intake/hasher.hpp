#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace trustgate::intake {

[[nodiscard]] std::string sha256_hex(const std::vector<unsigned char> &bytes);
[[nodiscard]] std::string sha256_hex(std::string_view text);

} // namespace trustgate::intake
