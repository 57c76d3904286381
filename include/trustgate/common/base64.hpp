#pragma once

#include "trustgate/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace trustgate::common {

[[nodiscard]] std::string base64_encode(const std::vector<unsigned char> &bytes);
[[nodiscard]] Result<std::vector<unsigned char>> base64_decode(std::string_view text);

} // namespace trustgate::common
