#pragma once

#include "trustgate/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace trustgate::security {

inline constexpr std::string_view IMPORT_PAYLOAD_HEADER = "ZPLUS:v1:";
inline constexpr std::size_t IMPORT_SAMPLE_SIZE = 5;

[[nodiscard]] common::Status validate_import_schema(const std::string &json);

// Plain JSON passes through; ZPLUS:v1: payloads are base64 gzip.
[[nodiscard]] common::Result<std::string> decode_import_payload(const std::string &content);

[[nodiscard]] common::Result<std::string> encode_import_payload(const std::string &json);

} // namespace trustgate::security
