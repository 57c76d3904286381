#pragma once

#include "trustgate/intake/artifact.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace trustgate::intake {

inline constexpr std::uint64_t DEFAULT_MAX_FILE_BYTES = 15ULL * 1024 * 1024;
inline constexpr std::size_t MIN_SIGNATURE_BYTES = 4;

[[nodiscard]] ArtifactFormat detect_format(const std::vector<unsigned char> &bytes);

[[nodiscard]] ValidationVerdict verify_artifact(const Artifact &artifact,
                                                std::uint64_t max_bytes = DEFAULT_MAX_FILE_BYTES,
                                                bool allow_webp = false);

[[nodiscard]] std::string size_limit_message(std::uint64_t max_bytes);

} // namespace trustgate::intake
