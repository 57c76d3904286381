#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustgate::config {

struct ScannerConfig {
  std::optional<std::string> api_key;
  std::string base_url = "https://www.virustotal.com/api/v3";
  std::uint32_t poll_attempts = 5;
  std::uint64_t poll_interval_ms = 3000;
  std::uint64_t timeout_ms = 30'000;
};

struct IntakeConfig {
  std::uint64_t max_file_bytes = 15ULL * 1024 * 1024;
  std::uint64_t max_batch_bytes = 20ULL * 1024 * 1024;
  std::uint64_t delivery_delay_ms = 1000;
  std::uint64_t url_delivery_delay_ms = 800;
  std::uint64_t fetch_timeout_ms = 15'000;
  std::vector<std::string> allowed_url_mime_types = {"application/pdf", "image/jpeg",
                                                     "image/png", "image/webp"};
};

struct SanitizeConfig {
  std::size_t text_max_length = 100;
  std::size_t code_max_length = 5000;
  std::size_t prompt_max_length = 2000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ScannerConfig scanner;
  IntakeConfig intake;
  SanitizeConfig sanitize;
  ObservabilityConfig observability;
};

} // namespace trustgate::config
