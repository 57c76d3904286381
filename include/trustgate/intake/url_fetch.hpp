#pragma once

#include "trustgate/common/result.hpp"
#include "trustgate/scanner/http.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace trustgate::intake {

struct FetchedResource {
  std::vector<unsigned char> bytes;
  // Lower-cased, parameters stripped. Empty when the server sent none.
  std::string mime_type;
  std::string name;
};

[[nodiscard]] std::string resource_name_from_url(const std::string &url);

[[nodiscard]] std::string normalize_mime(const std::string &content_type);

class UrlFetcher {
public:
  // Bodies larger than max_bytes are abandoned mid-transfer.
  UrlFetcher(scanner::HttpClient &http, std::uint64_t timeout_ms, std::uint64_t max_bytes);

  [[nodiscard]] common::Result<FetchedResource> fetch(const std::string &url);

private:
  scanner::HttpClient &http_;
  std::uint64_t timeout_ms_;
  std::uint64_t max_bytes_;
};

} // namespace trustgate::intake
