#include "trustgate/intake/url_fetch.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/intake/signature.hpp"

namespace trustgate::intake {

std::string resource_name_from_url(const std::string &url) {
  std::string path = url;
  const auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path.resize(cut);
  }
  const auto slash = path.find_last_of('/');
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  // A bare "https:" or host with no path is not a file name.
  if (name.empty() || url.find("://") == std::string::npos ||
      path.find('/', path.find("://") + 3) == std::string::npos) {
    return "url_file";
  }
  return name;
}

std::string normalize_mime(const std::string &content_type) {
  const auto semicolon = content_type.find(';');
  return common::to_lower(common::trim(content_type.substr(0, semicolon)));
}

UrlFetcher::UrlFetcher(scanner::HttpClient &http, const std::uint64_t timeout_ms,
                       const std::uint64_t max_bytes)
    : http_(http), timeout_ms_(timeout_ms), max_bytes_(max_bytes) {}

common::Result<FetchedResource> UrlFetcher::fetch(const std::string &url) {
  if (!common::starts_with(url, "http://") && !common::starts_with(url, "https://")) {
    return common::Result<FetchedResource>::failure("Only http and https URLs can be fetched.");
  }

  const scanner::HttpResponse response = http_.get(url, {}, timeout_ms_, max_bytes_);
  if (response.body_limit_exceeded) {
    return common::Result<FetchedResource>::failure(size_limit_message(max_bytes_));
  }
  if (response.network_error) {
    return common::Result<FetchedResource>::failure("Failed to fetch URL: " +
                                                    response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<FetchedResource>::failure("Failed to fetch URL: status " +
                                                    std::to_string(response.status));
  }

  FetchedResource resource;
  resource.bytes.assign(response.body.begin(), response.body.end());
  if (const auto it = response.headers.find("content-type"); it != response.headers.end()) {
    resource.mime_type = normalize_mime(it->second);
  }
  resource.name = resource_name_from_url(url);
  return common::Result<FetchedResource>::success(std::move(resource));
}

} // namespace trustgate::intake
