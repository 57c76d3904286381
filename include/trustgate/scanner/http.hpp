#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustgate::scanner {

using HeaderMap = std::unordered_map<std::string, std::string>;

inline constexpr std::uint64_t NO_BODY_LIMIT = 0;

// Header keys are lower-cased. status is 0 when the request never completed.
struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  // Set with network_error when the body passed max_body_bytes; body is then empty.
  bool body_limit_exceeded = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HeaderMap &headers,
                                         std::uint64_t timeout_ms,
                                         std::uint64_t max_body_bytes) = 0;
  [[nodiscard]] virtual HttpResponse
  post_multipart(const std::string &url, const HeaderMap &headers, const std::string &field_name,
                 const std::string &filename, const std::vector<unsigned char> &bytes,
                 std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms, std::uint64_t max_body_bytes) override;
  [[nodiscard]] HttpResponse post_multipart(const std::string &url, const HeaderMap &headers,
                                            const std::string &field_name,
                                            const std::string &filename,
                                            const std::vector<unsigned char> &bytes,
                                            std::uint64_t timeout_ms) override;
};

} // namespace trustgate::scanner
