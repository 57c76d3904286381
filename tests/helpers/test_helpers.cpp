#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>

namespace trustgate::testing {

namespace {

std::vector<unsigned char> with_prefix(std::vector<unsigned char> prefix, const std::size_t size) {
  if (prefix.size() < size) {
    prefix.resize(size, 0x20);
  }
  return prefix;
}

std::string stats_json(const std::uint32_t malicious, const std::uint32_t suspicious,
                       const std::uint32_t harmless, const std::uint32_t undetected) {
  return R"({"malicious":)" + std::to_string(malicious) + R"(,"suspicious":)" +
         std::to_string(suspicious) + R"(,"harmless":)" + std::to_string(harmless) +
         R"(,"undetected":)" + std::to_string(undetected) + R"(,"timeout":0})";
}

} // namespace

config::Config mock_config() {
  config::Config config;
  config.scanner = scanner_config();
  config.observability.backend = "none";
  return config;
}

config::ScannerConfig scanner_config() {
  config::ScannerConfig config;
  config.api_key = kTestApiKey;
  config.base_url = kTestBaseUrl;
  return config;
}

std::vector<unsigned char> pdf_bytes(const std::size_t size) {
  return with_prefix({0x25, 0x50, 0x44, 0x46, '-', '1', '.', '7', '\n'}, size);
}

std::vector<unsigned char> jpeg_bytes(const std::size_t size) {
  return with_prefix({0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F'}, size);
}

std::vector<unsigned char> png_bytes(const std::size_t size) {
  return with_prefix({0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, size);
}

std::vector<unsigned char> webp_bytes(const std::size_t size) {
  return with_prefix({'R', 'I', 'F', 'F', 0x24, 0x00, 0x00, 0x00, 'W', 'E', 'B', 'P', 'V', 'P',
                      '8', ' '},
                     size);
}

std::vector<unsigned char> executable_bytes(const std::size_t size) {
  return with_prefix({0x4D, 0x5A, 0x90, 0x00, 0x03, 0x00}, size);
}

std::string lookup_body(const std::uint32_t malicious, const std::uint32_t suspicious,
                        const std::uint32_t harmless, const std::uint32_t undetected,
                        const std::optional<std::string> &threat_label) {
  std::string attributes = R"("last_analysis_stats":)" +
                           stats_json(malicious, suspicious, harmless, undetected);
  if (threat_label.has_value()) {
    attributes += R"(,"popular_threat_classification":{"suggested_threat_label":")" +
                  *threat_label + R"("})";
  }
  return R"({"data":{"id":"abc","type":"file","attributes":{)" + attributes + "}}}";
}

std::string analysis_body(const std::string &status) {
  return R"({"data":{"id":"an-1","type":"analysis","attributes":{"status":")" + status +
         R"(","stats":{}}}})";
}

std::string completed_analysis_body(const std::uint32_t malicious, const std::uint32_t suspicious,
                                    const std::uint32_t harmless, const std::uint32_t undetected) {
  return R"({"data":{"id":"an-1","type":"analysis","attributes":{"status":"completed","stats":)" +
         stats_json(malicious, suspicious, harmless, undetected) + "}}}";
}

std::string upload_body(const std::string &analysis_id) {
  return R"({"data":{"type":"analysis","id":")" + analysis_id + R"("}})";
}

void FakeHttpClient::enqueue(scanner::HttpResponse response) {
  responses_.push_back(std::move(response));
}

void FakeHttpClient::enqueue_status(const std::uint16_t status, std::string body) {
  scanner::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  enqueue(std::move(response));
}

void FakeHttpClient::enqueue_network_error(std::string message) {
  scanner::HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  enqueue(std::move(response));
}

scanner::HttpResponse FakeHttpClient::get(const std::string &url,
                                          const scanner::HeaderMap &headers,
                                          const std::uint64_t,
                                          const std::uint64_t max_body_bytes) {
  requests_.push_back(RecordedRequest{
      .method = "GET", .url = url, .headers = headers, .max_body_bytes = max_body_bytes});
  scanner::HttpResponse response = next();
  // Same outcome as the curl client aborting an oversized transfer.
  if (max_body_bytes != scanner::NO_BODY_LIMIT && response.body.size() > max_body_bytes) {
    response = scanner::HttpResponse{};
    response.network_error = true;
    response.body_limit_exceeded = true;
    response.network_error_message = "Maximum file size exceeded";
  }
  return response;
}

scanner::HttpResponse FakeHttpClient::post_multipart(const std::string &url,
                                                     const scanner::HeaderMap &headers,
                                                     const std::string &field_name,
                                                     const std::string &filename,
                                                     const std::vector<unsigned char> &bytes,
                                                     const std::uint64_t) {
  requests_.push_back(RecordedRequest{.method = "POST",
                                      .url = url,
                                      .headers = headers,
                                      .field_name = field_name,
                                      .filename = filename,
                                      .body_size = bytes.size()});
  return next();
}

scanner::HttpResponse FakeHttpClient::next() {
  if (responses_.empty()) {
    scanner::HttpResponse response;
    response.status = 599;
    response.body = "unscripted request";
    return response;
  }
  scanner::HttpResponse response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

scanner::Sleeper RecordingSleeper::sleeper() {
  return [this](const std::chrono::milliseconds delay) { delays_.push_back(delay); };
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("trustgate-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

} // namespace trustgate::testing
