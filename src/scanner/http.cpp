#include "trustgate/scanner/http.hpp"

#include "trustgate/common/fs.hpp"

#include <curl/curl.h>

namespace trustgate::scanner {

namespace {

constexpr const char *kUserAgent = "trustgate/0.1";

struct BodySink {
  std::string *body = nullptr;
  std::uint64_t max_bytes = NO_BODY_LIMIT;
  bool exceeded = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userdata);
  if (sink->max_bytes != NO_BODY_LIMIT && sink->body->size() + total > sink->max_bytes) {
    // Returning short aborts the transfer with CURLE_WRITE_ERROR.
    sink->exceeded = true;
    return 0;
  }
  sink->body->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HeaderMap *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

struct MultipartBody {
  const std::string *field_name = nullptr;
  const std::string *filename = nullptr;
  const std::vector<unsigned char> *bytes = nullptr;
};

HttpResponse execute_request(const std::string &url, const HeaderMap &headers,
                             const MultipartBody *multipart, const std::uint64_t timeout_ms,
                             const std::uint64_t max_body_bytes) {
  HttpResponse response;
  BodySink sink{.body = &response.body, .max_bytes = max_body_bytes};

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  if (max_body_bytes != NO_BODY_LIMIT) {
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_body_bytes));
  }
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);

  curl_mime *mime = nullptr;
  if (multipart != nullptr) {
    mime = curl_mime_init(curl);
    curl_mimepart *part = curl_mime_addpart(mime);
    curl_mime_name(part, multipart->field_name->c_str());
    curl_mime_filename(part, multipart->filename->c_str());
    curl_mime_data(part, reinterpret_cast<const char *>(multipart->bytes->data()),
                   multipart->bytes->size());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.body_limit_exceeded =
        code == CURLE_FILESIZE_EXCEEDED || (code == CURLE_WRITE_ERROR && sink.exceeded);
    if (response.body_limit_exceeded) {
      response.body.clear();
    }
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  if (mime != nullptr) {
    curl_mime_free(mime);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const HeaderMap &headers,
                                 const std::uint64_t timeout_ms,
                                 const std::uint64_t max_body_bytes) {
  return execute_request(url, headers, nullptr, timeout_ms, max_body_bytes);
}

HttpResponse CurlHttpClient::post_multipart(const std::string &url, const HeaderMap &headers,
                                            const std::string &field_name,
                                            const std::string &filename,
                                            const std::vector<unsigned char> &bytes,
                                            const std::uint64_t timeout_ms) {
  const MultipartBody body{.field_name = &field_name, .filename = &filename, .bytes = &bytes};
  return execute_request(url, headers, &body, timeout_ms, NO_BODY_LIMIT);
}

} // namespace trustgate::scanner
