#include "trustgate/common/base64.hpp"

#include <openssl/evp.h>

#include <cctype>

namespace trustgate::common {

std::string base64_encode(const std::vector<unsigned char> &bytes) {
  if (bytes.empty()) {
    return "";
  }
  const std::size_t output_len = 4 * ((bytes.size() + 2) / 3);
  std::string output(output_len + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                                      bytes.data(), static_cast<int>(bytes.size()));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

Result<std::vector<unsigned char>> base64_decode(const std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      compact.push_back(ch);
    }
  }
  if (compact.empty()) {
    return Result<std::vector<unsigned char>>::success({});
  }
  if (compact.size() % 4 != 0) {
    return Result<std::vector<unsigned char>>::failure("Invalid base64 input");
  }

  std::vector<unsigned char> decoded(compact.size());
  const int len = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char *>(compact.data()),
                                  static_cast<int>(compact.size()));
  if (len < 0) {
    return Result<std::vector<unsigned char>>::failure("Invalid base64 input");
  }

  // EVP_DecodeBlock counts padding bytes as output.
  std::size_t padding = 0;
  if (compact.back() == '=') {
    ++padding;
  }
  if (compact[compact.size() - 2] == '=') {
    ++padding;
  }

  decoded.resize(static_cast<std::size_t>(len) - padding);
  return Result<std::vector<unsigned char>>::success(std::move(decoded));
}

} // namespace trustgate::common
