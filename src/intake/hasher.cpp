#include "trustgate/intake/hasher.hpp"

#include <openssl/evp.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace trustgate::intake {

namespace {

std::string digest_hex(const void *data, const std::size_t size) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  // Only fails when OpenSSL cannot allocate its digest context.
  if (EVP_Digest(data, size, digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    return "";
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return stream.str();
}

} // namespace

std::string sha256_hex(const std::vector<unsigned char> &bytes) {
  return digest_hex(bytes.data(), bytes.size());
}

std::string sha256_hex(const std::string_view text) { return digest_hex(text.data(), text.size()); }

} // namespace trustgate::intake
