#include "trustgate/security/import_schema.hpp"

#include "trustgate/common/base64.hpp"
#include "trustgate/common/fs.hpp"
#include "trustgate/common/json_util.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <vector>

namespace trustgate::security {

namespace {

// 15 window bits plus 16 selects the gzip wrapper.
constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kChunkSize = 16 * 1024;

constexpr const char *kBadSignature = "Invalid file signature. Not a valid .zplus file.";
constexpr const char *kCorrupted = "File is corrupted or encrypted with an incompatible version.";
constexpr const char *kBadLegacyJson = "Invalid Legacy JSON format.";

common::Result<std::vector<unsigned char>> gzip_compress(const std::string &text) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    return common::Result<std::vector<unsigned char>>::failure("deflateInit2 failed");
  }

  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(text.data()));
  stream.avail_in = static_cast<uInt>(text.size());

  std::vector<unsigned char> out;
  std::array<unsigned char, kChunkSize> chunk{};
  int rc = Z_OK;
  do {
    stream.next_out = chunk.data();
    stream.avail_out = static_cast<uInt>(chunk.size());
    rc = deflate(&stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      deflateEnd(&stream);
      return common::Result<std::vector<unsigned char>>::failure("deflate failed");
    }
    out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
  } while (rc != Z_STREAM_END);

  deflateEnd(&stream);
  return common::Result<std::vector<unsigned char>>::success(std::move(out));
}

common::Result<std::string> gzip_decompress(std::vector<unsigned char> &bytes) {
  z_stream stream{};
  if (inflateInit2(&stream, kGzipWindowBits) != Z_OK) {
    return common::Result<std::string>::failure("inflateInit2 failed");
  }

  stream.next_in = bytes.data();
  stream.avail_in = static_cast<uInt>(bytes.size());

  std::string out;
  std::array<unsigned char, kChunkSize> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    stream.next_out = chunk.data();
    stream.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&stream);
      return common::Result<std::string>::failure(stream.msg != nullptr ? stream.msg
                                                                        : "inflate failed");
    }
    out.append(reinterpret_cast<const char *>(chunk.data()), chunk.size() - stream.avail_out);
    if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      // Input ran out before the gzip trailer.
      inflateEnd(&stream);
      return common::Result<std::string>::failure("truncated gzip stream");
    }
  }

  inflateEnd(&stream);
  return common::Result<std::string>::success(std::move(out));
}

bool is_well_formed_json(const std::string &text) {
  const std::size_t start = common::json_skip_ws(text, 0);
  if (start >= text.size()) {
    return false;
  }
  if (text[start] == '{') {
    return common::json_parse_fields(text).has_value();
  }
  if (text[start] != '[') {
    return false;
  }
  const std::size_t close = common::json_find_matching_token(text, start, '[', ']');
  return close != std::string::npos && common::json_skip_ws(text, close + 1) == text.size();
}

bool is_question_record(const std::string &element) {
  const auto fields = common::json_parse_fields(element);
  if (!fields.has_value()) {
    return false;
  }
  for (const char *key : {"id", "type", "text", "explanation"}) {
    const auto it = fields->find(key);
    if (it == fields->end() || it->second.kind != common::JsonKind::String) {
      return false;
    }
  }
  return true;
}

} // namespace

common::Status validate_import_schema(const std::string &json) {
  const auto fields = common::json_parse_fields(json);
  if (!fields.has_value()) {
    return common::Status::error("Import payload is not a JSON object.");
  }

  const auto questions = fields->find("questions");
  if (questions == fields->end() || questions->second.kind != common::JsonKind::Array) {
    return common::Status::error("Import payload has no questions array.");
  }

  const auto elements = common::json_split_array(questions->second.value);
  const std::size_t sample = std::min(elements.size(), IMPORT_SAMPLE_SIZE);
  for (std::size_t i = 0; i < sample; ++i) {
    if (!is_question_record(elements[i])) {
      return common::Status::error("Question " + std::to_string(i + 1) +
                                   " is missing a string id, type, text or explanation.");
    }
  }
  return common::Status::success();
}

common::Result<std::string> decode_import_payload(const std::string &content) {
  const std::string trimmed = common::trim(content);
  if (trimmed.empty()) {
    return common::Result<std::string>::failure(kBadSignature);
  }

  if (trimmed.front() == '{' || trimmed.front() == '[') {
    if (!is_well_formed_json(trimmed)) {
      return common::Result<std::string>::failure(kBadLegacyJson);
    }
    return common::Result<std::string>::success(trimmed);
  }

  if (!common::starts_with(trimmed, std::string(IMPORT_PAYLOAD_HEADER))) {
    return common::Result<std::string>::failure(kBadSignature);
  }

  auto compressed = common::base64_decode(
      std::string_view(trimmed).substr(IMPORT_PAYLOAD_HEADER.size()));
  if (!compressed.ok()) {
    return common::Result<std::string>::failure(kCorrupted);
  }
  auto json = gzip_decompress(compressed.value());
  if (!json.ok() || !is_well_formed_json(json.value())) {
    return common::Result<std::string>::failure(kCorrupted);
  }
  return json;
}

common::Result<std::string> encode_import_payload(const std::string &json) {
  auto compressed = gzip_compress(json);
  if (!compressed.ok()) {
    return common::Result<std::string>::failure("Failed to compress import payload: " +
                                                compressed.error());
  }
  return common::Result<std::string>::success(std::string(IMPORT_PAYLOAD_HEADER) +
                                              common::base64_encode(compressed.value()));
}

} // namespace trustgate::security
