#include "trustgate/intake/signature.hpp"

#include <algorithm>
#include <array>

namespace trustgate::intake {

namespace {

struct SignatureEntry {
  ArtifactFormat format;
  std::array<unsigned char, 4> magic;
  std::size_t length;
};

constexpr std::array<SignatureEntry, 3> kSignatures = {{
    {ArtifactFormat::Pdf, {0x25, 0x50, 0x44, 0x46}, 4}, // %PDF
    {ArtifactFormat::Jpeg, {0xFF, 0xD8, 0xFF, 0x00}, 3},
    {ArtifactFormat::Png, {0x89, 0x50, 0x4E, 0x47}, 4},
}};

// RIFF....WEBP
bool is_webp(const std::vector<unsigned char> &bytes) {
  constexpr std::array<unsigned char, 4> riff = {'R', 'I', 'F', 'F'};
  constexpr std::array<unsigned char, 4> webp = {'W', 'E', 'B', 'P'};
  return bytes.size() >= 12 && std::equal(riff.begin(), riff.end(), bytes.begin()) &&
         std::equal(webp.begin(), webp.end(), bytes.begin() + 8);
}

constexpr const char *kSignatureMismatch =
    "Invalid file format. Only PDF, JPG, and PNG are allowed based on file signature.";
constexpr const char *kSignatureMismatchWebp =
    "Invalid file format. Only PDF, JPG, PNG, and WEBP are allowed based on file signature.";

} // namespace

std::string_view format_name(const ArtifactFormat format) {
  switch (format) {
  case ArtifactFormat::Pdf:
    return "PDF";
  case ArtifactFormat::Jpeg:
    return "JPEG";
  case ArtifactFormat::Png:
    return "PNG";
  case ArtifactFormat::Webp:
    return "WEBP";
  case ArtifactFormat::Unknown:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::string_view mime_type_for(const ArtifactFormat format) {
  switch (format) {
  case ArtifactFormat::Pdf:
    return "application/pdf";
  case ArtifactFormat::Jpeg:
    return "image/jpeg";
  case ArtifactFormat::Png:
    return "image/png";
  case ArtifactFormat::Webp:
    return "image/webp";
  case ArtifactFormat::Unknown:
    return "application/octet-stream";
  }
  return "application/octet-stream";
}

ArtifactFormat detect_format(const std::vector<unsigned char> &bytes) {
  if (bytes.size() < MIN_SIGNATURE_BYTES) {
    return ArtifactFormat::Unknown;
  }
  for (const auto &entry : kSignatures) {
    if (std::equal(entry.magic.begin(), entry.magic.begin() + entry.length, bytes.begin())) {
      return entry.format;
    }
  }
  if (is_webp(bytes)) {
    return ArtifactFormat::Webp;
  }
  return ArtifactFormat::Unknown;
}

std::string size_limit_message(const std::uint64_t max_bytes) {
  constexpr std::uint64_t mib = 1024ULL * 1024ULL;
  if (max_bytes % mib == 0) {
    return "File size exceeds " + std::to_string(max_bytes / mib) + "MB limit.";
  }
  return "File size exceeds " + std::to_string(max_bytes) + " byte limit.";
}

ValidationVerdict verify_artifact(const Artifact &artifact, const std::uint64_t max_bytes,
                                  const bool allow_webp) {
  ValidationVerdict verdict;
  if (artifact.bytes.size() > max_bytes) {
    verdict.reason = size_limit_message(max_bytes);
    verdict.failure = ValidationFailure::SizeExceeded;
    return verdict;
  }

  const ArtifactFormat format = detect_format(artifact.bytes);
  verdict.format = format;
  if (format == ArtifactFormat::Unknown || (format == ArtifactFormat::Webp && !allow_webp)) {
    verdict.reason = allow_webp ? kSignatureMismatchWebp : kSignatureMismatch;
    verdict.failure = ValidationFailure::SignatureMismatch;
    return verdict;
  }

  verdict.accepted = true;
  return verdict;
}

} // namespace trustgate::intake
