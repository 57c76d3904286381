#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustgate::intake {

struct Artifact {
  std::string name;
  std::vector<unsigned char> bytes;
  std::string declared_mime;
};

enum class ArtifactFormat {
  Pdf,
  Jpeg,
  Png,
  Webp,
  Unknown,
};

enum class ValidationFailure {
  None,
  SizeExceeded,
  SignatureMismatch,
  BatchSizeExceeded,
  MimeNotAllowed,
};

struct ValidationVerdict {
  bool accepted = false;
  ArtifactFormat format = ArtifactFormat::Unknown;
  std::optional<std::string> reason;
  ValidationFailure failure = ValidationFailure::None;
};

struct AcceptedArtifact {
  std::string encoded_payload;
  std::string mime_type;
  std::string name;
};

[[nodiscard]] std::string_view format_name(ArtifactFormat format);
[[nodiscard]] std::string_view mime_type_for(ArtifactFormat format);

} // namespace trustgate::intake
