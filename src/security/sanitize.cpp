#include "trustgate/security/sanitize.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace trustgate::security {

namespace {

constexpr const char *kSqlRejected = "Security Alert: Illegal characters or SQL patterns detected.";
constexpr const char *kScriptRejected = "Security Alert: Malicious script pattern detected.";

bool is_stripped_code_point(const UChar32 cp) {
  if (cp == '\t' || cp == '\n' || cp == '\r') {
    return false;
  }
  const auto type = static_cast<UCharCategory>(u_charType(cp));
  return type == U_CONTROL_CHAR || type == U_FORMAT_CHAR;
}

std::string to_utf8(const icu::UnicodeString &text) {
  std::string out;
  text.toUTF8String(out);
  return out;
}

// Reverses one level of encode_entities.
std::string decode_entities_once(const std::string &text) {
  static const std::pair<std::string_view, char> kEntities[] = {
      {"&amp;", '&'}, {"&lt;", '<'},   {"&gt;", '>'},
      {"&quot;", '"'}, {"&#x27;", '\''}, {"&#39;", '\''},
  };

  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    bool replaced = false;
    if (text[i] == '&') {
      for (const auto &[entity, ch] : kEntities) {
        if (text.compare(i, entity.size(), entity) == 0) {
          out.push_back(ch);
          i += entity.size();
          replaced = true;
          break;
        }
      }
    }
    if (!replaced) {
      out.push_back(text[i]);
      ++i;
    }
  }
  return out;
}

// Decodes until nothing changes, so input encoded any number of times is
// checked as the text it stands for. Every pass shrinks the text or stops.
std::string decode_entities(const std::string &text) {
  std::string current = text;
  for (;;) {
    std::string next = decode_entities_once(current);
    if (next == current) {
      return current;
    }
    current = std::move(next);
  }
}

SanitizationResult reject(const SanitizationRejection rejection, std::string value,
                          std::string error) {
  return SanitizationResult{.is_valid = false,
                            .sanitized_value = std::move(value),
                            .error = std::move(error),
                            .rejection = rejection};
}

SanitizationResult accept(std::string value) {
  return SanitizationResult{.is_valid = true, .sanitized_value = std::move(value)};
}

std::string length_message(const std::string_view what, const std::size_t max_length) {
  return std::string(what) + " exceeds maximum length of " + std::to_string(max_length) +
         " characters.";
}

} // namespace

std::string_view rejection_name(const SanitizationRejection rejection) {
  switch (rejection) {
  case SanitizationRejection::None:
    return "none";
  case SanitizationRejection::Length:
    return "length";
  case SanitizationRejection::Injection:
    return "injection";
  case SanitizationRejection::Sql:
    return "sql";
  case SanitizationRejection::Markup:
    return "markup";
  }
  return "none";
}

std::string normalize_text(const std::string &text) {
  if (text.empty()) {
    return text;
  }

  const icu::UnicodeString source = icu::UnicodeString::fromUTF8(text);
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *nfkc = icu::Normalizer2::getNFKCInstance(status);
  icu::UnicodeString normalized;
  if (U_SUCCESS(status) && nfkc != nullptr) {
    normalized = nfkc->normalize(source, status);
  }
  if (U_FAILURE(status)) {
    // Without normalization data the control-character pass still applies.
    normalized = source;
  }

  icu::UnicodeString cleaned;
  for (int32_t i = 0; i < normalized.length();) {
    const UChar32 cp = normalized.char32At(i);
    if (!is_stripped_code_point(cp)) {
      cleaned.append(cp);
    }
    i = normalized.moveIndex32(i, 1);
  }
  return to_utf8(cleaned);
}

std::string encode_entities(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 16);
  for (const char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#x27;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::size_t code_point_length(const std::string &text) {
  return static_cast<std::size_t>(icu::UnicodeString::fromUTF8(text).countChar32());
}

std::string truncate_code_points(const std::string &text, const std::size_t max_length) {
  icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(text);
  if (static_cast<std::size_t>(unicode.countChar32()) <= max_length) {
    return text;
  }
  const int32_t cut = unicode.moveIndex32(0, static_cast<int32_t>(max_length));
  unicode.truncate(cut);
  return to_utf8(unicode);
}

SanitizationResult check_injection(const std::string &text) {
  const auto matches = detect_injection(text);
  if (matches.empty()) {
    return accept(text);
  }
  return reject(SanitizationRejection::Injection, text,
                "Security Alert: Prompt injection pattern detected (" + matches.front() + ").");
}

SanitizationResult check_code_safety(const std::string &code) {
  if (const auto vectors = detect_execution_vectors(code); !vectors.empty()) {
    return reject(SanitizationRejection::Markup, code,
                  "Security Alert: Executable URL scheme detected (" + vectors.front() + ").");
  }
  if (const auto tags = detect_high_risk_tags(code); !tags.empty()) {
    return reject(SanitizationRejection::Markup, code,
                  "Security Alert: High-risk markup tag detected (" + tags.front() + ").");
  }
  return accept(code);
}

SanitizationResult sanitize_text(const std::string &input, const std::size_t max_length) {
  if (input.empty()) {
    return accept("");
  }

  const std::string normalized = normalize_text(truncate_code_points(input, max_length));
  std::string encoded = encode_entities(normalized);
  const std::string intent = decode_entities(normalized);

  if (!detect_sql_patterns(intent).empty()) {
    return reject(SanitizationRejection::Sql, std::move(encoded), kSqlRejected);
  }
  if (!detect_script_patterns(intent).empty()) {
    return reject(SanitizationRejection::Markup, "", kScriptRejected);
  }
  return accept(std::move(encoded));
}

SanitizationResult validate_code_input(const std::string &code, const std::size_t max_length) {
  if (code.empty()) {
    return accept("");
  }
  if (code_point_length(code) > max_length) {
    return reject(SanitizationRejection::Length, truncate_code_points(code, max_length),
                  length_message("Code", max_length));
  }

  const std::string normalized = normalize_text(code);
  if (auto injection = check_injection(normalized); !injection.is_valid) {
    return injection;
  }
  return check_code_safety(normalized);
}

SanitizationResult validate_prompt_text(const std::string &text, const std::size_t max_length) {
  if (text.empty()) {
    return accept("");
  }
  if (code_point_length(text) > max_length) {
    return reject(SanitizationRejection::Length, truncate_code_points(text, max_length),
                  length_message("Input", max_length));
  }

  const std::string normalized = normalize_text(text);
  if (auto injection = check_injection(normalized); !injection.is_valid) {
    return injection;
  }
  return accept(encode_entities(normalized));
}

std::string escape_for_prompt(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (const char ch : text) {
    switch (ch) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

} // namespace trustgate::security
