#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustgate::security {

inline constexpr std::size_t DEFAULT_TEXT_MAX_LENGTH = 100;
inline constexpr std::size_t DEFAULT_CODE_MAX_LENGTH = 5000;
inline constexpr std::size_t DEFAULT_PROMPT_MAX_LENGTH = 2000;

enum class SanitizationRejection {
  None,
  Length,
  Injection,
  Sql,
  Markup,
};

struct SanitizationResult {
  bool is_valid = true;
  std::string sanitized_value;
  std::optional<std::string> error;
  SanitizationRejection rejection = SanitizationRejection::None;
};

[[nodiscard]] std::string_view rejection_name(SanitizationRejection rejection);

// Rule tables. Each returns the labels of every rule that matched, in table order.
[[nodiscard]] std::vector<std::string> detect_injection(const std::string &text);
[[nodiscard]] std::vector<std::string> detect_sql_patterns(const std::string &text);
[[nodiscard]] std::vector<std::string> detect_script_patterns(const std::string &text);
[[nodiscard]] std::vector<std::string> detect_execution_vectors(const std::string &text);
[[nodiscard]] std::vector<std::string> detect_high_risk_tags(const std::string &text);

[[nodiscard]] std::string normalize_text(const std::string &text);

[[nodiscard]] SanitizationResult check_injection(const std::string &text);

[[nodiscard]] SanitizationResult check_code_safety(const std::string &code);

[[nodiscard]] std::string encode_entities(const std::string &text);

[[nodiscard]] std::size_t code_point_length(const std::string &text);
[[nodiscard]] std::string truncate_code_points(const std::string &text, std::size_t max_length);

// Truncates instead of rejecting on length. Any SQL or script pattern rejects.
[[nodiscard]] SanitizationResult sanitize_text(const std::string &input,
                                               std::size_t max_length = DEFAULT_TEXT_MAX_LENGTH);

// SQL keywords and quotes are legitimate in code, so only the injection and
// code-safety layers apply.
[[nodiscard]] SanitizationResult
validate_code_input(const std::string &code, std::size_t max_length = DEFAULT_CODE_MAX_LENGTH);

[[nodiscard]] SanitizationResult
validate_prompt_text(const std::string &text, std::size_t max_length = DEFAULT_PROMPT_MAX_LENGTH);

[[nodiscard]] std::string escape_for_prompt(const std::string &text);

} // namespace trustgate::security
