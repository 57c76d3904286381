#include "trustgate/security/sanitize.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace trustgate::security {

namespace {

struct PatternEntry {
  const char *label;
  std::regex regex;
};

const std::regex::flag_type kIcase = std::regex::ECMAScript | std::regex::icase;

const std::array<PatternEntry, 10> kInjectionPatterns = {
    PatternEntry{"ignore previous instructions",
                 std::regex(R"(ignore\s+(all\s+)?(the\s+)?(previous|prior|above|earlier)\s+(instructions?|prompts?|rules?))",
                            kIcase)},
    PatternEntry{"disregard previous",
                 std::regex(R"(disregard\s+(all\s+)?(the\s+)?(previous|prior|above|earlier))", kIcase)},
    PatternEntry{"forget instructions",
                 std::regex(R"(forget\s+(everything|all|your)\s+(instructions?|rules?|guidelines?))",
                            kIcase)},
    PatternEntry{"system prompt", std::regex(R"(system\s*prompt)", kIcase)},
    PatternEntry{"you are now", std::regex(R"(\byou\s+are\s+now\b)", kIcase)},
    PatternEntry{"override system",
                 std::regex(R"(override\s+(the\s+|your\s+)?system)", kIcase)},
    PatternEntry{"act as", std::regex(R"(\bact\s+as\s+(a|an)\b)", kIcase)},
    PatternEntry{"new instructions", std::regex(R"(new\s+instructions?\s*:)", kIcase)},
    PatternEntry{"xml system tag", std::regex(R"(<\/?system>)", kIcase)},
    PatternEntry{"role boundary",
                 std::regex(R"(\]\s*\n\s*\[?(system|assistant|user)\]?:)", kIcase)},
};

const std::array<PatternEntry, 5> kSqlPatterns = {
    PatternEntry{"sql keyword",
                 std::regex(R"(\b(SELECT|INSERT|UPDATE|DELETE|DROP|UNION|ALTER|EXEC|TRUNCATE)\b)",
                            kIcase)},
    PatternEntry{"sql comment", std::regex(R"(--)")},
    PatternEntry{"statement terminator", std::regex(R"(;)")},
    PatternEntry{"tautology",
                 std::regex(R"(\bOR\b\s+['"]?\w{1,64}['"]?\s*=\s*['"]?\w{1,64}['"]?)", kIcase)},
    PatternEntry{"single quote", std::regex(R"(')")},
};

// "script block" is matched by has_script_block below.
const std::array<PatternEntry, 3> kScriptPatterns = {
    PatternEntry{"javascript url", std::regex(R"(javascript:)", kIcase)},
    PatternEntry{"event handler", std::regex(R"(on\w{1,64}=)", kIcase)},
    PatternEntry{"html data uri", std::regex(R"(data:text\/html)", kIcase)},
};

const std::array<PatternEntry, 3> kExecutionVectors = {
    PatternEntry{"javascript:", std::regex(R"(javascript\s*:)", kIcase)},
    PatternEntry{"vbscript:", std::regex(R"(vbscript\s*:)", kIcase)},
    PatternEntry{"data:text/html", std::regex(R"(data\s*:\s*text\/html)", kIcase)},
};

const std::array<PatternEntry, 7> kHighRiskTags = {
    PatternEntry{"<script>", std::regex(R"(<\s*script\b)", kIcase)},
    PatternEntry{"<iframe>", std::regex(R"(<\s*iframe\b)", kIcase)},
    PatternEntry{"<object>", std::regex(R"(<\s*object\b)", kIcase)},
    PatternEntry{"<embed>", std::regex(R"(<\s*embed\b)", kIcase)},
    PatternEntry{"<meta>", std::regex(R"(<\s*meta\b)", kIcase)},
    PatternEntry{"<base>", std::regex(R"(<\s*base\b)", kIcase)},
    PatternEntry{"<form>", std::regex(R"(<\s*form\b)", kIcase)},
};

bool icase_equal(const char a, const char b) {
  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

std::string::const_iterator find_icase(std::string::const_iterator first,
                                       std::string::const_iterator last, const std::string &needle) {
  return std::search(first, last, needle.begin(), needle.end(), icase_equal);
}

// <script ...> followed somewhere by </script>, scanned without backtracking.
bool has_script_block(const std::string &text) {
  static const std::string open_tag = "<script";
  static const std::string close_tag = "</script>";
  auto it = find_icase(text.begin(), text.end(), open_tag);
  while (it != text.end()) {
    const auto after = it + static_cast<std::ptrdiff_t>(open_tag.size());
    const bool boundary =
        after == text.end() ||
        (std::isalnum(static_cast<unsigned char>(*after)) == 0 && *after != '_');
    if (boundary) {
      const auto tag_end = std::find(after, text.end(), '>');
      if (tag_end == text.end()) {
        return false;
      }
      return find_icase(tag_end + 1, text.end(), close_tag) != text.end();
    }
    it = find_icase(after, text.end(), open_tag);
  }
  return false;
}

// std::regex recurses once per repetition, so long whitespace runs are folded
// to a single character before matching. A run keeps one newline if it had any.
std::string fold_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (std::isspace(static_cast<unsigned char>(text[i])) == 0) {
      out.push_back(text[i++]);
      continue;
    }
    bool newline = false;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
      newline = newline || text[i] == '\n';
      ++i;
    }
    out.push_back(newline ? '\n' : ' ');
  }
  return out;
}

template <std::size_t N>
std::vector<std::string> match_table(const std::array<PatternEntry, N> &table,
                                     const std::string &text) {
  const std::string folded = fold_whitespace(text);
  std::vector<std::string> matches;
  for (const auto &entry : table) {
    if (std::regex_search(folded, entry.regex)) {
      matches.emplace_back(entry.label);
    }
  }
  return matches;
}

} // namespace

std::vector<std::string> detect_injection(const std::string &text) {
  return match_table(kInjectionPatterns, text);
}

std::vector<std::string> detect_sql_patterns(const std::string &text) {
  return match_table(kSqlPatterns, text);
}

std::vector<std::string> detect_script_patterns(const std::string &text) {
  std::vector<std::string> matches;
  if (has_script_block(text)) {
    matches.emplace_back("script block");
  }
  for (auto &label : match_table(kScriptPatterns, text)) {
    matches.push_back(std::move(label));
  }
  return matches;
}

std::vector<std::string> detect_execution_vectors(const std::string &text) {
  return match_table(kExecutionVectors, text);
}

std::vector<std::string> detect_high_risk_tags(const std::string &text) {
  return match_table(kHighRiskTags, text);
}

} // namespace trustgate::security
