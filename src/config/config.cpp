#include "trustgate/config/config.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace trustgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".trustgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TRUSTGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TRUSTGATE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

std::optional<std::string> non_empty_env(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto key = non_empty_env("TRUSTGATE_API_KEY"); key.has_value()) {
    config.scanner.api_key = *key;
  } else if (!config.scanner.api_key.has_value() || common::trim(*config.scanner.api_key).empty()) {
    if (const auto vt_key = non_empty_env("VT_API_KEY"); vt_key.has_value()) {
      config.scanner.api_key = *vt_key;
    }
  }

  if (const auto url = non_empty_env("TRUSTGATE_SCANNER_URL"); url.has_value()) {
    config.scanner.base_url = *url;
  }
  if (const auto backend = non_empty_env("TRUSTGATE_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  if (doc.has("scanner.api_key")) {
    const std::string key = common::trim(expand_config_value(doc.get_string("scanner.api_key")));
    if (!key.empty()) {
      config.scanner.api_key = key;
    }
  }
  config.scanner.base_url =
      expand_config_value(doc.get_string("scanner.base_url", config.scanner.base_url));
  while (common::ends_with(config.scanner.base_url, "/")) {
    config.scanner.base_url.pop_back();
  }
  config.scanner.poll_attempts = static_cast<std::uint32_t>(
      doc.get_u64("scanner.poll_attempts", config.scanner.poll_attempts));
  config.scanner.poll_interval_ms =
      doc.get_u64("scanner.poll_interval_ms", config.scanner.poll_interval_ms);
  config.scanner.timeout_ms = doc.get_u64("scanner.timeout_ms", config.scanner.timeout_ms);

  config.intake.max_file_bytes = doc.get_u64("intake.max_file_bytes", config.intake.max_file_bytes);
  config.intake.max_batch_bytes =
      doc.get_u64("intake.max_batch_bytes", config.intake.max_batch_bytes);
  config.intake.delivery_delay_ms =
      doc.get_u64("intake.delivery_delay_ms", config.intake.delivery_delay_ms);
  config.intake.url_delivery_delay_ms =
      doc.get_u64("intake.url_delivery_delay_ms", config.intake.url_delivery_delay_ms);
  config.intake.fetch_timeout_ms =
      doc.get_u64("intake.fetch_timeout_ms", config.intake.fetch_timeout_ms);
  config.intake.allowed_url_mime_types = doc.get_string_array(
      "intake.allowed_url_mime_types", config.intake.allowed_url_mime_types);
  for (auto &mime : config.intake.allowed_url_mime_types) {
    mime = common::to_lower(common::trim(mime));
  }

  config.sanitize.text_max_length = static_cast<std::size_t>(
      doc.get_u64("sanitize.text_max_length", config.sanitize.text_max_length));
  config.sanitize.code_max_length = static_cast<std::size_t>(
      doc.get_u64("sanitize.code_max_length", config.sanitize.code_max_length));
  config.sanitize.prompt_max_length = static_cast<std::size_t>(
      doc.get_u64("sanitize.prompt_max_length", config.sanitize.prompt_max_length));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_file_text(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(text.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = parsed.take();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[scanner]\n";
  if (config.scanner.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.scanner.api_key) << "\n";
  }
  file << "base_url = " << common::quote_toml_string(config.scanner.base_url) << "\n";
  file << "poll_attempts = " << config.scanner.poll_attempts << "\n";
  file << "poll_interval_ms = " << config.scanner.poll_interval_ms << "\n";
  file << "timeout_ms = " << config.scanner.timeout_ms << "\n";

  file << "\n[intake]\n";
  file << "max_file_bytes = " << config.intake.max_file_bytes << "\n";
  file << "max_batch_bytes = " << config.intake.max_batch_bytes << "\n";
  file << "delivery_delay_ms = " << config.intake.delivery_delay_ms << "\n";
  file << "url_delivery_delay_ms = " << config.intake.url_delivery_delay_ms << "\n";
  file << "fetch_timeout_ms = " << config.intake.fetch_timeout_ms << "\n";
  file << "allowed_url_mime_types = "
       << string_array_to_toml(config.intake.allowed_url_mime_types) << "\n";

  file << "\n[sanitize]\n";
  file << "text_max_length = " << config.sanitize.text_max_length << "\n";
  file << "code_max_length = " << config.sanitize.code_max_length << "\n";
  file << "prompt_max_length = " << config.sanitize.prompt_max_length << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string base_url = common::to_lower(config.scanner.base_url);
  if (!common::starts_with(base_url, "https://") && !common::starts_with(base_url, "http://")) {
    return common::Result<std::vector<std::string>>::failure(
        "scanner.base_url must be an http(s) URL: " + config.scanner.base_url);
  }
  if (common::starts_with(base_url, "http://")) {
    warnings.push_back("scanner.base_url is not using https");
  }

  if (config.scanner.poll_attempts == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "scanner.poll_attempts must be at least 1");
  }
  if (config.scanner.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure("scanner.timeout_ms must be > 0");
  }

  if (config.intake.max_file_bytes == 0 || config.intake.max_batch_bytes == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "intake size limits must be greater than zero");
  }
  if (config.intake.max_batch_bytes < config.intake.max_file_bytes) {
    return common::Result<std::vector<std::string>>::failure(
        "intake.max_batch_bytes must not be smaller than intake.max_file_bytes");
  }
  if (config.intake.allowed_url_mime_types.empty()) {
    warnings.push_back("intake.allowed_url_mime_types is empty; every URL will be rejected");
  }

  if (config.sanitize.text_max_length == 0 || config.sanitize.code_max_length == 0 ||
      config.sanitize.prompt_max_length == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "sanitize length limits must be greater than zero");
  }

  if (!config.scanner.api_key.has_value()) {
    warnings.push_back("scanner.api_key is not set; reputation scanning will be skipped");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop" && !backend.empty()) {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "'; falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace trustgate::config
