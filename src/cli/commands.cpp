#include "trustgate/cli/commands.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/config/config.hpp"
#include "trustgate/intake/batch.hpp"
#include "trustgate/intake/hasher.hpp"
#include "trustgate/intake/url_fetch.hpp"
#include "trustgate/observability/factory.hpp"
#include "trustgate/observability/global.hpp"
#include "trustgate/scanner/http.hpp"
#include "trustgate/scanner/reputation.hpp"
#include "trustgate/security/import_schema.hpp"
#include "trustgate/security/sanitize.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace trustgate::cli {

namespace {

constexpr int kExitRejected = 2;

std::string version_string() {
#ifdef TRUSTGATE_VERSION
  std::string version = TRUSTGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "trustgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

// Loads and validates the config, then installs the configured observer.
common::Result<config::Config> bootstrap() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  const auto checked = config::validate_config(cfg.value());
  if (!checked.ok()) {
    return common::Result<config::Config>::failure(checked.error());
  }
  for (const auto &warning : checked.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

void print_report(const intake::BatchReport &report) {
  for (const auto &entry : report.log) {
    std::cout << "[" << intake::status_name(entry.status) << "] " << entry.name;
    if (entry.error.has_value()) {
      std::cout << ": " << *entry.error;
    }
    std::cout << "\n";
  }
  for (const auto &item : report.accepted) {
    std::cout << "accepted " << item.name << " (" << item.mime_type << ", "
              << item.encoded_payload.size() << " base64 chars)\n";
  }
}

int run_scan(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: trustgate scan <file>...\n";
    return 1;
  }
  auto cfg = bootstrap();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  std::vector<intake::Artifact> artifacts;
  artifacts.reserve(args.size());
  for (const auto &arg : args) {
    const std::filesystem::path path = common::expand_path(arg);
    auto bytes = common::read_file_bytes(path);
    if (!bytes.ok()) {
      std::cerr << bytes.error() << "\n";
      return 1;
    }
    artifacts.push_back(intake::Artifact{.name = path.filename().string(),
                                         .bytes = bytes.take(),
                                         .declared_mime = ""});
  }

  scanner::CurlHttpClient http;
  scanner::ReputationScanner scanner(cfg.value().scanner, http);
  intake::BatchOrchestrator orchestrator(cfg.value().intake, scanner);
  const auto report = orchestrator.process_batch(artifacts, nullptr);
  print_report(report);
  return report.all_accepted() ? 0 : kExitRejected;
}

int run_fetch(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: trustgate fetch <url>\n";
    return 1;
  }
  auto cfg = bootstrap();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  scanner::CurlHttpClient http;
  scanner::ReputationScanner scanner(cfg.value().scanner, http);
  intake::UrlFetcher fetcher(http, cfg.value().intake.fetch_timeout_ms,
                             cfg.value().intake.max_file_bytes);
  intake::BatchOrchestrator orchestrator(cfg.value().intake, scanner);
  const auto report = orchestrator.process_url(args[0], fetcher, nullptr);
  print_report(report);
  return report.all_accepted() ? 0 : kExitRejected;
}

int run_sanitize(std::vector<std::string> args) {
  auto cfg = bootstrap();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto &limits = cfg.value().sanitize;

  const bool code = take_flag(args, "--code");
  const bool prompt = take_flag(args, "--prompt");
  if (code && prompt) {
    std::cerr << "--code and --prompt are mutually exclusive\n";
    return 1;
  }

  std::size_t max_length =
      code ? limits.code_max_length : (prompt ? limits.prompt_max_length : limits.text_max_length);
  std::string max_raw;
  if (take_option(args, "--max", "-n", max_raw)) {
    std::size_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(max_raw.data(), max_raw.data() + max_raw.size(), parsed);
    if (ec != std::errc() || ptr != max_raw.data() + max_raw.size() || parsed == 0) {
      std::cerr << "invalid value for --max: " << max_raw << "\n";
      return 1;
    }
    max_length = parsed;
  }

  const std::string input = args.empty() ? read_stdin_all() : join_tokens(args);
  const security::SanitizationResult result =
      code ? security::validate_code_input(input, max_length)
           : (prompt ? security::validate_prompt_text(input, max_length)
                     : security::sanitize_text(input, max_length));

  if (!result.is_valid) {
    const std::string reason = result.error.value_or("rejected");
    observability::record_sanitization(code ? "code" : (prompt ? "prompt" : "text"),
                                       std::string(security::rejection_name(result.rejection)),
                                       reason);
    std::cerr << reason << "\n";
    return kExitRejected;
  }
  std::cout << result.sanitized_value << "\n";
  return 0;
}

int run_import(std::vector<std::string> args) {
  const bool encode = take_flag(args, "--encode");
  if (args.size() != 1) {
    std::cerr << "usage: trustgate import [--encode] <file>\n";
    return 1;
  }
  auto cfg = bootstrap();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  const auto text = common::read_file_text(common::expand_path(args[0]));
  if (!text.ok()) {
    std::cerr << text.error() << "\n";
    return 1;
  }

  if (encode) {
    const auto schema = security::validate_import_schema(common::trim(text.value()));
    if (!schema.ok()) {
      std::cerr << schema.error() << "\n";
      return kExitRejected;
    }
    const auto encoded = security::encode_import_payload(common::trim(text.value()));
    if (!encoded.ok()) {
      std::cerr << encoded.error() << "\n";
      return 1;
    }
    std::cout << encoded.value() << "\n";
    return 0;
  }

  const auto decoded = security::decode_import_payload(text.value());
  if (!decoded.ok()) {
    observability::record_error("import", decoded.error());
    std::cerr << decoded.error() << "\n";
    return kExitRejected;
  }
  const auto schema = security::validate_import_schema(decoded.value());
  if (!schema.ok()) {
    observability::record_error("import", schema.error());
    std::cerr << schema.error() << "\n";
    return kExitRejected;
  }
  std::cout << decoded.value() << "\n";
  return 0;
}

int run_hash(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: trustgate hash <file>...\n";
    return 1;
  }
  for (const auto &arg : args) {
    const auto bytes = common::read_file_bytes(common::expand_path(arg));
    if (!bytes.ok()) {
      std::cerr << bytes.error() << "\n";
      return 1;
    }
    std::cout << intake::sha256_hex(bytes.value()) << "  " << arg << "\n";
  }
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: trustgate [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  scan <file>...                      verify and reputation-scan files as one batch\n";
  std::cout << "  fetch <url>                         download a PDF or image and run it through intake\n";
  std::cout << "  sanitize [--code|--prompt] [--max N] [text]\n";
  std::cout << "                                      sanitize text (reads stdin when no text given)\n";
  std::cout << "  import [--encode] <file>            decode and validate an exported question set\n";
  std::cout << "  hash <file>...                      print SHA-256 digests\n";
  std::cout << "  config-path                         print the config file location\n";
  std::cout << "  version                             print the version\n\n";
  std::cout << "exit status: 0 accepted, 1 usage or setup error, 2 rejected\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "scan") {
    return run_scan(std::move(args));
  }
  if (subcommand == "fetch") {
    return run_fetch(std::move(args));
  }
  if (subcommand == "sanitize") {
    return run_sanitize(std::move(args));
  }
  if (subcommand == "import") {
    return run_import(std::move(args));
  }
  if (subcommand == "hash") {
    return run_hash(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace trustgate::cli
