#pragma once

#include "trustgate/config/schema.hpp"
#include "trustgate/intake/artifact.hpp"
#include "trustgate/scanner/http.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace trustgate::scanner {

struct VendorStats {
  std::uint32_t malicious = 0;
  std::uint32_t suspicious = 0;
  std::uint32_t harmless = 0;
  std::uint32_t undetected = 0;

  [[nodiscard]] std::uint64_t total() const {
    return static_cast<std::uint64_t>(malicious) + suspicious + harmless + undetected;
  }
};

enum class ReputationOutcome {
  Clean,
  Unsafe,
  Unavailable,
  Pending,
};

struct ReputationVerdict {
  bool safe = true;
  std::string message;
  std::optional<std::string> threat_label;
  std::optional<VendorStats> stats;
  ReputationOutcome outcome = ReputationOutcome::Clean;
};

struct ScanSession {
  std::string analysis_id;
  std::uint32_t attempt = 0;
  std::chrono::steady_clock::time_point started_at;
};

enum class ScanState {
  Hashing,
  Lookup,
  KnownVerdict,
  Upload,
  Polling,
  Completed,
  Exhausted,
  Error,
  Done,
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;
[[nodiscard]] Sleeper thread_sleeper();

[[nodiscard]] std::string_view state_name(ScanState state);
[[nodiscard]] std::string_view outcome_name(ReputationOutcome outcome);
[[nodiscard]] bool is_terminal(ScanState state);

[[nodiscard]] VendorStats parse_stats(const std::string &stats_json);

[[nodiscard]] ReputationVerdict classify_stats(const VendorStats &stats,
                                               std::optional<std::string> threat_label);

struct ScanContext {
  const intake::Artifact *artifact = nullptr;
  ScanState state = ScanState::Hashing;
  std::string digest;
  std::optional<ScanSession> session;
  std::optional<ReputationVerdict> verdict;
  // Set on entry to Error.
  std::string error_detail;
  bool transport_error = false;
  // Response body carried from Lookup or Polling into the classifying state.
  std::string pending_body;
};

class ReputationScanner {
public:
  ReputationScanner(config::ScannerConfig config, HttpClient &http,
                    Sleeper sleeper = thread_sleeper());

  // Never fails: transport and protocol problems resolve to a safe verdict.
  [[nodiscard]] ReputationVerdict scan(const intake::Artifact &artifact);

  void step(ScanContext &context);

  [[nodiscard]] const config::ScannerConfig &config() const { return config_; }

private:
  void hash(ScanContext &context);
  void lookup(ScanContext &context);
  void classify_known(ScanContext &context);
  void upload(ScanContext &context);
  void poll(ScanContext &context);
  void classify_completed(ScanContext &context);
  void exhaust(ScanContext &context);
  void fail(ScanContext &context);

  void transition(ScanContext &context, ScanState next);
  void to_error(ScanContext &context, std::string detail, bool transport);
  [[nodiscard]] HeaderMap auth_headers() const;

  config::ScannerConfig config_;
  HttpClient &http_;
  Sleeper sleeper_;
};

} // namespace trustgate::scanner
