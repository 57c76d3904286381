#pragma once

#include "trustgate/config/schema.hpp"
#include "trustgate/intake/artifact.hpp"
#include "trustgate/intake/url_fetch.hpp"
#include "trustgate/scanner/reputation.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustgate::intake {

enum class ProcessingStatus {
  Pending,
  Scanning,
  Success,
  Failed,
};

[[nodiscard]] std::string_view status_name(ProcessingStatus status);

struct ProcessingLogEntry {
  std::string name;
  ProcessingStatus status = ProcessingStatus::Pending;
  std::optional<std::string> error;
};

struct BatchReport {
  std::vector<ProcessingLogEntry> log;
  std::vector<AcceptedArtifact> accepted;

  [[nodiscard]] bool all_accepted() const { return !log.empty() && accepted.size() == log.size(); }
};

using BatchConsumer = std::function<void(const std::vector<AcceptedArtifact> &)>;
using StatusListener = std::function<void(std::size_t index, const ProcessingLogEntry &entry)>;

// One artifact at a time, in submission order. A failure is logged and skipped.
class BatchOrchestrator {
public:
  BatchOrchestrator(config::IntakeConfig config, scanner::ReputationScanner &scanner,
                    scanner::Sleeper sleeper = scanner::thread_sleeper());

  void set_status_listener(StatusListener listener);

  BatchReport process_batch(const std::vector<Artifact> &artifacts, const BatchConsumer &consumer);

  BatchReport process_url(const std::string &url, UrlFetcher &fetcher,
                          const BatchConsumer &consumer);

  [[nodiscard]] const std::vector<ProcessingLogEntry> &log() const { return log_; }

private:
  [[nodiscard]] std::optional<AcceptedArtifact> process_one(std::size_t index,
                                                            const Artifact &artifact,
                                                            bool allow_webp);
  void set_status(std::size_t index, ProcessingStatus status,
                  std::optional<std::string> error = std::nullopt);
  void reset_log(std::vector<std::string> names);
  BatchReport finish(std::vector<AcceptedArtifact> accepted, std::uint64_t delay_ms,
                     const BatchConsumer &consumer);
  [[nodiscard]] bool mime_allowed(const std::string &mime) const;

  config::IntakeConfig config_;
  scanner::ReputationScanner &scanner_;
  scanner::Sleeper sleeper_;
  StatusListener listener_;
  std::vector<ProcessingLogEntry> log_;
  std::uint64_t accepted_bytes_ = 0;
};

} // namespace trustgate::intake
