#include "trustgate/intake/batch.hpp"

#include "trustgate/common/base64.hpp"
#include "trustgate/intake/signature.hpp"
#include "trustgate/observability/global.hpp"

#include <algorithm>

namespace trustgate::intake {

namespace {

constexpr const char *kMimeRejected = "URL must point to a PDF or Image";

std::string batch_limit_message(const std::uint64_t max_bytes) {
  constexpr std::uint64_t mib = 1024ULL * 1024ULL;
  if (max_bytes % mib == 0) {
    return "Batch size exceeds " + std::to_string(max_bytes / mib) + "MB limit.";
  }
  return "Batch size exceeds " + std::to_string(max_bytes) + " byte limit.";
}

std::string reputation_failure(const scanner::ReputationVerdict &verdict) {
  if (!verdict.threat_label.has_value()) {
    return verdict.message;
  }
  return verdict.message + " Threat: " + *verdict.threat_label;
}

} // namespace

std::string_view status_name(const ProcessingStatus status) {
  switch (status) {
  case ProcessingStatus::Pending:
    return "PENDING";
  case ProcessingStatus::Scanning:
    return "SCANNING";
  case ProcessingStatus::Success:
    return "SUCCESS";
  case ProcessingStatus::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

BatchOrchestrator::BatchOrchestrator(config::IntakeConfig config,
                                     scanner::ReputationScanner &scanner,
                                     scanner::Sleeper sleeper)
    : config_(std::move(config)), scanner_(scanner), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = scanner::thread_sleeper();
  }
}

void BatchOrchestrator::set_status_listener(StatusListener listener) {
  listener_ = std::move(listener);
}

BatchReport BatchOrchestrator::process_batch(const std::vector<Artifact> &artifacts,
                                             const BatchConsumer &consumer) {
  std::vector<std::string> names;
  names.reserve(artifacts.size());
  for (const auto &artifact : artifacts) {
    names.push_back(artifact.name);
  }
  reset_log(std::move(names));

  std::vector<AcceptedArtifact> accepted;
  for (std::size_t i = 0; i < artifacts.size(); ++i) {
    if (auto item = process_one(i, artifacts[i], false); item.has_value()) {
      accepted.push_back(std::move(*item));
    }
  }
  return finish(std::move(accepted), config_.delivery_delay_ms, consumer);
}

BatchReport BatchOrchestrator::process_url(const std::string &url, UrlFetcher &fetcher,
                                           const BatchConsumer &consumer) {
  reset_log({resource_name_from_url(url)});

  auto fetched = fetcher.fetch(url);
  if (!fetched.ok()) {
    set_status(0, ProcessingStatus::Failed, fetched.error());
    return finish({}, config_.url_delivery_delay_ms, consumer);
  }

  FetchedResource resource = fetched.take();
  if (!mime_allowed(resource.mime_type)) {
    set_status(0, ProcessingStatus::Failed, std::string(kMimeRejected));
    return finish({}, config_.url_delivery_delay_ms, consumer);
  }

  const bool allow_webp = resource.mime_type == "image/webp";
  Artifact artifact{.name = std::move(resource.name),
                    .bytes = std::move(resource.bytes),
                    .declared_mime = std::move(resource.mime_type)};
  std::vector<AcceptedArtifact> accepted;
  if (auto item = process_one(0, artifact, allow_webp); item.has_value()) {
    accepted.push_back(std::move(*item));
  }
  return finish(std::move(accepted), config_.url_delivery_delay_ms, consumer);
}

std::optional<AcceptedArtifact> BatchOrchestrator::process_one(const std::size_t index,
                                                               const Artifact &artifact,
                                                               const bool allow_webp) {
  set_status(index, ProcessingStatus::Scanning);

  const ValidationVerdict validation =
      verify_artifact(artifact, config_.max_file_bytes, allow_webp);
  if (!validation.accepted) {
    set_status(index, ProcessingStatus::Failed, validation.reason);
    return std::nullopt;
  }

  const std::uint64_t size = artifact.bytes.size();
  if (accepted_bytes_ + size > config_.max_batch_bytes) {
    set_status(index, ProcessingStatus::Failed, batch_limit_message(config_.max_batch_bytes));
    return std::nullopt;
  }

  const scanner::ReputationVerdict reputation = scanner_.scan(artifact);
  if (!reputation.safe) {
    set_status(index, ProcessingStatus::Failed, reputation_failure(reputation));
    return std::nullopt;
  }

  accepted_bytes_ += size;
  AcceptedArtifact item{.encoded_payload = common::base64_encode(artifact.bytes),
                        .mime_type = std::string(mime_type_for(validation.format)),
                        .name = artifact.name};
  set_status(index, ProcessingStatus::Success);
  return item;
}

void BatchOrchestrator::set_status(const std::size_t index, const ProcessingStatus status,
                                   std::optional<std::string> error) {
  ProcessingLogEntry &entry = log_.at(index);
  entry.status = status;
  entry.error = std::move(error);
  observability::record_artifact_status(entry.name, std::string(status_name(status)),
                                        entry.error);
  if (listener_) {
    listener_(index, entry);
  }
}

void BatchOrchestrator::reset_log(std::vector<std::string> names) {
  log_.clear();
  accepted_bytes_ = 0;
  for (auto &name : names) {
    log_.push_back(ProcessingLogEntry{.name = std::move(name)});
  }
}

BatchReport BatchOrchestrator::finish(std::vector<AcceptedArtifact> accepted,
                                      const std::uint64_t delay_ms,
                                      const BatchConsumer &consumer) {
  observability::record_batch_size(log_.size(), accepted.size());
  if (!accepted.empty()) {
    sleeper_(std::chrono::milliseconds(delay_ms));
    if (consumer) {
      consumer(accepted);
    }
  }
  return BatchReport{.log = log_, .accepted = std::move(accepted)};
}

bool BatchOrchestrator::mime_allowed(const std::string &mime) const {
  return std::find(config_.allowed_url_mime_types.begin(), config_.allowed_url_mime_types.end(),
                   mime) != config_.allowed_url_mime_types.end();
}

} // namespace trustgate::intake
