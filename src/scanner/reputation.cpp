#include "trustgate/scanner/reputation.hpp"

#include "trustgate/common/json_util.hpp"
#include "trustgate/intake/hasher.hpp"
#include "trustgate/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <thread>

namespace trustgate::scanner {

namespace {

constexpr const char *kMessageDisabled = "Reputation scanning disabled: no API key configured.";
constexpr const char *kMessageUnauthorized =
    "Reputation service credential rejected (401). Scan skipped.";
constexpr const char *kMessageRateLimited =
    "Reputation service rate limit exceeded. Scan skipped.";
constexpr const char *kMessageNoStats = "No analysis stats available.";
constexpr const char *kMessagePassed = "Reputation scan passed: no threats detected.";
constexpr const char *kDefaultThreatLabel = "Malicious Content";
constexpr const char *kUploadField = "file";

bool is_success(const std::uint16_t status) { return status >= 200 && status < 300; }

ReputationVerdict unavailable(std::string message) {
  ReputationVerdict verdict;
  verdict.safe = true;
  verdict.message = std::move(message);
  verdict.outcome = ReputationOutcome::Unavailable;
  return verdict;
}

// Top-level member of a JSON object, only when it has the given kind. Nested
// objects and strings are never searched, so a same-named key deeper in the
// document cannot stand in for it.
std::optional<std::string> member(const std::string &object_json, const char *key,
                                  const common::JsonKind kind) {
  const auto fields = common::json_parse_fields(object_json);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  const auto it = fields->find(key);
  if (it == fields->end() || it->second.kind != kind) {
    return std::nullopt;
  }
  return it->second.value;
}

std::string string_member(const std::string &object_json, const char *key) {
  return member(object_json, key, common::JsonKind::String).value_or("");
}

// data.attributes of a lookup or analysis response. Empty when absent.
struct ParsedAttributes {
  std::string attributes;
  std::optional<std::string> error;
};

ParsedAttributes parse_attributes(const std::string &body) {
  const auto fields = common::json_parse_fields(body);
  if (!fields.has_value()) {
    return {.attributes = "", .error = "Invalid API response structure"};
  }
  if (const auto error = fields->find("error"); error != fields->end()) {
    std::string message;
    if (error->second.kind == common::JsonKind::Object) {
      message = string_member(error->second.value, "message");
    }
    return {.attributes = "", .error = message.empty() ? "Unknown API error" : message};
  }

  const auto data = fields->find("data");
  if (data == fields->end() || data->second.kind != common::JsonKind::Object) {
    return {.attributes = "", .error = "Invalid API response structure"};
  }
  const auto data_fields = common::json_parse_fields(data->second.value);
  if (!data_fields.has_value()) {
    return {.attributes = "", .error = "Invalid API response structure"};
  }
  const auto attributes = data_fields->find("attributes");
  if (attributes == data_fields->end() || attributes->second.kind != common::JsonKind::Object) {
    return {.attributes = "", .error = "Invalid API response structure"};
  }
  return {.attributes = attributes->second.value, .error = std::nullopt};
}

std::optional<std::string> find_stats(const std::string &attributes) {
  const auto fields = common::json_parse_fields(attributes);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  for (const char *key : {"last_analysis_stats", "stats"}) {
    const auto it = fields->find(key);
    if (it != fields->end() && it->second.kind == common::JsonKind::Object) {
      return it->second.value;
    }
  }
  return std::nullopt;
}

std::optional<std::string> find_threat_label(const std::string &attributes) {
  const auto classification =
      member(attributes, "popular_threat_classification", common::JsonKind::Object);
  if (!classification.has_value()) {
    return std::nullopt;
  }
  std::string label = string_member(*classification, "suggested_threat_label");
  if (label.empty()) {
    return std::nullopt;
  }
  return label;
}

std::uint32_t counter(const std::string &stats_json, const std::string &key) {
  const auto raw = member(stats_json, key.c_str(), common::JsonKind::Number);
  if (!raw.has_value()) {
    return 0;
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
  if (ec != std::errc() || ptr != raw->data() + raw->size()) {
    return 0;
  }
  return static_cast<std::uint32_t>(std::min<std::uint64_t>(value, UINT32_MAX));
}

} // namespace

Sleeper thread_sleeper() {
  return [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::string_view state_name(const ScanState state) {
  switch (state) {
  case ScanState::Hashing:
    return "hashing";
  case ScanState::Lookup:
    return "lookup";
  case ScanState::KnownVerdict:
    return "known_verdict";
  case ScanState::Upload:
    return "upload";
  case ScanState::Polling:
    return "polling";
  case ScanState::Completed:
    return "completed";
  case ScanState::Exhausted:
    return "exhausted";
  case ScanState::Error:
    return "error";
  case ScanState::Done:
    return "done";
  }
  return "unknown";
}

std::string_view outcome_name(const ReputationOutcome outcome) {
  switch (outcome) {
  case ReputationOutcome::Clean:
    return "clean";
  case ReputationOutcome::Unsafe:
    return "unsafe";
  case ReputationOutcome::Unavailable:
    return "unavailable";
  case ReputationOutcome::Pending:
    return "pending";
  }
  return "unknown";
}

bool is_terminal(const ScanState state) {
  return state == ScanState::Done || state == ScanState::Error;
}

VendorStats parse_stats(const std::string &stats_json) {
  VendorStats stats;
  stats.malicious = counter(stats_json, "malicious");
  stats.suspicious = counter(stats_json, "suspicious");
  stats.harmless = counter(stats_json, "harmless");
  stats.undetected = counter(stats_json, "undetected");
  return stats;
}

ReputationVerdict classify_stats(const VendorStats &stats,
                                 std::optional<std::string> threat_label) {
  ReputationVerdict verdict;
  verdict.stats = stats;
  if (stats.malicious > 0 || stats.suspicious > 0) {
    verdict.safe = false;
    verdict.outcome = ReputationOutcome::Unsafe;
    verdict.message = "SECURITY ALERT: " + std::to_string(stats.malicious) + "/" +
                      std::to_string(stats.total()) + " vendors flagged this file.";
    if (!threat_label.has_value() && stats.malicious > 0) {
      threat_label = kDefaultThreatLabel;
    }
    verdict.threat_label = std::move(threat_label);
    return verdict;
  }
  verdict.safe = true;
  verdict.outcome = ReputationOutcome::Clean;
  verdict.message = kMessagePassed;
  return verdict;
}

ReputationScanner::ReputationScanner(config::ScannerConfig config, HttpClient &http,
                                     Sleeper sleeper)
    : config_(std::move(config)), http_(http), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = thread_sleeper();
  }
}

ReputationVerdict ReputationScanner::scan(const intake::Artifact &artifact) {
  if (!config_.api_key.has_value() || config_.api_key->empty()) {
    ReputationVerdict verdict = unavailable(kMessageDisabled);
    observability::record_reputation(artifact.name, std::string(outcome_name(verdict.outcome)),
                                     verdict.message);
    return verdict;
  }

  const auto started = std::chrono::steady_clock::now();
  ScanContext context;
  context.artifact = &artifact;
  while (!is_terminal(context.state)) {
    step(context);
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_scan_latency(elapsed);

  ReputationVerdict verdict =
      context.verdict.has_value() ? std::move(*context.verdict) : unavailable(kMessageNoStats);
  observability::record_reputation(artifact.name, std::string(outcome_name(verdict.outcome)),
                                   verdict.message);
  return verdict;
}

void ReputationScanner::step(ScanContext &context) {
  switch (context.state) {
  case ScanState::Hashing:
    hash(context);
    break;
  case ScanState::Lookup:
    lookup(context);
    break;
  case ScanState::KnownVerdict:
    classify_known(context);
    break;
  case ScanState::Upload:
    upload(context);
    break;
  case ScanState::Polling:
    poll(context);
    break;
  case ScanState::Completed:
    classify_completed(context);
    break;
  case ScanState::Exhausted:
    exhaust(context);
    break;
  case ScanState::Error:
  case ScanState::Done:
    break;
  }
}

void ReputationScanner::hash(ScanContext &context) {
  context.digest = intake::sha256_hex(context.artifact->bytes);
  if (context.digest.empty()) {
    to_error(context, "failed to compute SHA-256 digest", false);
    return;
  }
  transition(context, ScanState::Lookup);
}

void ReputationScanner::lookup(ScanContext &context) {
  const HttpResponse response =
      http_.get(config_.base_url + "/files/" + context.digest, auth_headers(), config_.timeout_ms,
               NO_BODY_LIMIT);
  if (response.network_error) {
    to_error(context, response.network_error_message, true);
    return;
  }

  switch (response.status) {
  case 200:
    context.pending_body = response.body;
    transition(context, ScanState::KnownVerdict);
    return;
  case 401:
    context.verdict = unavailable(kMessageUnauthorized);
    transition(context, ScanState::Done);
    return;
  case 429:
    context.verdict = unavailable(kMessageRateLimited);
    transition(context, ScanState::Done);
    return;
  case 404:
    transition(context, ScanState::Upload);
    return;
  default:
    to_error(context, "unexpected lookup status " + std::to_string(response.status), false);
    return;
  }
}

void ReputationScanner::classify_known(ScanContext &context) {
  const ParsedAttributes parsed = parse_attributes(context.pending_body);
  context.pending_body.clear();
  if (parsed.error.has_value()) {
    to_error(context, *parsed.error, false);
    return;
  }

  const auto stats = find_stats(parsed.attributes);
  if (!stats.has_value()) {
    ReputationVerdict verdict;
    verdict.message = kMessageNoStats;
    context.verdict = std::move(verdict);
  } else {
    context.verdict = classify_stats(parse_stats(*stats), find_threat_label(parsed.attributes));
  }
  transition(context, ScanState::Done);
}

void ReputationScanner::upload(ScanContext &context) {
  const std::string filename = context.artifact->name.empty() ? "upload" : context.artifact->name;
  const HttpResponse response =
      http_.post_multipart(config_.base_url + "/files", auth_headers(), kUploadField, filename,
                           context.artifact->bytes, config_.timeout_ms);
  if (response.network_error) {
    to_error(context, response.network_error_message, true);
    return;
  }
  if (response.status == 429) {
    context.verdict = unavailable(kMessageRateLimited);
    transition(context, ScanState::Done);
    return;
  }
  if (!is_success(response.status)) {
    to_error(context, "unexpected upload status " + std::to_string(response.status), false);
    return;
  }

  const auto data = member(response.body, "data", common::JsonKind::Object);
  const std::string analysis_id = data.has_value() ? string_member(*data, "id") : "";
  if (analysis_id.empty()) {
    to_error(context, "upload response carried no analysis id", false);
    return;
  }

  context.session = ScanSession{.analysis_id = analysis_id,
                                .attempt = 0,
                                .started_at = std::chrono::steady_clock::now()};
  transition(context, ScanState::Polling);
}

void ReputationScanner::poll(ScanContext &context) {
  if (!context.session.has_value()) {
    to_error(context, "polling without an analysis session", false);
    return;
  }
  ScanSession &session = *context.session;
  if (session.attempt >= config_.poll_attempts) {
    transition(context, ScanState::Exhausted);
    return;
  }

  sleeper_(std::chrono::milliseconds(config_.poll_interval_ms));
  ++session.attempt;

  const HttpResponse response = http_.get(config_.base_url + "/analyses/" + session.analysis_id,
                                          auth_headers(), config_.timeout_ms, NO_BODY_LIMIT);
  if (response.network_error || !is_success(response.status)) {
    const std::string detail = response.network_error
                                   ? response.network_error_message
                                   : "status " + std::to_string(response.status);
    observability::record_error("scanner", "analysis poll " + std::to_string(session.attempt) +
                                               " failed: " + detail);
    return;
  }

  const ParsedAttributes parsed = parse_attributes(response.body);
  if (parsed.error.has_value()) {
    observability::record_error("scanner", "analysis poll " + std::to_string(session.attempt) +
                                               ": " + *parsed.error);
    return;
  }
  if (string_member(parsed.attributes, "status") == "completed") {
    context.pending_body = parsed.attributes;
    transition(context, ScanState::Completed);
  }
}

void ReputationScanner::classify_completed(ScanContext &context) {
  const auto stats = find_stats(context.pending_body);
  if (!stats.has_value()) {
    ReputationVerdict verdict;
    verdict.message = kMessageNoStats;
    context.verdict = std::move(verdict);
  } else {
    context.verdict = classify_stats(parse_stats(*stats), find_threat_label(context.pending_body));
  }
  context.pending_body.clear();
  transition(context, ScanState::Done);
}

void ReputationScanner::exhaust(ScanContext &context) {
  const std::uint32_t attempts = context.session.has_value() ? context.session->attempt : 0;
  ReputationVerdict verdict;
  verdict.safe = true;
  verdict.outcome = ReputationOutcome::Pending;
  verdict.message = "Scan pending: analysis not finished after " + std::to_string(attempts) +
                    " attempts. Proceed with caution.";
  context.verdict = std::move(verdict);
  transition(context, ScanState::Done);
}

void ReputationScanner::fail(ScanContext &context) {
  context.verdict = unavailable(context.transport_error
                                    ? "Reputation scan skipped (network blocked or unreachable): " +
                                          context.error_detail
                                    : "Reputation scan error: " + context.error_detail);
}

void ReputationScanner::transition(ScanContext &context, const ScanState next) {
  observability::record_scan_transition(context.artifact->name,
                                        std::string(state_name(context.state)),
                                        std::string(state_name(next)));
  context.state = next;
  if (is_terminal(next)) {
    context.session.reset();
  }
}

void ReputationScanner::to_error(ScanContext &context, std::string detail, const bool transport) {
  context.error_detail = std::move(detail);
  context.transport_error = transport;
  observability::record_error("scanner", context.error_detail);
  fail(context);
  transition(context, ScanState::Error);
}

HeaderMap ReputationScanner::auth_headers() const {
  return HeaderMap{{"x-apikey", config_.api_key.value_or("")}, {"accept", "application/json"}};
}

} // namespace trustgate::scanner
