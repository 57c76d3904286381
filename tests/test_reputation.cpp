#include "test_framework.hpp"

#include "trustgate/intake/hasher.hpp"
#include "trustgate/scanner/reputation.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <string>

namespace {

namespace sc = trustgate::scanner;
namespace tt = trustgate::testing;

trustgate::intake::Artifact sample_pdf() {
  return trustgate::intake::Artifact{
      .name = "report.pdf", .bytes = tt::pdf_bytes(), .declared_mime = "application/pdf"};
}

// Lookup 404 then a successful upload returning analysis "an-1".
void script_unknown_file(tt::FakeHttpClient &http) {
  http.enqueue_status(404, R"({"error":{"code":"NotFoundError","message":"not found"}})");
  http.enqueue_status(200, tt::upload_body("an-1"));
}

} // namespace

void register_reputation_tests(std::vector<trustgate::tests::TestCase> &tests) {
  using trustgate::tests::require;

  tests.push_back({"reputation_known_clean_file_passes", [] {
                     tt::FakeHttpClient http;
                     tt::RecordingSleeper sleeper;
                     http.enqueue_status(200, tt::lookup_body(0, 0, 70, 2));
                     sc::ReputationScanner scanner(tt::scanner_config(), http, sleeper.sleeper());

                     const auto artifact = sample_pdf();
                     const auto verdict = scanner.scan(artifact);
                     require(verdict.safe, "clean file is safe");
                     require(verdict.outcome == sc::ReputationOutcome::Clean, "clean outcome");
                     require(verdict.message == "Reputation scan passed: no threats detected.",
                             "passed message");
                     require(verdict.stats.has_value() && verdict.stats->total() == 72,
                             "stats carried");

                     require(http.requests().size() == 1, "single lookup request");
                     const auto &request = http.requests().front();
                     require(request.method == "GET", "lookup is a GET");
                     require(request.url == std::string(tt::kTestBaseUrl) + "/files/" +
                                                trustgate::intake::sha256_hex(artifact.bytes),
                             "lookup by digest");
                     require(request.headers.at("x-apikey") == tt::kTestApiKey, "api key header");
                     require(sleeper.delays().empty(), "no polling delay");
                   }});

  tests.push_back({"reputation_known_malicious_file_blocks", [] {
                     tt::FakeHttpClient http;
                     http.enqueue_status(200, tt::lookup_body(3, 1, 60, 8, std::string("trojan.x")));
                     sc::ReputationScanner scanner(tt::scanner_config(), http);

                     const auto verdict = scanner.scan(sample_pdf());
                     require(!verdict.safe, "malicious file is unsafe");
                     require(verdict.outcome == sc::ReputationOutcome::Unsafe, "unsafe outcome");
                     require(verdict.message == "SECURITY ALERT: 3/72 vendors flagged this file.",
                             "ratio message");
                     require(verdict.threat_label == std::optional<std::string>("trojan.x"),
                             "label from classification");
                   }});

  tests.push_back({"reputation_pending_after_poll_ceiling", [] {
                     tt::FakeHttpClient http;
                     tt::RecordingSleeper sleeper;
                     script_unknown_file(http);
                     for (int i = 0; i < 5; ++i) {
                       http.enqueue_status(200, tt::analysis_body("in_progress"));
                     }
                     sc::ReputationScanner scanner(tt::scanner_config(), http, sleeper.sleeper());

                     const auto verdict = scanner.scan(sample_pdf());
                     require(verdict.safe, "exhaustion fails open");
                     require(verdict.outcome == sc::ReputationOutcome::Pending, "pending outcome");
                     require(verdict.message == "Scan pending: analysis not finished after 5 "
                                                "attempts. Proceed with caution.",
                             "pending message");
                     require(http.requests().size() == 7, "lookup, upload and five polls");
                     require(http.requests()[1].method == "POST", "upload is a POST");
                     require(http.requests()[1].field_name == "file", "multipart field");
                     require(http.requests()[1].filename == "report.pdf", "upload filename");
                     require(http.requests()[2].url ==
                                 std::string(tt::kTestBaseUrl) + "/analyses/an-1",
                             "polls the analysis id");
                     require(sleeper.delays().size() == 5, "one delay per poll");
                     for (const auto delay : sleeper.delays()) {
                       require(delay == std::chrono::milliseconds(3000), "three second interval");
                     }
                   }});

  tests.push_back({"reputation_completed_analysis_is_classified", [] {
                     tt::FakeHttpClient http;
                     tt::RecordingSleeper sleeper;
                     script_unknown_file(http);
                     http.enqueue_status(200, tt::analysis_body("queued"));
                     http.enqueue_status(200, tt::completed_analysis_body(0, 2, 40, 10));
                     sc::ReputationScanner scanner(tt::scanner_config(), http, sleeper.sleeper());

                     const auto verdict = scanner.scan(sample_pdf());
                     require(!verdict.safe, "suspicious verdict blocks");
                     require(verdict.message == "SECURITY ALERT: 0/52 vendors flagged this file.",
                             "ratio reports malicious count");
                     require(!verdict.threat_label.has_value(),
                             "no default label without malicious votes");
                     require(sleeper.delays().size() == 2, "stopped after completion");
                     require(http.remaining() == 0, "all scripted responses consumed");
                   }});

  tests.push_back({"reputation_nested_keys_do_not_shadow_top_level_fields", [] {
                     tt::FakeHttpClient http;
                     tt::RecordingSleeper sleeper;
                     http.enqueue_status(404, R"({"error":{"message":"not found"}})");
                     http.enqueue_status(200, R"({"data":{"links":{"id":"wrong"},"id":"an-9"}})");
                     for (int i = 0; i < 5; ++i) {
                       http.enqueue_status(
                           200,
                           R"({"data":{"attributes":{"meta":{"status":"completed"},)"
                           R"("status":"queued","stats":{}}}})");
                     }
                     sc::ReputationScanner scanner(tt::scanner_config(), http, sleeper.sleeper());

                     const auto verdict = scanner.scan(sample_pdf());
                     require(http.requests()[2].url ==
                                 std::string(tt::kTestBaseUrl) + "/analyses/an-9",
                             "analysis id read from data, not data.links");
                     require(verdict.outcome == sc::ReputationOutcome::Pending,
                             "nested status never completes the analysis");
                     require(http.requests().size() == 7, "all polls spent");
                   }});

  tests.push_back({"reputation_threat_label_read_from_classification_itself", [] {
                     tt::FakeHttpClient http;
                     http.enqueue_status(
                         200,
                         R"({"data":{"attributes":{"last_analysis_stats":{"malicious":4,)"
                         R"("suspicious":0,"harmless":60,"undetected":6},)"
                         R"("popular_threat_classification":{"popular_threat_category":)"
                         R"([{"suggested_threat_label":"decoy"}],)"
                         R"("suggested_threat_label":"trojan.real"}}}})");
                     sc::ReputationScanner scanner(tt::scanner_config(), http);

                     const auto verdict = scanner.scan(sample_pdf());
                     require(!verdict.safe, "malicious votes block");
                     require(verdict.threat_label == std::optional<std::string>("trojan.real"),
                             "label is the classification's own member");
                   }});

  tests.push_back({"reputation_failed_polls_spend_attempts", [] {
                     tt::FakeHttpClient http;
                     tt::RecordingSleeper sleeper;
                     script_unknown_file(http);
                     http.enqueue_status(500, "oops");
                     http.enqueue_network_error("connection reset");
                     http.enqueue_status(200, tt::completed_analysis_body(0, 0, 50, 1));
                     sc::ReputationScanner scanner(tt::scanner_config(), http, sleeper.sleeper());

                     const auto verdict = scanner.scan(sample_pdf());
                     require(verdict.safe && verdict.outcome == sc::ReputationOutcome::Clean,
                             "third poll completes clean");
                     require(sleeper.delays().size() == 3, "failed polls still counted");
                   }});

  tests.push_back({"reputation_fail_open_cases", [] {
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(401, R"({"error":{"code":"WrongCredentialsError"}})");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.safe, "401 fails open");
                       require(verdict.message ==
                                   "Reputation service credential rejected (401). Scan skipped.",
                               "401 message");
                       require(http.requests().size() == 1, "no upload after 401");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(429, "");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.safe, "429 fails open");
                       require(verdict.outcome == sc::ReputationOutcome::Unavailable,
                               "unavailable outcome");
                       require(verdict.message ==
                                   "Reputation service rate limit exceeded. Scan skipped.",
                               "429 message");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_network_error("Could not resolve host");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.safe, "transport error fails open");
                       require(verdict.message ==
                                   "Reputation scan skipped (network blocked or unreachable): "
                                   "Could not resolve host",
                               "transport message");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(500, "");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.safe, "server error fails open");
                       require(verdict.message == "Reputation scan error: unexpected lookup status 500",
                               "protocol message");
                     }
                   }});

  tests.push_back({"reputation_upload_failures", [] {
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(404, "");
                       http.enqueue_status(429, "");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.safe && verdict.outcome == sc::ReputationOutcome::Unavailable,
                               "upload rate limit fails open");
                       require(http.requests().size() == 2, "no polling after rate limit");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(404, "");
                       http.enqueue_status(413, "");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.message == "Reputation scan error: unexpected upload status 413",
                               "upload status message");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(404, "");
                       http.enqueue_status(200, R"({"data":{}})");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.message ==
                                   "Reputation scan error: upload response carried no analysis id",
                               "missing id message");
                     }
                   }});

  tests.push_back({"reputation_lookup_body_problems", [] {
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(200, R"({"error":{"code":"QuotaExceeded","message":"quota"}})");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       require(scanner.scan(sample_pdf()).message == "Reputation scan error: quota",
                               "error object message");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(200, "not json");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       require(scanner.scan(sample_pdf()).message ==
                                   "Reputation scan error: Invalid API response structure",
                               "malformed body");
                     }
                     {
                       tt::FakeHttpClient http;
                       http.enqueue_status(200, R"({"data":{"attributes":{"size":10}}})");
                       sc::ReputationScanner scanner(tt::scanner_config(), http);
                       const auto verdict = scanner.scan(sample_pdf());
                       require(verdict.safe && verdict.message == "No analysis stats available.",
                               "no stats passes");
                     }
                   }});

  tests.push_back({"reputation_without_api_key_makes_no_requests", [] {
                     tt::FakeHttpClient http;
                     auto config = tt::scanner_config();
                     config.api_key.reset();
                     sc::ReputationScanner scanner(config, http);
                     const auto verdict = scanner.scan(sample_pdf());
                     require(verdict.safe, "disabled scanner passes");
                     require(verdict.message ==
                                 "Reputation scanning disabled: no API key configured.",
                             "disabled message");
                     require(http.requests().empty(), "no network traffic");
                   }});

  tests.push_back({"reputation_classification_is_monotonic", [] {
                     for (std::uint32_t malicious = 0; malicious < 4; ++malicious) {
                       for (std::uint32_t suspicious = 0; suspicious < 4; ++suspicious) {
                         const sc::VendorStats stats{.malicious = malicious,
                                                     .suspicious = suspicious,
                                                     .harmless = 50,
                                                     .undetected = 5};
                         const auto verdict = sc::classify_stats(stats, std::nullopt);
                         require(verdict.safe == (malicious == 0 && suspicious == 0),
                                 "only zero votes are safe");
                       }
                     }
                     const auto labelled =
                         sc::classify_stats(sc::VendorStats{.malicious = 1}, std::nullopt);
                     require(labelled.threat_label == std::optional<std::string>("Malicious Content"),
                             "default label");
                   }});

  tests.push_back({"reputation_parse_stats_defaults_missing_counters", [] {
                     const auto stats = sc::parse_stats(R"({"malicious":2,"harmless":9})");
                     require(stats.malicious == 2 && stats.harmless == 9, "present counters");
                     require(stats.suspicious == 0 && stats.undetected == 0, "missing are zero");
                   }});

  tests.push_back({"reputation_step_walks_states", [] {
                     tt::FakeHttpClient http;
                     tt::RecordingSleeper sleeper;
                     script_unknown_file(http);
                     http.enqueue_status(200, tt::completed_analysis_body(0, 0, 10, 0));
                     sc::ReputationScanner scanner(tt::scanner_config(), http, sleeper.sleeper());

                     const auto artifact = sample_pdf();
                     sc::ScanContext context;
                     context.artifact = &artifact;

                     const std::vector<sc::ScanState> expected = {
                         sc::ScanState::Lookup,    sc::ScanState::Upload,
                         sc::ScanState::Polling,   sc::ScanState::Completed,
                         sc::ScanState::Done,
                     };
                     for (const auto state : expected) {
                       scanner.step(context);
                       require(context.state == state,
                               "expected state " + std::string(sc::state_name(state)) + " got " +
                                   std::string(sc::state_name(context.state)));
                     }
                     require(sc::is_terminal(context.state), "done is terminal");
                     require(!context.session.has_value(), "session dropped at terminal state");
                     require(context.verdict.has_value() && context.verdict->safe, "clean verdict");
                   }});

  tests.push_back({"reputation_error_state_is_absorbing", [] {
                     tt::FakeHttpClient http;
                     http.enqueue_status(503, "");
                     sc::ReputationScanner scanner(tt::scanner_config(), http);

                     const auto artifact = sample_pdf();
                     sc::ScanContext context;
                     context.artifact = &artifact;
                     scanner.step(context);
                     scanner.step(context);
                     require(context.state == sc::ScanState::Error, "lookup failure enters error");
                     require(context.verdict.has_value() && context.verdict->safe,
                             "verdict set on entry");

                     scanner.step(context);
                     scanner.step(context);
                     require(context.state == sc::ScanState::Error, "error stays error");
                     require(http.requests().size() == 1, "no further requests");
                   }});
}
