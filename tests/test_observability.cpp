#include "test_framework.hpp"

#include "trustgate/config/schema.hpp"
#include "trustgate/observability/factory.hpp"
#include "trustgate/observability/global.hpp"
#include "trustgate/observability/log_observer.hpp"
#include "trustgate/observability/noop_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  std::string last_status;
};

class CountingObserver final : public trustgate::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const trustgate::observability::ObserverEvent &event) override {
    ++state_->events;
    if (const auto *status = std::get_if<trustgate::observability::ArtifactStatusEvent>(&event);
        status != nullptr) {
      state_->last_status = status->status;
    }
  }
  void record_metric(const trustgate::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<trustgate::tests::TestCase> &tests) {
  using trustgate::tests::require;
  namespace ob = trustgate::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_artifact_status("a.pdf", "SCANNING");
                     ob::record_scan_latency(std::chrono::milliseconds(5));

                     // Reset to prevent dangling references during static destruction
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_global_forwards_helpers", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));

                     ob::record_artifact_status("a.pdf", "FAILED", std::string("too big"));
                     ob::record_scan_transition("a.pdf", "LOOKUP", "UPLOAD");
                     ob::record_reputation("a.pdf", "clean", "ok");
                     ob::record_sanitization("text", "sql", "Security Alert");
                     ob::record_error("import", "bad signature");
                     ob::record_scan_latency(std::chrono::milliseconds(12));
                     ob::record_batch_size(3, 2);

                     require(state.events == 5, "five events forwarded");
                     require(state.metrics == 2, "two metrics forwarded");
                     require(state.last_status == "FAILED", "status carried through");

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_without_observer_is_silent", [] {
                     ob::set_global_observer(nullptr);
                     ob::record_error("unit", "nobody listening");
                     ob::record_batch_size(1, 1);
                     require(ob::get_global_observer() == nullptr, "no observer installed");
                   }});

  tests.push_back({"observability_log_observer_levels", [] {
                     std::ostringstream out;
                     ob::LogObserver log(out);
                     log.record_event(ob::ArtifactStatusEvent{
                         .artifact = "x.pdf", .status = "FAILED", .error = std::string("nope")});
                     log.record_event(ob::ArtifactStatusEvent{.artifact = "y.png",
                                                              .status = "SUCCESS",
                                                              .error = std::nullopt});
                     log.record_event(ob::ErrorEvent{.component = "import", .message = "boom"});
                     log.record_metric(ob::BatchSizeMetric{.items = 2, .accepted = 1});
                     log.flush();

                     const std::string text = out.str();
                     require(text.find("[WARN] artifact.status name=x.pdf status=FAILED "
                                       "error=\"nope\"") != std::string::npos,
                             "failed status logged as warning");
                     require(text.find("[INFO] artifact.status name=y.png status=SUCCESS") !=
                                 std::string::npos,
                             "success logged as info");
                     require(text.find("[ERROR] import: boom") != std::string::npos, "error line");
                     require(text.find("metric.batch items=2 accepted=1") != std::string::npos,
                             "batch metric line");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     trustgate::config::Config config;
                     config.observability.backend = "none";
                     auto none = ob::create_observer(config);
                     require(none->name() == "noop", "none backend should map to noop");

                     config.observability.backend = "log";
                     auto log = ob::create_observer(config);
                     require(log->name() == "log", "log backend");

                     config.observability.backend = "unknown";
                     auto fallback = ob::create_observer(config);
                     require(fallback->name() == "log", "unknown backend falls back to log");
                   }});
}
