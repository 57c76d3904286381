#include "trustgate/observability/global.hpp"

#include <mutex>

namespace trustgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_artifact_status(const std::string &artifact, const std::string &status,
                            const std::optional<std::string> &error) {
  record_event(ArtifactStatusEvent{.artifact = artifact, .status = status, .error = error});
}

void record_scan_transition(const std::string &artifact, const std::string &from,
                            const std::string &to) {
  record_event(ScanTransitionEvent{.artifact = artifact, .from = from, .to = to});
}

void record_reputation(const std::string &artifact, const std::string &outcome,
                       const std::string &message) {
  record_event(ReputationEvent{.artifact = artifact, .outcome = outcome, .message = message});
}

void record_sanitization(const std::string &field, const std::string &rejection,
                         const std::string &reason) {
  record_event(SanitizationEvent{.field = field, .rejection = rejection, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_scan_latency(const std::chrono::milliseconds latency) {
  record_metric(ScanLatencyMetric{.latency = latency});
}

void record_batch_size(const std::uint64_t items, const std::uint64_t accepted) {
  record_metric(BatchSizeMetric{.items = items, .accepted = accepted});
}

} // namespace trustgate::observability
