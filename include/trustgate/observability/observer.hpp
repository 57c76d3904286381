#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace trustgate::observability {

struct ArtifactStatusEvent {
  std::string artifact;
  std::string status;
  std::optional<std::string> error;
};

struct ScanTransitionEvent {
  std::string artifact;
  std::string from;
  std::string to;
};

struct ReputationEvent {
  std::string artifact;
  std::string outcome;
  std::string message;
};

struct SanitizationEvent {
  std::string field;
  std::string rejection;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ArtifactStatusEvent, ScanTransitionEvent, ReputationEvent,
                                   SanitizationEvent, ErrorEvent>;

struct ScanLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct BatchSizeMetric {
  std::uint64_t items = 0;
  std::uint64_t accepted = 0;
};

using ObserverMetric = std::variant<ScanLatencyMetric, BatchSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace trustgate::observability
