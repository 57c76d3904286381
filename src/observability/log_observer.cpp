#include "trustgate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace trustgate::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ArtifactStatusEvent>) {
          std::string line = "artifact.status name=" + evt.artifact + " status=" + evt.status;
          if (evt.error.has_value()) {
            line += " error=\"" + *evt.error + "\"";
          }
          log_line(evt.status == "FAILED" ? "WARN" : "INFO", line);
        } else if constexpr (std::is_same_v<T, ScanTransitionEvent>) {
          log_line("DEBUG", "scan.transition name=" + evt.artifact + " " + evt.from + " -> " +
                                evt.to);
        } else if constexpr (std::is_same_v<T, ReputationEvent>) {
          log_line(evt.outcome == "unsafe" ? "WARN" : "INFO",
                   "scan.verdict name=" + evt.artifact + " outcome=" + evt.outcome +
                       " message=\"" + evt.message + "\"");
        } else if constexpr (std::is_same_v<T, SanitizationEvent>) {
          log_line("WARN", "sanitize.rejected field=" + evt.field + " rule=" + evt.rejection +
                               " reason=\"" + evt.reason + "\"");
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line("DEBUG", "metric.scan_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, BatchSizeMetric>) {
          log_line("DEBUG", "metric.batch items=" + std::to_string(m.items) +
                                " accepted=" + std::to_string(m.accepted));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace trustgate::observability
