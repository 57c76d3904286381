#pragma once

#include "trustgate/observability/observer.hpp"

#include <memory>

namespace trustgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_artifact_status(const std::string &artifact, const std::string &status,
                            const std::optional<std::string> &error = std::nullopt);
void record_scan_transition(const std::string &artifact, const std::string &from,
                            const std::string &to);
void record_reputation(const std::string &artifact, const std::string &outcome,
                       const std::string &message);
void record_sanitization(const std::string &field, const std::string &rejection,
                         const std::string &reason);
void record_error(const std::string &component, const std::string &message);
void record_scan_latency(std::chrono::milliseconds latency);
void record_batch_size(std::uint64_t items, std::uint64_t accepted);

} // namespace trustgate::observability
