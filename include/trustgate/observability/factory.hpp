#pragma once

#include "trustgate/config/schema.hpp"
#include "trustgate/observability/observer.hpp"

#include <memory>

namespace trustgate::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace trustgate::observability
