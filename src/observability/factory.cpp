#include "trustgate/observability/factory.hpp"

#include "trustgate/common/fs.hpp"
#include "trustgate/observability/log_observer.hpp"
#include "trustgate/observability/noop_observer.hpp"

namespace trustgate::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace trustgate::observability
