#include "boxrun/observability/factory.hpp"

#include "boxrun/common/fs.hpp"
#include "boxrun/observability/log_observer.hpp"
#include "boxrun/observability/noop_observer.hpp"

namespace boxrun::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace boxrun::observability
