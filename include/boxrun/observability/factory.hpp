#pragma once

#include "boxrun/config/schema.hpp"
#include "boxrun/observability/observer.hpp"

#include <memory>

namespace boxrun::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace boxrun::observability
