#pragma once

#include "hostgate/config/schema.hpp"
#include "hostgate/observability/observer.hpp"

#include <memory>

namespace hostgate::observability {

/// Backend is "log", "none"/"noop", or a comma-separated list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hostgate::observability
