#pragma once

#include "safelayer/config/schema.hpp"
#include "safelayer/observability/observer.hpp"

#include <memory>

namespace safelayer::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace safelayer::observability
