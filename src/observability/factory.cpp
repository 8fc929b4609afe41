#include "safelayer/observability/factory.hpp"

#include "safelayer/common/fs.hpp"
#include "safelayer/observability/log_observer.hpp"
#include "safelayer/observability/multi_observer.hpp"
#include "safelayer/observability/noop_observer.hpp"

namespace safelayer::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    for (const auto &part : common::split_list(backend)) {
      if (part == "log") {
        multi->add(std::make_unique<LogObserver>());
      } else if (part == "noop" || part == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>();
}

} // namespace safelayer::observability
