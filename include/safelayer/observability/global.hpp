#pragma once

#include "safelayer/observability/observer.hpp"

#include <memory>

namespace safelayer::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_guard_run(const std::string &guard, std::size_t findings,
                      std::chrono::microseconds duration, bool success);
void record_pipeline_run(std::size_t guards, std::size_t findings,
                         std::chrono::microseconds duration, bool success);
void record_guard_failure(const std::string &guard, const std::string &message, bool isolated);
void record_policy_loaded(const std::string &name, const std::string &version,
                          const std::string &source);
void record_policy_activated(const std::string &name);
void record_inheritance_skipped(const std::string &policy, const std::string &parent);
void record_error(const std::string &component, const std::string &message);

} // namespace safelayer::observability
