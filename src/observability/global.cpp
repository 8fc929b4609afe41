#include "safelayer/observability/global.hpp"

#include <mutex>

namespace safelayer::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_guard_run(const std::string &guard, const std::size_t findings,
                      const std::chrono::microseconds duration, const bool success) {
  record_event(GuardRunEvent{
      .guard = guard, .findings = findings, .duration = duration, .success = success});
}

void record_pipeline_run(const std::size_t guards, const std::size_t findings,
                         const std::chrono::microseconds duration, const bool success) {
  record_event(PipelineRunEvent{
      .guards = guards, .findings = findings, .duration = duration, .success = success});
  record_metric(RunLatencyMetric{.latency = duration});
  record_metric(FindingsMetric{.count = findings});
}

void record_guard_failure(const std::string &guard, const std::string &message,
                          const bool isolated) {
  record_event(GuardFailureEvent{.guard = guard, .message = message, .isolated = isolated});
}

void record_policy_loaded(const std::string &name, const std::string &version,
                          const std::string &source) {
  record_event(PolicyLoadedEvent{.name = name, .version = version, .source = source});
}

void record_policy_activated(const std::string &name) {
  record_event(PolicyActivatedEvent{.name = name});
}

void record_inheritance_skipped(const std::string &policy, const std::string &parent) {
  record_event(InheritanceSkippedEvent{.policy = policy, .parent = parent});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace safelayer::observability
