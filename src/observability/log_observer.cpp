#include "safelayer/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace safelayer::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GuardRunEvent>) {
          log_line("DEBUG", "guard.run name=" + evt.guard +
                                " findings=" + std::to_string(evt.findings) +
                                " duration_us=" + std::to_string(evt.duration.count()) +
                                " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, PipelineRunEvent>) {
          log_line("INFO", "pipeline.run guards=" + std::to_string(evt.guards) +
                               " findings=" + std::to_string(evt.findings) +
                               " duration_us=" + std::to_string(evt.duration.count()) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, GuardFailureEvent>) {
          log_line(evt.isolated ? "WARN" : "ERROR",
                   "guard.failure name=" + evt.guard + " isolated=" + bool_text(evt.isolated) +
                       ": " + evt.message);
        } else if constexpr (std::is_same_v<T, PolicyLoadedEvent>) {
          log_line("INFO", "policy.loaded name=" + evt.name + " version=" + evt.version +
                               " source=" + evt.source);
        } else if constexpr (std::is_same_v<T, PolicyActivatedEvent>) {
          log_line("INFO", "policy.activated name=" + evt.name);
        } else if constexpr (std::is_same_v<T, InheritanceSkippedEvent>) {
          log_line("INFO", "policy.inheritance_skipped policy=" + evt.policy +
                               " parent=" + evt.parent + " (parent not loaded)");
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RunLatencyMetric>) {
          log_line("DEBUG", "metric.run_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, FindingsMetric>) {
          log_line("DEBUG", "metric.findings=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace safelayer::observability
