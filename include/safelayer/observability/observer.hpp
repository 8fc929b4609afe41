#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace safelayer::observability {

struct GuardRunEvent {
  std::string guard;
  std::size_t findings = 0;
  std::chrono::microseconds duration{0};
  bool success = false;
};

struct PipelineRunEvent {
  std::size_t guards = 0;
  std::size_t findings = 0;
  std::chrono::microseconds duration{0};
  bool success = false;
};

struct GuardFailureEvent {
  std::string guard;
  std::string message;
  bool isolated = false;
};

struct PolicyLoadedEvent {
  std::string name;
  std::string version;
  std::string source;
};

struct PolicyActivatedEvent {
  std::string name;
};

/// The parent named by a child policy was not registered, so the child loaded standalone.
struct InheritanceSkippedEvent {
  std::string policy;
  std::string parent;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<GuardRunEvent, PipelineRunEvent, GuardFailureEvent, PolicyLoadedEvent,
                 PolicyActivatedEvent, InheritanceSkippedEvent, ErrorEvent>;

struct RunLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct FindingsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RunLatencyMetric, FindingsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace safelayer::observability
