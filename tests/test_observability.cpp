#include "test_framework.hpp"

#include "safelayer/observability/factory.hpp"
#include "safelayer/observability/global.hpp"
#include "safelayer/observability/log_observer.hpp"
#include "safelayer/observability/multi_observer.hpp"
#include "safelayer/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<safelayer::tests::TestCase> &tests) {
  using safelayer::tests::require;
  namespace obs = safelayer::observability;

  tests.push_back({"observability_factory_selects_backend", [] {
                     safelayer::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log -> log");
                     config.observability.backend = "log,noop";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "list -> multi");
                     require(dynamic_cast<obs::MultiObserver &>(*multi).size() == 2,
                             "multi should hold both observers");
                   }});

  tests.push_back({"observability_log_observer_formats_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::InheritanceSkippedEvent{.policy = "child",
                                                                        .parent = "base"});
                     observer.record_event(obs::GuardFailureEvent{
                         .guard = "pii:PIIGuard", .message = "boom", .isolated = true});
                     const std::string text = out.str();
                     require(text.find("[INFO] policy.inheritance_skipped policy=child parent=base") !=
                                 std::string::npos,
                             "inheritance line missing: " + text);
                     require(text.find("[WARN] guard.failure name=pii:PIIGuard isolated=true") !=
                                 std::string::npos,
                             "isolated failure should be a warning: " + text);
                   }});

  tests.push_back({"observability_global_forwards_events", [] {
                     auto recorder = std::make_shared<safelayer::testing::RecordingObserver>();
                     const safelayer::testing::ScopedObserver scoped(recorder);
                     obs::record_policy_activated("strict");
                     obs::record_pipeline_run(2, 3, std::chrono::microseconds(10), true);
                     const auto activated = recorder->events_of<obs::PolicyActivatedEvent>();
                     require(activated.size() == 1 && activated[0].name == "strict",
                             "activation event should be forwarded");
                     require(recorder->metrics().size() == 2,
                             "pipeline run should emit latency and findings metrics");
                   }});

  tests.push_back({"observability_no_global_observer_is_silent", [] {
                     const safelayer::testing::ScopedObserver scoped(nullptr);
                     obs::record_error("test", "nobody listens");
                     require(obs::get_global_observer() == nullptr, "observer should stay unset");
                   }});
}
