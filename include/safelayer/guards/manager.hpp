#pragma once

#include "safelayer/audit/audit.hpp"
#include "safelayer/common/result.hpp"
#include "safelayer/guards/guard.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace safelayer::guards {

struct GuardManagerOptions {
  /// Skip a failing guard instead of aborting the run. Blocked runs are never isolated.
  bool isolate_failures = false;
  bool include_excerpt = false;
};

struct GuardReport {
  std::string guard;
  std::vector<Finding> findings;
  bool skipped = false;
  std::string error;
};

struct RunReport {
  std::string output;
  std::vector<GuardReport> guards;

  [[nodiscard]] std::size_t finding_count() const;
};

/// Runs an ordered guard chain: for each guard, `check` the current text, audit and explain
/// every finding in order, then `mask` the current text once and hand the result to the next
/// guard.
///
/// Later guards see earlier guards' output, so chain order changes the result. Audit offsets
/// refer to the text each guard checked, not to the final output.
class GuardManager {
public:
  explicit GuardManager(std::vector<std::shared_ptr<Guard>> guards,
                        std::shared_ptr<audit::IAuditSink> sink = nullptr,
                        GuardManagerOptions options = {});

  [[nodiscard]] common::Result<std::string> run(const std::string &text) const;
  [[nodiscard]] common::Result<RunReport> run_with_report(const std::string &text) const;

  [[nodiscard]] const std::vector<std::shared_ptr<Guard>> &guards() const { return guards_; }
  [[nodiscard]] const GuardManagerOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Status isolate(const Guard &guard, const std::string &snapshot,
                                       const std::string &message) const;

  std::vector<std::shared_ptr<Guard>> guards_;
  std::shared_ptr<audit::IAuditSink> sink_;
  GuardManagerOptions options_;
};

/// Wraps a text-producing callable so its return value goes through `manager` before it reaches
/// the caller.
template <typename Fn> auto guarded(std::shared_ptr<const GuardManager> manager, Fn fn) {
  return [manager = std::move(manager),
          fn = std::move(fn)](auto &&...args) -> common::Result<std::string> {
    return manager->run(std::string(fn(std::forward<decltype(args)>(args)...)));
  };
}

} // namespace safelayer::guards
