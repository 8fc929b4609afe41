#include "safelayer/guards/manager.hpp"

#include "safelayer/observability/global.hpp"

#include <chrono>
#include <exception>

namespace safelayer::guards {

namespace {

common::Result<std::vector<Finding>> invoke_check(const Guard &guard, const std::string &text) {
  try {
    return guard.check(text);
  } catch (const std::exception &e) {
    return common::Result<std::vector<Finding>>::failure(e.what(),
                                                         common::ErrorKind::GuardFailure);
  }
}

common::Result<std::string> invoke_mask(const Guard &guard, const std::string &text) {
  try {
    return guard.mask(text);
  } catch (const std::exception &e) {
    return common::Result<std::string>::failure(e.what(), common::ErrorKind::GuardFailure);
  }
}

std::chrono::microseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

std::size_t RunReport::finding_count() const {
  std::size_t total = 0;
  for (const auto &guard : guards) {
    total += guard.findings.size();
  }
  return total;
}

GuardManager::GuardManager(std::vector<std::shared_ptr<Guard>> guards,
                           std::shared_ptr<audit::IAuditSink> sink, GuardManagerOptions options)
    : guards_(std::move(guards)), sink_(std::move(sink)), options_(options) {
  if (sink_ == nullptr) {
    sink_ = std::make_shared<audit::NoopAuditSink>();
  }
}

common::Result<std::string> GuardManager::run(const std::string &text) const {
  auto report = run_with_report(text);
  if (!report.ok()) {
    return common::Result<std::string>::failure_from(report);
  }
  return common::Result<std::string>::success(std::move(report.value().output));
}

common::Status GuardManager::isolate(const Guard &guard, const std::string &snapshot,
                                     const std::string &message) const {
  const Finding failure{.entity = "guard_error",
                        .start = 0,
                        .end = 0,
                        .explanation = message,
                        .detector = std::string(guard.name())};
  return sink_->append(audit::make_record(failure.detector, failure, snapshot, false));
}

common::Result<RunReport> GuardManager::run_with_report(const std::string &text) const {
  RunReport report;
  if (text.empty()) {
    return common::Result<RunReport>::success(std::move(report));
  }

  const auto pipeline_start = std::chrono::steady_clock::now();
  std::string current = text;

  const auto fail = [&](const std::string &message, const common::ErrorKind kind) {
    observability::record_pipeline_run(guards_.size(), report.finding_count(),
                                       elapsed_since(pipeline_start), false);
    return common::Result<RunReport>::failure(message, kind);
  };

  for (const auto &guard : guards_) {
    const auto guard_start = std::chrono::steady_clock::now();
    const std::string guard_name(guard->name());
    GuardReport entry{.guard = guard_name};

    auto findings = invoke_check(*guard, current);
    common::Result<std::string> masked =
        common::Result<std::string>::failure(findings.error(), findings.kind());

    if (findings.ok()) {
      for (const auto &finding : findings.value()) {
        auto appended =
            sink_->append(audit::make_record(guard_name, finding, current, options_.include_excerpt));
        if (!appended.ok()) {
          observability::record_error("audit", appended.error());
          return fail("Audit append failed: " + appended.error(), appended.kind());
        }
        guard->explain(finding);
      }
      entry.findings = std::move(findings.value());
      masked = invoke_mask(*guard, current);
    }

    if (!masked.ok()) {
      const std::string message = guard_name + " failed: " + masked.error();
      const bool isolated =
          options_.isolate_failures && masked.kind() != common::ErrorKind::Blocked;
      observability::record_guard_failure(guard_name, masked.error(), isolated);
      observability::record_guard_run(guard_name, entry.findings.size(),
                                      elapsed_since(guard_start), false);
      if (!isolated) {
        const common::ErrorKind kind = masked.kind() == common::ErrorKind::Generic
                                           ? common::ErrorKind::GuardFailure
                                           : masked.kind();
        return fail(message, kind);
      }
      auto recorded = isolate(*guard, current, message);
      if (!recorded.ok()) {
        observability::record_error("audit", recorded.error());
        return fail("Audit append failed: " + recorded.error(), recorded.kind());
      }
      entry.skipped = true;
      entry.error = masked.error();
      report.guards.push_back(std::move(entry));
      continue;
    }

    current = std::move(masked.value());
    observability::record_guard_run(guard_name, entry.findings.size(), elapsed_since(guard_start),
                                    true);
    report.guards.push_back(std::move(entry));
  }

  report.output = std::move(current);
  observability::record_pipeline_run(guards_.size(), report.finding_count(),
                                     elapsed_since(pipeline_start), true);
  return common::Result<RunReport>::success(std::move(report));
}

} // namespace safelayer::guards
