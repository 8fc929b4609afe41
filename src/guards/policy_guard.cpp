#include "safelayer/guards/policy_guard.hpp"

#include <algorithm>

namespace safelayer::guards {

PolicyGuard::PolicyGuard(std::string slot, policy::GuardPolicy policy, std::shared_ptr<Guard> inner)
    : Guard(inner->explain_enabled()), slot_(std::move(slot)), policy_(std::move(policy)),
      inner_(std::move(inner)), name_(slot_ + ":" + std::string(inner_->name())) {}

bool PolicyGuard::applies_threshold() const {
  return policy_.action == policy::PolicyAction::Mask ||
         policy_.action == policy::PolicyAction::Block;
}

common::Result<std::vector<Finding>> PolicyGuard::check(const std::string &text) const {
  auto findings = inner_->check(text);
  if (!findings.ok() || !applies_threshold()) {
    return findings;
  }

  std::vector<Finding> kept = std::move(findings.value());
  kept.erase(std::remove_if(kept.begin(), kept.end(),
                            [&](const Finding &f) { return f.score < policy_.threshold; }),
             kept.end());
  return common::Result<std::vector<Finding>>::success(std::move(kept));
}

common::Result<std::string> PolicyGuard::mask(const std::string &text) const {
  switch (policy_.action) {
  case policy::PolicyAction::Mask:
    return inner_->mask(text);
  case policy::PolicyAction::Block: {
    auto findings = check(text);
    if (!findings.ok()) {
      return common::Result<std::string>::failure_from(findings);
    }
    if (!findings.value().empty()) {
      return common::Result<std::string>::failure(
          "Blocked by policy slot '" + slot_ + "': " + std::to_string(findings.value().size()) +
              " finding(s) from " + std::string(inner_->name()) + " (severity " +
              policy::to_string(policy_.severity) + ")",
          common::ErrorKind::Blocked);
    }
    return common::Result<std::string>::success(text);
  }
  case policy::PolicyAction::Warn:
  case policy::PolicyAction::LogOnly:
  case policy::PolicyAction::Audit:
    break;
  }
  return common::Result<std::string>::success(text);
}

void PolicyGuard::explain(const Finding &finding) const { inner_->explain(finding); }

} // namespace safelayer::guards
