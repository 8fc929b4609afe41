#include "safelayer/policy/policy.hpp"

#include "safelayer/common/fs.hpp"

#include <algorithm>

namespace safelayer::policy {

std::string to_string(const PolicyAction action) {
  switch (action) {
  case PolicyAction::Block:
    return "block";
  case PolicyAction::Warn:
    return "warn";
  case PolicyAction::Mask:
    return "mask";
  case PolicyAction::LogOnly:
    return "log_only";
  case PolicyAction::Audit:
    return "audit";
  }
  return "block";
}

std::string to_string(const PolicySeverity severity) {
  switch (severity) {
  case PolicySeverity::Low:
    return "low";
  case PolicySeverity::Medium:
    return "medium";
  case PolicySeverity::High:
    return "high";
  case PolicySeverity::Critical:
    return "critical";
  }
  return "medium";
}

common::Result<PolicyAction> parse_action(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "block") {
    return common::Result<PolicyAction>::success(PolicyAction::Block);
  }
  if (normalized == "warn") {
    return common::Result<PolicyAction>::success(PolicyAction::Warn);
  }
  if (normalized == "mask") {
    return common::Result<PolicyAction>::success(PolicyAction::Mask);
  }
  if (normalized == "log_only") {
    return common::Result<PolicyAction>::success(PolicyAction::LogOnly);
  }
  if (normalized == "audit") {
    return common::Result<PolicyAction>::success(PolicyAction::Audit);
  }
  return common::Result<PolicyAction>::failure("Invalid policy action: " + value,
                                               common::ErrorKind::InvalidValue);
}

common::Result<PolicySeverity> parse_severity(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "low") {
    return common::Result<PolicySeverity>::success(PolicySeverity::Low);
  }
  if (normalized == "medium") {
    return common::Result<PolicySeverity>::success(PolicySeverity::Medium);
  }
  if (normalized == "high") {
    return common::Result<PolicySeverity>::success(PolicySeverity::High);
  }
  if (normalized == "critical") {
    return common::Result<PolicySeverity>::success(PolicySeverity::Critical);
  }
  return common::Result<PolicySeverity>::failure("Invalid policy severity: " + value,
                                                 common::ErrorKind::InvalidValue);
}

const GuardPolicy *PolicySet::find_guard(const std::string &slot) const {
  const auto it = std::find_if(guards.begin(), guards.end(),
                               [&](const auto &entry) { return entry.first == slot; });
  return it == guards.end() ? nullptr : &it->second;
}

void PolicySet::set_guard(const std::string &slot, GuardPolicy policy) {
  const auto it = std::find_if(guards.begin(), guards.end(),
                               [&](const auto &entry) { return entry.first == slot; });
  if (it != guards.end()) {
    it->second = std::move(policy);
    return;
  }
  guards.emplace_back(slot, std::move(policy));
}

std::size_t PolicySet::enabled_guard_count() const {
  return static_cast<std::size_t>(std::count_if(
      guards.begin(), guards.end(), [](const auto &entry) { return entry.second.enabled; }));
}

PolicySet default_policy() {
  PolicySet policy;
  policy.name = "default";
  policy.version = "1.0.0";
  policy.description = "Default SafeLayer policy set";
  policy.set_guard("pii", GuardPolicy{.guard_type = "pii",
                                      .enabled = true,
                                      .action = PolicyAction::Mask,
                                      .severity = PolicySeverity::High,
                                      .threshold = 0.9});
  policy.set_guard("tone", GuardPolicy{.guard_type = "tone",
                                       .enabled = true,
                                       .action = PolicyAction::Warn,
                                       .severity = PolicySeverity::Medium,
                                       .threshold = 0.7});
  policy.set_guard("tts", GuardPolicy{.guard_type = "tts",
                                      .enabled = true,
                                      .action = PolicyAction::Block,
                                      .severity = PolicySeverity::Critical,
                                      .threshold = 0.8});
  policy.metadata = {{"created_by", "SafeLayer"}, {"auto_generated", "true"}};
  return policy;
}

PolicySet create_policy_template(const std::string &name,
                                 const std::vector<std::string> &guard_names) {
  PolicySet policy;
  policy.name = name;
  policy.version = "1.0.0";
  policy.description = "Template policy for " + name;
  for (const auto &guard_name : guard_names) {
    policy.set_guard(guard_name, GuardPolicy{.guard_type = guard_name});
  }
  policy.metadata = {{"template", "true"}, {"created_by", "SafeLayer PolicyManager"}};
  return policy;
}

PolicySet merge_policies(const PolicySet &parent, const PolicySet &child) {
  PolicySet merged;
  merged.name = child.name;
  merged.version = child.version;
  merged.description = child.description;
  merged.parent_policy = child.parent_policy;

  merged.guards = parent.guards;
  for (const auto &[slot, guard] : child.guards) {
    merged.set_guard(slot, guard);
  }

  merged.metadata = parent.metadata;
  for (const auto &[key, value] : child.metadata) {
    merged.metadata[key] = value;
  }
  merged.metadata[INHERITED_FROM_KEY] = parent.name;
  return merged;
}

std::vector<std::string> validate_policy(const PolicySet &policy) {
  std::vector<std::string> issues;

  if (policy.name.empty()) {
    issues.emplace_back("Policy name is required");
  }
  if (policy.version.empty()) {
    issues.emplace_back("Policy version is required");
  }

  for (const auto &[slot, guard] : policy.guards) {
    if (guard.guard_type.empty()) {
      issues.push_back("Guard '" + slot + "' missing guard_type");
    }
    // Negated comparison so NaN is reported too.
    if (!(guard.threshold >= 0.0 && guard.threshold <= 1.0)) {
      issues.push_back("Guard '" + slot + "' threshold must be between 0 and 1");
    }
  }

  return issues;
}

PolicySummary summarize(const PolicySet &policy) {
  return PolicySummary{.name = policy.name,
                       .version = policy.version,
                       .description = policy.description,
                       .parent_policy = policy.parent_policy,
                       .guard_count = policy.guards.size(),
                       .enabled_guards = policy.enabled_guard_count(),
                       .metadata = policy.metadata};
}

} // namespace safelayer::policy
