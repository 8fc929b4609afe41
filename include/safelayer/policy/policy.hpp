#pragma once

#include "safelayer/common/result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace safelayer::policy {

enum class PolicyAction { Block, Warn, Mask, LogOnly, Audit };

enum class PolicySeverity { Low, Medium, High, Critical };

[[nodiscard]] std::string to_string(PolicyAction action);
[[nodiscard]] std::string to_string(PolicySeverity severity);
[[nodiscard]] common::Result<PolicyAction> parse_action(const std::string &value);
[[nodiscard]] common::Result<PolicySeverity> parse_severity(const std::string &value);

/// Open configuration map. Nested documents are flattened to dotted keys.
using ConfigMap = std::map<std::string, std::string>;

struct GuardPolicy {
  std::string guard_type;
  bool enabled = true;
  PolicyAction action = PolicyAction::Block;
  PolicySeverity severity = PolicySeverity::Medium;
  double threshold = 0.8;
  ConfigMap custom_config;

  bool operator==(const GuardPolicy &) const = default;
};

/// Guard slots in pipeline order; slot names are unique.
using GuardSlots = std::vector<std::pair<std::string, GuardPolicy>>;

struct PolicySet {
  std::string name;
  std::string version;
  std::string description;
  GuardSlots guards;
  ConfigMap metadata;
  std::optional<std::string> parent_policy;

  [[nodiscard]] const GuardPolicy *find_guard(const std::string &slot) const;
  /// Replaces an existing slot in place or appends a new one.
  void set_guard(const std::string &slot, GuardPolicy policy);
  [[nodiscard]] std::size_t enabled_guard_count() const;

  bool operator==(const PolicySet &) const = default;
};

struct PolicySummary {
  std::string name;
  std::string version;
  std::string description;
  std::optional<std::string> parent_policy;
  std::size_t guard_count = 0;
  std::size_t enabled_guards = 0;
  ConfigMap metadata;
};

inline constexpr const char *INHERITED_FROM_KEY = "inherited_from";

/// The built-in fallback policy: pii=mask/high/0.9, tone=warn/medium/0.7, tts=block/critical/0.8.
[[nodiscard]] PolicySet default_policy();

/// One block/medium/0.8 slot per guard name; not merged with anything.
[[nodiscard]] PolicySet create_policy_template(const std::string &name,
                                               const std::vector<std::string> &guard_names);

/// Child slots and metadata overlay the parent's; identity fields come from the child and
/// metadata gains `inherited_from = parent.name`.
[[nodiscard]] PolicySet merge_policies(const PolicySet &parent, const PolicySet &child);

/// Non-fatal consistency check. Empty when the policy is compliant.
[[nodiscard]] std::vector<std::string> validate_policy(const PolicySet &policy);

[[nodiscard]] PolicySummary summarize(const PolicySet &policy);

} // namespace safelayer::policy
