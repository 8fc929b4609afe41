#pragma once

#include "safelayer/common/result.hpp"
#include "safelayer/policy/policy.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace safelayer::policy {

/// Registry of loaded policy sets plus the single active selection.
///
/// Starts with the built-in default registered under "default" and active. The active policy is a
/// snapshot taken by `set_active`: loading or adding a set with the same name leaves it untouched
/// until `set_active` is called again. All operations lock one mutex, so a store can be shared
/// between the CLI, pipeline builders and transports. Observer callbacks run after the lock is
/// released.
class PolicyStore {
public:
  explicit PolicyStore(std::filesystem::path policy_dir);

  /// Parses `path`, resolves inheritance against already loaded sets and registers the result.
  [[nodiscard]] common::Result<PolicySet> load(const std::filesystem::path &path);
  /// Registers a constructed policy as-is (replacing a set with the same name).
  void add(PolicySet policy);

  /// Merges `child` onto its parent when the parent is loaded. Otherwise returns `child`
  /// unchanged and reports the gap through the observer.
  [[nodiscard]] PolicySet resolve_inheritance(const PolicySet &child) const;

  /// Writes to `<policy_dir>/<name>.yaml`.
  [[nodiscard]] common::Result<std::filesystem::path> save(const PolicySet &policy) const;
  /// Relative paths are resolved against the policy directory.
  [[nodiscard]] common::Result<std::filesystem::path>
  save(const PolicySet &policy, const std::filesystem::path &path) const;

  [[nodiscard]] common::Result<PolicySet> set_active(const std::string &name);
  [[nodiscard]] PolicySet active() const;
  [[nodiscard]] common::Result<PolicySet> get(const std::string &name) const;
  [[nodiscard]] std::vector<std::string> list() const;
  [[nodiscard]] common::Result<PolicySummary> summary(const std::string &name) const;
  /// Slot lookup on the active policy.
  [[nodiscard]] std::optional<GuardPolicy> guard_config(const std::string &slot) const;

  /// Loads and activates the file named by SAFELAYER_POLICY. Absent or empty: nothing happens.
  [[nodiscard]] common::Result<std::optional<PolicySet>> load_from_env();

  [[nodiscard]] const std::filesystem::path &policy_dir() const { return policy_dir_; }

private:
  [[nodiscard]] PolicySet resolve_locked(const PolicySet &child, bool &parent_missing) const;

  std::filesystem::path policy_dir_;
  mutable std::mutex mutex_;
  std::map<std::string, PolicySet> loaded_;
  PolicySet active_;
};

} // namespace safelayer::policy
