#include "safelayer/policy/store.hpp"

#include "safelayer/config/config.hpp"
#include "safelayer/observability/global.hpp"
#include "safelayer/policy/policy_io.hpp"

#include <cstdlib>

namespace safelayer::policy {

PolicyStore::PolicyStore(std::filesystem::path policy_dir) : policy_dir_(std::move(policy_dir)) {
  active_ = default_policy();
  loaded_.emplace(active_.name, active_);
}

common::Result<PolicySet> PolicyStore::load(const std::filesystem::path &path) {
  auto parsed = load_policy_file(path);
  if (!parsed.ok()) {
    observability::record_error("policy", parsed.error());
    return parsed;
  }

  PolicySet policy;
  bool parent_missing = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    policy = resolve_locked(parsed.value(), parent_missing);
    loaded_[policy.name] = policy;
  }
  if (parent_missing) {
    observability::record_inheritance_skipped(policy.name, *policy.parent_policy);
  }
  observability::record_policy_loaded(policy.name, policy.version, path.string());
  return common::Result<PolicySet>::success(std::move(policy));
}

void PolicyStore::add(PolicySet policy) {
  const std::string name = policy.name;
  const std::string version = policy.version;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_[name] = std::move(policy);
  }
  observability::record_policy_loaded(name, version, "memory");
}

PolicySet PolicyStore::resolve_inheritance(const PolicySet &child) const {
  PolicySet resolved;
  bool parent_missing = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    resolved = resolve_locked(child, parent_missing);
  }
  if (parent_missing) {
    observability::record_inheritance_skipped(child.name, *child.parent_policy);
  }
  return resolved;
}

PolicySet PolicyStore::resolve_locked(const PolicySet &child, bool &parent_missing) const {
  parent_missing = false;
  if (!child.parent_policy.has_value() || child.parent_policy->empty()) {
    return child;
  }
  const auto parent = loaded_.find(*child.parent_policy);
  if (parent == loaded_.end()) {
    parent_missing = true;
    return child;
  }
  return merge_policies(parent->second, child);
}

common::Result<std::filesystem::path> PolicyStore::save(const PolicySet &policy) const {
  return save(policy, policy.name + ".yaml");
}

common::Result<std::filesystem::path> PolicyStore::save(const PolicySet &policy,
                                                        const std::filesystem::path &path) const {
  const std::filesystem::path target = path.is_absolute() ? path : policy_dir_ / path;
  auto status = save_policy_file(policy, target);
  if (!status.ok()) {
    return common::Result<std::filesystem::path>::failure_from(status);
  }
  return common::Result<std::filesystem::path>::success(target);
}

common::Result<PolicySet> PolicyStore::set_active(const std::string &name) {
  PolicySet selected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = loaded_.find(name);
    if (it == loaded_.end()) {
      return common::Result<PolicySet>::failure("Policy not loaded: " + name,
                                                common::ErrorKind::NotFound);
    }
    active_ = it->second;
    selected = active_;
  }
  observability::record_policy_activated(name);
  return common::Result<PolicySet>::success(std::move(selected));
}

PolicySet PolicyStore::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

common::Result<PolicySet> PolicyStore::get(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = loaded_.find(name);
  if (it == loaded_.end()) {
    return common::Result<PolicySet>::failure("Policy not found: " + name,
                                              common::ErrorKind::NotFound);
  }
  return common::Result<PolicySet>::success(it->second);
}

std::vector<std::string> PolicyStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loaded_.size());
  for (const auto &entry : loaded_) {
    names.push_back(entry.first);
  }
  return names;
}

common::Result<PolicySummary> PolicyStore::summary(const std::string &name) const {
  auto policy = get(name);
  if (!policy.ok()) {
    return common::Result<PolicySummary>::failure_from(policy);
  }
  return common::Result<PolicySummary>::success(summarize(policy.value()));
}

std::optional<GuardPolicy> PolicyStore::guard_config(const std::string &slot) const {
  const PolicySet current = active();
  if (const GuardPolicy *guard = current.find_guard(slot); guard != nullptr) {
    return *guard;
  }
  return std::nullopt;
}

common::Result<std::optional<PolicySet>> PolicyStore::load_from_env() {
  const char *raw = std::getenv(config::POLICY_ENV);
  if (raw == nullptr || *raw == '\0') {
    return common::Result<std::optional<PolicySet>>::success(std::nullopt);
  }

  auto loaded = load(config::expand_config_path(raw));
  if (!loaded.ok()) {
    return common::Result<std::optional<PolicySet>>::failure_from(loaded);
  }
  auto activated = set_active(loaded.value().name);
  if (!activated.ok()) {
    return common::Result<std::optional<PolicySet>>::failure_from(activated);
  }
  return common::Result<std::optional<PolicySet>>::success(std::move(activated.value()));
}

} // namespace safelayer::policy
