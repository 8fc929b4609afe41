#pragma once

#include "safelayer/guards/guard.hpp"
#include "safelayer/policy/policy.hpp"

#include <memory>
#include <string>

namespace safelayer::guards {

/// Applies one policy slot's action and threshold to a concrete guard.
///
/// `mask` and `block` drop findings scored below the threshold. `mask` delegates masking to the
/// wrapped guard; `warn`, `log_only` and `audit` leave the text as it is; `block` fails the
/// mask call with ErrorKind::Blocked when any finding reaches the threshold.
class PolicyGuard final : public Guard {
public:
  PolicyGuard(std::string slot, policy::GuardPolicy policy, std::shared_ptr<Guard> inner);

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] common::Result<std::vector<Finding>> check(const std::string &text) const override;
  [[nodiscard]] common::Result<std::string> mask(const std::string &text) const override;
  void explain(const Finding &finding) const override;

  [[nodiscard]] const std::string &slot() const { return slot_; }
  [[nodiscard]] const policy::GuardPolicy &policy() const { return policy_; }
  [[nodiscard]] const Guard &inner() const { return *inner_; }

private:
  [[nodiscard]] bool applies_threshold() const;

  std::string slot_;
  policy::GuardPolicy policy_;
  std::shared_ptr<Guard> inner_;
  std::string name_;
};

} // namespace safelayer::guards
