#pragma once

#include "safelayer/common/http.hpp"
#include "safelayer/common/result.hpp"
#include "safelayer/guards/guard.hpp"
#include "safelayer/guards/pii.hpp"
#include "safelayer/policy/policy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace safelayer::guards {

struct GuardFactoryOptions {
  bool explain = false;
  PiiDetectorOptions pii;
  std::shared_ptr<common::HttpClient> http_client;
};

/// Builds the concrete guard for one slot, without the policy wrapper.
[[nodiscard]] common::Result<std::shared_ptr<Guard>>
create_guard(const std::string &slot, const policy::GuardPolicy &policy,
             const GuardFactoryOptions &options);

/// Enabled slots in policy order, each wrapped in a PolicyGuard.
[[nodiscard]] common::Result<std::vector<std::shared_ptr<Guard>>>
build_guards(const policy::PolicySet &policy, const GuardFactoryOptions &options = {});

[[nodiscard]] std::vector<std::string> known_guard_types();

} // namespace safelayer::guards
