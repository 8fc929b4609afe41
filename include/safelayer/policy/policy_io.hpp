#pragma once

#include "safelayer/common/result.hpp"
#include "safelayer/policy/policy.hpp"

#include <filesystem>
#include <string>

namespace safelayer::policy {

enum class PolicyFormat { Yaml, Json };

/// Maps `.yaml`, `.yml` and `.json` (any case) to a format; anything else is UnsupportedFormat.
[[nodiscard]] common::Result<PolicyFormat> policy_format_for(const std::filesystem::path &path);

/// Parses a policy document. YAML and JSON share the parser; `default_name` fills an absent
/// `name` key.
[[nodiscard]] common::Result<PolicySet> parse_policy(const std::string &content,
                                                     const std::string &default_name);

[[nodiscard]] common::Result<PolicySet> load_policy_file(const std::filesystem::path &path);

[[nodiscard]] common::Result<std::string> serialize_policy_yaml(const PolicySet &policy);
[[nodiscard]] std::string serialize_policy_json(const PolicySet &policy);

/// Writes YAML or JSON depending on the extension. The parent directory is created on demand.
[[nodiscard]] common::Status save_policy_file(const PolicySet &policy,
                                              const std::filesystem::path &path);

} // namespace safelayer::policy
