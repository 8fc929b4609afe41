#pragma once

#include "safelayer/common/result.hpp"
#include "safelayer/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace safelayer::config {

/// Environment variable naming a policy file to auto-load and activate at process start.
inline constexpr const char *POLICY_ENV = "SAFELAYER_POLICY";

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config();

/// Fatal problems fail the result; non-fatal ones are returned as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace safelayer::config
