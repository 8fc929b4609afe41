#include "safelayer/config/config.hpp"

#include "safelayer/common/fs.hpp"
#include "safelayer/common/toml.hpp"

#include <cstdlib>
#include <filesystem>

namespace safelayer::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".safelayer";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SAFELAYER_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

bool is_known_observer(const std::string &name) {
  return name == "log" || name == "none" || name == "noop";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure_from(parsed);
  }
  const auto &doc = parsed.value();

  Config config;
  config.policy.dir = doc.get_string("policy.dir", config.policy.dir);
  config.policy.file = doc.get_string("policy.file", config.policy.file);

  config.audit.enabled = doc.get_bool("audit.enabled", config.audit.enabled);
  config.audit.path = doc.get_string("audit.path", config.audit.path);
  config.audit.include_excerpt =
      doc.get_bool("audit.include_excerpt", config.audit.include_excerpt);

  config.guards.explain = doc.get_bool("guards.explain", config.guards.explain);
  config.guards.isolate_failures =
      doc.get_bool("guards.isolate_failures", config.guards.isolate_failures);

  config.pii.backend = common::to_lower(doc.get_string("pii.backend", config.pii.backend));
  config.pii.presidio_url = doc.get_string("pii.presidio_url", config.pii.presidio_url);
  config.pii.timeout_ms = doc.get_u64("pii.timeout_ms", config.pii.timeout_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const auto policy = env_value(POLICY_ENV); policy.has_value()) {
    config.policy.file = *policy;
  }
  if (const auto dir = env_value("SAFELAYER_POLICY_DIR"); dir.has_value()) {
    config.policy.dir = *dir;
  }
  if (const auto audit = env_value("SAFELAYER_AUDIT_LOG"); audit.has_value()) {
    config.audit.path = *audit;
  }
  if (const auto backend = env_value("SAFELAYER_PII_BACKEND"); backend.has_value()) {
    config.pii.backend = common::to_lower(common::trim(*backend));
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure_from(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure_from(content);
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(), parsed.kind());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string backend = common::to_lower(common::trim(config.pii.backend));
  if (backend != "pattern" && backend != "presidio") {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid pii.backend: " + config.pii.backend, common::ErrorKind::InvalidValue);
  }
  if (backend == "presidio" && common::trim(config.pii.presidio_url).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "pii.presidio_url is required when pii.backend = presidio",
        common::ErrorKind::InvalidValue);
  }
  if (config.pii.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "pii.timeout_ms must be greater than 0", common::ErrorKind::InvalidValue);
  }

  if (config.audit.enabled && common::trim(config.audit.path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "audit.path is required when audit.enabled = true", common::ErrorKind::InvalidValue);
  }
  if (config.audit.include_excerpt) {
    warnings.push_back("audit.include_excerpt stores matched sensitive text in the audit log");
  }

  for (const auto &part : common::split_list(common::to_lower(config.observability.backend))) {
    if (!is_known_observer(part)) {
      return common::Result<std::vector<std::string>>::failure(
          "Invalid observability.backend: " + config.observability.backend,
          common::ErrorKind::InvalidValue);
    }
  }

  if (!config.policy.file.empty()) {
    const std::filesystem::path policy_file(expand_config_path(config.policy.file));
    if (!std::filesystem::exists(policy_file)) {
      warnings.push_back("policy.file does not exist: " + policy_file.string());
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace safelayer::config
