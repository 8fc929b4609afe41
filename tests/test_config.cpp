#include "test_framework.hpp"

#include "safelayer/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::filesystem::path path) {
    safelayer::config::set_config_path_override(std::move(path));
  }
  ~ConfigOverrideGuard() { safelayer::config::clear_config_path_override(); }
};

} // namespace

void register_config_tests(std::vector<safelayer::tests::TestCase> &tests) {
  using safelayer::tests::require;
  using safelayer::testing::EnvGuard;
  using safelayer::testing::TempWorkspace;
  namespace cfg = safelayer::config;

  tests.push_back({"config_path_defaults_under_home", [] {
                     const TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_path("SAFELAYER_CONFIG_PATH", std::nullopt);
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home.path() / ".safelayer" / "config.toml",
                             "unexpected config path: " + path.value().string());
                   }});

  tests.push_back({"config_missing_file_returns_defaults", [] {
                     const TempWorkspace ws;
                     const ConfigOverrideGuard override_path(ws.path() / "absent.toml");
                     const EnvGuard dir("SAFELAYER_POLICY_DIR", std::nullopt);
                     const EnvGuard audit("SAFELAYER_AUDIT_LOG", std::nullopt);
                     const EnvGuard backend("SAFELAYER_PII_BACKEND", std::nullopt);
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.audit.enabled, "audit should default to enabled");
                     require(!config.audit.include_excerpt, "excerpts should default off");
                     require(!config.guards.isolate_failures, "isolation should default off");
                     require(config.pii.backend == "pattern", "pattern backend by default");
                     require(config.policy.dir == "~/.safelayer/policies",
                             "unexpected default policy dir");
                   }});

  tests.push_back({"config_parses_all_sections", [] {
                     const auto parsed = cfg::parse_config("[policy]\n"
                                                           "dir = \"/etc/safelayer\"\n"
                                                           "file = \"/etc/safelayer/strict.yaml\"\n"
                                                           "[audit]\n"
                                                           "enabled = false\n"
                                                           "include_excerpt = true\n"
                                                           "[guards]\n"
                                                           "explain = true\n"
                                                           "isolate_failures = true\n"
                                                           "[pii]\n"
                                                           "backend = \"Presidio\"\n"
                                                           "timeout_ms = 900\n"
                                                           "[observability]\n"
                                                           "backend = \"none\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.policy.dir == "/etc/safelayer", "policy.dir");
                     require(config.policy.file == "/etc/safelayer/strict.yaml", "policy.file");
                     require(!config.audit.enabled, "audit.enabled");
                     require(config.audit.include_excerpt, "audit.include_excerpt");
                     require(config.guards.explain, "guards.explain");
                     require(config.guards.isolate_failures, "guards.isolate_failures");
                     require(config.pii.backend == "presidio", "backend should be lowercased");
                     require(config.pii.timeout_ms == 900, "pii.timeout_ms");
                     require(config.observability.backend == "none", "observability.backend");
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     const TempWorkspace ws;
                     ws.create_file("config.toml", "[audit]\npath = \"/from/file.log\"\n");
                     const ConfigOverrideGuard override_path(ws.path() / "config.toml");
                     const EnvGuard audit("SAFELAYER_AUDIT_LOG", "/from/env.log");
                     const EnvGuard dir("SAFELAYER_POLICY_DIR", "/env/policies");
                     const EnvGuard backend("SAFELAYER_PII_BACKEND", " PRESIDIO ");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().audit.path == "/from/env.log", "audit path override");
                     require(loaded.value().policy.dir == "/env/policies", "policy dir override");
                     require(loaded.value().pii.backend == "presidio", "backend override");
                   }});

  tests.push_back({"config_malformed_file_is_parse_error", [] {
                     const TempWorkspace ws;
                     ws.create_file("config.toml", "[audit]\nthis line has no equals\n");
                     const ConfigOverrideGuard override_path(ws.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.kind() == safelayer::common::ErrorKind::Parse,
                             "expected parse error kind");
                   }});

  tests.push_back({"config_validate_rejects_unknown_backend", [] {
                     cfg::Config config;
                     config.pii.backend = "spacy";
                     const auto validated = cfg::validate_config(config);
                     require(!validated.ok(), "unknown backend should fail");
                     require(validated.kind() == safelayer::common::ErrorKind::InvalidValue,
                             "expected invalid value");
                   }});

  tests.push_back({"config_validate_warns_about_excerpts", [] {
                     cfg::Config config;
                     config.audit.include_excerpt = true;
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().size() == 1, "expected one warning");
                   }});

  tests.push_back({"config_validate_rejects_unknown_observer", [] {
                     cfg::Config config;
                     config.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown observer should fail");
                   }});
}
