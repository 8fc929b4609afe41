#include "test_framework.hpp"

#include "safelayer/policy/policy_io.hpp"
#include "safelayer/policy/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

namespace {

const char *BASE_POLICY = "name: base\n"
                          "version: 1.0.0\n"
                          "metadata:\n"
                          "  owner: platform\n"
                          "guards:\n"
                          "  pii:\n"
                          "    action: mask\n"
                          "    severity: high\n"
                          "  tts:\n"
                          "    action: block\n";

const char *CHILD_POLICY = "name: child\n"
                           "version: 0.3.0\n"
                           "parent_policy: base\n"
                           "guards:\n"
                           "  pii:\n"
                           "    action: warn\n"
                           "  tone:\n"
                           "    action: mask\n"
                           "    custom_config:\n"
                           "      mask_char: '#'\n";

/// Reads back from the store while an event is being delivered.
class StoreQueryingObserver final : public safelayer::observability::IObserver {
public:
  explicit StoreQueryingObserver(const safelayer::policy::PolicyStore &store) : store_(store) {}

  void record_event(const safelayer::observability::ObserverEvent &) override {
    active_seen.push_back(store_.active().name);
    listed.push_back(store_.list().size());
  }
  void record_metric(const safelayer::observability::ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "store-querying"; }

  std::vector<std::string> active_seen;
  std::vector<std::size_t> listed;

private:
  const safelayer::policy::PolicyStore &store_;
};

} // namespace

void register_policy_store_tests(std::vector<safelayer::tests::TestCase> &tests) {
  using safelayer::tests::require;
  using safelayer::testing::EnvGuard;
  using safelayer::testing::TempWorkspace;
  namespace policy = safelayer::policy;
  using safelayer::common::ErrorKind;

  tests.push_back({"store_starts_with_default_active", [] {
                     const TempWorkspace ws;
                     const policy::PolicyStore store(ws.path());
                     require(store.active() == policy::default_policy(), "default should be active");
                     require(store.list() == std::vector<std::string>{"default"},
                             "default should be registered");
                     const auto pii = store.guard_config("pii");
                     require(pii.has_value() && pii->action == policy::PolicyAction::Mask,
                             "guard_config reads the active policy");
                     require(!store.guard_config("missing").has_value(), "unknown slot");
                   }});

  tests.push_back({"store_load_registers_without_activating", [] {
                     const TempWorkspace ws;
                     ws.create_file("base.yaml", BASE_POLICY);
                     policy::PolicyStore store(ws.path());
                     const auto loaded = store.load(ws.path() / "base.yaml");
                     require(loaded.ok(), loaded.error());
                     require(store.get("base").ok(), "loaded policy should be reachable");
                     require(store.active().name == "default", "load must not activate");

                     const auto activated = store.set_active("base");
                     require(activated.ok(), activated.error());
                     require(store.active().name == "base", "activation switches the policy");
                   }});

  tests.push_back({"store_set_active_unknown_fails", [] {
                     const TempWorkspace ws;
                     policy::PolicyStore store(ws.path());
                     const auto result = store.set_active("ghost");
                     require(!result.ok(), "unknown name should fail");
                     require(result.kind() == ErrorKind::NotFound, "expected not found");
                     require(store.active().name == "default", "active policy unchanged");
                   }});

  tests.push_back({"store_resolves_inheritance_from_loaded_parent", [] {
                     const TempWorkspace ws;
                     ws.create_file("base.yaml", BASE_POLICY);
                     ws.create_file("child.yaml", CHILD_POLICY);
                     policy::PolicyStore store(ws.path());
                     require(store.load(ws.path() / "base.yaml").ok(), "base load");
                     const auto child = store.load(ws.path() / "child.yaml");
                     require(child.ok(), child.error());
                     const auto &merged = child.value();
                     require(merged.name == "child" && merged.version == "0.3.0", "child identity");
                     require(merged.find_guard("pii")->action == policy::PolicyAction::Warn,
                             "child slot wins");
                     require(merged.find_guard("tts") != nullptr, "parent slot inherited");
                     require(merged.find_guard("tone")->custom_config.at("mask_char") == "#",
                             "child-only slot kept");
                     require(merged.metadata.at("inherited_from") == "base", "marker added");
                     require(merged.metadata.at("owner") == "platform", "parent metadata kept");
                   }});

  tests.push_back({"store_skips_inheritance_when_parent_missing", [] {
                     auto recorder = std::make_shared<safelayer::testing::RecordingObserver>();
                     const safelayer::testing::ScopedObserver scoped(recorder);
                     const TempWorkspace ws;
                     ws.create_file("child.yaml", CHILD_POLICY);
                     policy::PolicyStore store(ws.path());
                     const auto child = store.load(ws.path() / "child.yaml");
                     require(child.ok(), child.error());
                     require(child.value().guards.size() == 2, "child stored as-is");
                     require(child.value().metadata.count("inherited_from") == 0,
                             "no marker without merge");

                     const auto skipped =
                         recorder->events_of<safelayer::observability::InheritanceSkippedEvent>();
                     require(skipped.size() == 1 && skipped[0].policy == "child" &&
                                 skipped[0].parent == "base",
                             "inheritance gap must be signalled");
                   }});

  tests.push_back({"store_added_parent_is_used_as_given", [] {
                     const TempWorkspace ws;
                     policy::PolicyStore store(ws.path());
                     policy::PolicySet grandparent = policy::create_policy_template("gp", {"tts"});
                     policy::PolicySet parent = policy::create_policy_template("parent", {"tone"});
                     parent.parent_policy = "gp";
                     store.add(grandparent);
                     store.add(parent);
                     policy::PolicySet child = policy::create_policy_template("child", {"pii"});
                     child.parent_policy = "parent";
                     const auto merged = store.resolve_inheritance(child);
                     require(merged.find_guard("tone") != nullptr, "direct parent merged");
                     require(merged.find_guard("tts") == nullptr,
                             "grandparent slots are not chased");
                   }});

  tests.push_back({"store_loaded_parent_carries_grandparent_slots", [] {
                     const TempWorkspace ws;
                     ws.create_file("base.yaml", BASE_POLICY);
                     ws.create_file("child.yaml", CHILD_POLICY);
                     ws.create_file("leaf.yaml", "name: leaf\n"
                                                 "parent_policy: child\n"
                                                 "guards:\n"
                                                 "  pii:\n"
                                                 "    action: audit\n");
                     policy::PolicyStore store(ws.path());
                     require(store.load(ws.path() / "base.yaml").ok(), "base load");
                     require(store.load(ws.path() / "child.yaml").ok(), "child load");
                     const auto leaf = store.load(ws.path() / "leaf.yaml");
                     require(leaf.ok(), leaf.error());
                     require(leaf.value().find_guard("pii")->action == policy::PolicyAction::Audit,
                             "leaf slot wins");
                     require(leaf.value().find_guard("tone") != nullptr, "parent slot merged");
                     require(leaf.value().find_guard("tts") != nullptr,
                             "slots the parent inherited at load time come along");
                     require(leaf.value().metadata.at("inherited_from") == "child",
                             "marker names the direct parent");
                   }});

  tests.push_back({"store_reload_keeps_active_snapshot", [] {
                     const TempWorkspace ws;
                     ws.create_file("x1.yaml", "name: x\nversion: 1.0.0\nguards:\n  pii: {}\n");
                     ws.create_file("x2.yaml", "name: x\nversion: 2.0.0\nguards:\n  tone: {}\n");
                     policy::PolicyStore store(ws.path());
                     require(store.load(ws.path() / "x1.yaml").ok(), "first load");
                     require(store.set_active("x").ok(), "activate x");

                     require(store.load(ws.path() / "x2.yaml").ok(), "second load");
                     require(store.active().version == "1.0.0",
                             "reloading the active name must not switch the active policy");
                     require(store.guard_config("pii").has_value(), "slots come from the snapshot");
                     require(store.get("x").value().version == "2.0.0", "registry holds the reload");

                     require(store.set_active("x").ok(), "explicit reactivation");
                     require(store.active().version == "2.0.0", "set_active picks up the reload");
                   }});

  tests.push_back({"store_loading_default_name_keeps_builtin_active", [] {
                     const TempWorkspace ws;
                     ws.create_file("default.yaml",
                                    "name: default\nversion: 9.9.9\nguards:\n  pii: {}\n");
                     policy::PolicyStore store(ws.path());
                     require(store.load(ws.path() / "default.yaml").ok(), "load");
                     store.add(policy::create_policy_template("default", {"tone"}));
                     require(store.active() == policy::default_policy(),
                             "built-in default stays active until set_active");
                   }});

  tests.push_back({"store_observer_may_query_store", [] {
                     const TempWorkspace ws;
                     ws.create_file("child.yaml", CHILD_POLICY);
                     policy::PolicyStore store(ws.path());
                     auto observer = std::make_shared<StoreQueryingObserver>(store);
                     const safelayer::testing::ScopedObserver scoped(observer);

                     require(store.load(ws.path() / "child.yaml").ok(), "load with missing parent");
                     policy::PolicySet orphan = policy::create_policy_template("orphan", {"pii"});
                     orphan.parent_policy = "nowhere";
                     (void)store.resolve_inheritance(orphan);
                     require(store.set_active("child").ok(), "activate");

                     require(observer->active_seen.size() == 4,
                             "skipped, loaded, skipped and activated events delivered");
                     require(observer->active_seen.back() == "child",
                             "activation event sees the new active policy");
                     require(observer->listed.front() == 2, "child registered before events");
                   }});

  tests.push_back({"store_save_defaults_to_policy_dir", [] {
                     const TempWorkspace ws;
                     const policy::PolicyStore store(ws.path() / "policies");
                     const auto tmpl = policy::create_policy_template("kiosk", {"pii"});
                     const auto saved = store.save(tmpl);
                     require(saved.ok(), saved.error());
                     require(saved.value() == ws.path() / "policies" / "kiosk.yaml",
                             "unexpected path: " + saved.value().string());
                     const auto reloaded = policy::load_policy_file(saved.value());
                     require(reloaded.ok() && reloaded.value() == tmpl, "saved file reloads");

                     const auto as_json = store.save(tmpl, "exports/kiosk.json");
                     require(as_json.ok(), as_json.error());
                     require(as_json.value() == ws.path() / "policies" / "exports" / "kiosk.json",
                             "relative paths resolve under the policy dir");
                   }});

  tests.push_back({"store_summary_of_loaded_policy", [] {
                     const TempWorkspace ws;
                     const policy::PolicyStore store(ws.path());
                     const auto summary = store.summary("default");
                     require(summary.ok(), summary.error());
                     require(summary.value().guard_count == 3 && summary.value().enabled_guards == 3,
                             "default summary counts");
                     require(store.summary("nope").kind() == ErrorKind::NotFound,
                             "unknown summary fails");
                   }});

  tests.push_back({"store_load_from_env_absent_keeps_default", [] {
                     const EnvGuard env("SAFELAYER_POLICY", std::nullopt);
                     const TempWorkspace ws;
                     policy::PolicyStore store(ws.path());
                     const auto result = store.load_from_env();
                     require(result.ok(), result.error());
                     require(!result.value().has_value(), "nothing loaded");
                     require(store.active().name == "default", "default stays active");
                   }});

  tests.push_back({"store_load_from_env_activates_file", [] {
                     const TempWorkspace ws;
                     ws.create_file("base.yaml", BASE_POLICY);
                     const EnvGuard env("SAFELAYER_POLICY", (ws.path() / "base.yaml").string());
                     policy::PolicyStore store(ws.path());
                     const auto result = store.load_from_env();
                     require(result.ok(), result.error());
                     require(result.value().has_value() && result.value()->name == "base",
                             "env policy returned");
                     require(store.active().name == "base", "env policy activated");
                   }});

  tests.push_back({"store_load_from_env_propagates_errors", [] {
                     const TempWorkspace ws;
                     const EnvGuard env("SAFELAYER_POLICY", (ws.path() / "missing.yaml").string());
                     policy::PolicyStore store(ws.path());
                     const auto result = store.load_from_env();
                     require(!result.ok(), "missing env policy should fail");
                     require(result.kind() == ErrorKind::NotFound, "expected not found");
                   }});

  tests.push_back({"store_concurrent_mutation_is_serialized", [] {
                     const TempWorkspace ws;
                     policy::PolicyStore store(ws.path());
                     std::vector<std::thread> workers;
                     for (int i = 0; i < 8; ++i) {
                       workers.emplace_back([&store, i] {
                         store.add(policy::create_policy_template("p" + std::to_string(i), {"pii"}));
                         (void)store.set_active("p" + std::to_string(i));
                         (void)store.active();
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(store.list().size() == 9, "all policies registered");
                     require(store.active().name != "default", "one of the workers is active");
                   }});
}
