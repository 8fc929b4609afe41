#include "test_framework.hpp"

#include "safelayer/audit/audit.hpp"
#include "safelayer/guards/factory.hpp"
#include "safelayer/guards/manager.hpp"
#include "safelayer/policy/store.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

const char *SUPPORT_POLICY = "name: support\n"
                             "version: 1.2.0\n"
                             "description: Customer support replies\n"
                             "parent_policy: default\n"
                             "guards:\n"
                             "  tone:\n"
                             "    action: mask\n"
                             "    severity: medium\n"
                             "    threshold: 0.5\n"
                             "  tts:\n"
                             "    enabled: false\n"
                             "  codenames:\n"
                             "    guard_type: keyword\n"
                             "    action: mask\n"
                             "    custom_config:\n"
                             "      keywords: [Falcon, Osprey]\n"
                             "      replacement: '[REDACTED]'\n";

safelayer::guards::GuardManager
manager_for(const safelayer::policy::PolicySet &policy,
            std::shared_ptr<safelayer::audit::IAuditSink> sink) {
  auto built = safelayer::guards::build_guards(policy);
  safelayer::tests::require(built.ok(), built.error());
  return safelayer::guards::GuardManager(built.value(), std::move(sink));
}

} // namespace

void register_pipeline_integration_tests(std::vector<safelayer::tests::TestCase> &tests) {
  using safelayer::tests::require;
  using safelayer::testing::TempWorkspace;
  namespace policy = safelayer::policy;
  namespace audit = safelayer::audit;

  tests.push_back({"pipeline_integration_policy_file_to_audit_log", [] {
                     const TempWorkspace ws;
                     ws.create_file("support.yaml", SUPPORT_POLICY);
                     policy::PolicyStore store(ws.path());
                     const auto loaded = store.load(ws.path() / "support.yaml");
                     require(loaded.ok(), loaded.error());
                     require(store.set_active("support").ok(), "activate support policy");

                     const auto active = store.active();
                     require(active.metadata.at("inherited_from") == "default",
                             "child merged onto the built-in default");
                     require(policy::validate_policy(active).empty(), "merged policy is valid");

                     const auto log_path = ws.path() / "logs" / "audit.log";
                     auto sink = std::make_shared<audit::JsonlAuditSink>(log_path);
                     const auto manager = manager_for(active, sink);

                     const auto out = manager.run("Falcon ships Friday, mail ops@corp.io, damn it.");
                     require(out.ok(), out.error());
                     require(out.value() ==
                                 "[REDACTED] ships Friday, mail [EMAIL MASKED], **** it.",
                             "unexpected output: " + out.value());

                     const auto records = audit::read_audit_log(log_path);
                     require(records.ok(), records.error());
                     require(records.value().size() == 3, "one record per finding");
                     require(records.value()[0].guard == "pii:PIIGuard" &&
                                 records.value()[0].entity == "email",
                             "pii slot runs first");
                     require(records.value()[1].guard == "tone:ToneGuard", "tone slot second");
                     require(records.value()[2].guard == "codenames:KeywordGuard",
                             "child-only slot last");
                     for (const auto &record : records.value()) {
                       require(!record.excerpt.has_value(), "excerpts are opt-in");
                       require(record.snapshot_sha256.size() == 64, "snapshot is fingerprinted");
                     }
                   }});

  tests.push_back({"pipeline_integration_default_policy_blocks_markup", [] {
                     const TempWorkspace ws;
                     const policy::PolicyStore store(ws.path());
                     auto sink = std::make_shared<audit::MemoryAuditSink>();
                     const auto manager = manager_for(store.active(), sink);

                     const auto blocked = manager.run("Read this aloud: <b>now</b>");
                     require(!blocked.ok(), "tts block slot should stop markup");
                     require(blocked.kind() == safelayer::common::ErrorKind::Blocked,
                             "expected blocked kind");
                     require(blocked.error().find("tts") != std::string::npos,
                             "message names the slot");

                     const auto warned = manager.run("Well, crap.");
                     require(warned.ok(), warned.error());
                     require(warned.value() == "Well, crap.", "tone warn leaves text intact");
                     require(sink->records().back().entity == "profanity",
                             "warned finding is still audited");
                   }});

  tests.push_back({"pipeline_integration_saved_template_drives_pipeline", [] {
                     const TempWorkspace ws;
                     policy::PolicyStore store(ws.path());
                     auto tmpl = policy::create_policy_template("pii-only", {"pii"});
                     tmpl.guards[0].second.action = policy::PolicyAction::Mask;
                     const auto saved = store.save(tmpl);
                     require(saved.ok(), saved.error());

                     policy::PolicyStore fresh(ws.path());
                     const auto reloaded = fresh.load(saved.value());
                     require(reloaded.ok(), reloaded.error());
                     const auto manager =
                         manager_for(reloaded.value(), std::make_shared<audit::NoopAuditSink>());
                     const auto out = manager.run("call 555-123-4567");
                     require(out.ok(), out.error());
                     require(out.value() == "call [PHONE MASKED]", "unexpected output: " + out.value());
                   }});
}
