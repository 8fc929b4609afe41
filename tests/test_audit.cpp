#include "test_framework.hpp"

#include "safelayer/audit/audit.hpp"
#include "safelayer/common/hash.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

safelayer::guards::Finding sample_finding() {
  return safelayer::guards::Finding{.entity = "email",
                                    .start = 6,
                                    .end = 13,
                                    .explanation = "EMAIL @ 6-13",
                                    .detector = "PIIGuard"};
}

} // namespace

void register_audit_tests(std::vector<safelayer::tests::TestCase> &tests) {
  using safelayer::tests::require;
  namespace audit = safelayer::audit;

  tests.push_back({"audit_make_record_fingerprints_snapshot", [] {
                     const std::string snapshot = "mail: a@b.com now";
                     const auto record =
                         audit::make_record("pii:PIIGuard", sample_finding(), snapshot, false);
                     require(record.guard == "pii:PIIGuard", "guard name");
                     require(record.start == 6 && record.end == 13, "offsets kept as detected");
                     require(record.snapshot_sha256 == safelayer::common::sha256_hex(snapshot),
                             "hash should match the snapshot");
                     require(record.snapshot_length == snapshot.size(), "snapshot length");
                     require(!record.excerpt.has_value(), "no excerpt unless requested");
                     require(record.timestamp.size() == 24 && record.timestamp.back() == 'Z',
                             "ISO-8601 UTC timestamp expected: " + record.timestamp);
                   }});

  tests.push_back({"audit_make_record_optional_excerpt", [] {
                     const auto record =
                         audit::make_record("PIIGuard", sample_finding(), "mail: a@b.com now", true);
                     require(record.excerpt.has_value() && *record.excerpt == "a@b.com",
                             "excerpt should be the flagged substring");
                   }});

  tests.push_back({"audit_jsonl_roundtrip_with_escapes", [] {
                     audit::AuditRecord record =
                         audit::make_record("tone", sample_finding(), "x", false);
                     record.explanation = "Profanity: \"crap\"\nline";
                     record.excerpt = "tab\there";
                     const std::string line = audit::encode_audit_record_jsonl(record);
                     require(line.find('\n') == std::string::npos, "record must be a single line");
                     const auto parsed = audit::parse_audit_record_jsonl(line);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value() == record, "decoded record should equal the original");
                   }});

  tests.push_back({"audit_parse_rejects_garbage", [] {
                     require(!audit::parse_audit_record_jsonl("not json").ok(), "garbage should fail");
                     require(!audit::parse_audit_record_jsonl(
                                  R"({"guard":"g","entity":"e","start":"x","end":1})")
                                  .ok(),
                             "non-numeric offsets should fail");
                   }});

  tests.push_back({"audit_jsonl_sink_appends_lines", [] {
                     const safelayer::testing::TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "audit.log";
                     audit::JsonlAuditSink sink(path);
                     const auto first = audit::make_record("a", sample_finding(), "one", false);
                     const auto second = audit::make_record("b", sample_finding(), "two", false);
                     require(sink.append(first).ok(), "first append");
                     require(sink.append(second).ok(), "second append");

                     const auto records = audit::read_audit_log(path);
                     require(records.ok(), records.error());
                     require(records.value().size() == 2, "expected two records");
                     require(records.value()[0].guard == "a" && records.value()[1].guard == "b",
                             "records should be in append order");
                   }});

  tests.push_back({"audit_jsonl_sink_reports_io_error", [] {
                     const safelayer::testing::TempWorkspace ws;
                     ws.create_file("blocker", "file, not a directory");
                     audit::JsonlAuditSink sink(ws.path() / "blocker" / "audit.log");
                     const auto status =
                         sink.append(audit::make_record("a", sample_finding(), "x", false));
                     require(!status.ok(), "append under a file should fail");
                     require(status.kind() == safelayer::common::ErrorKind::Io, "expected io kind");
                   }});

  tests.push_back({"audit_memory_sink_collects", [] {
                     audit::MemoryAuditSink sink;
                     require(sink.append(audit::make_record("a", sample_finding(), "x", false)).ok(),
                             "append");
                     require(sink.size() == 1 && sink.records()[0].guard == "a",
                             "memory sink should keep records");
                   }});

  tests.push_back({"audit_read_missing_log_is_not_found", [] {
                     const auto records = audit::read_audit_log("/nonexistent/safelayer/audit.log");
                     require(!records.ok(), "missing log should fail");
                     require(records.kind() == safelayer::common::ErrorKind::NotFound,
                             "expected not found");
                   }});
}
