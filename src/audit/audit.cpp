#include "safelayer/audit/audit.hpp"

#include "safelayer/common/clock.hpp"
#include "safelayer/common/fs.hpp"
#include "safelayer/common/hash.hpp"
#include "safelayer/common/json_util.hpp"

#include <fstream>
#include <sstream>

namespace safelayer::audit {

namespace {

std::optional<std::size_t> parse_size(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(raw, &consumed);
    if (consumed != raw.size()) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace

AuditRecord make_record(const std::string &guard, const guards::Finding &finding,
                        const std::string &snapshot, const bool include_excerpt) {
  AuditRecord record;
  record.guard = guard;
  record.entity = finding.entity;
  record.start = finding.start;
  record.end = finding.end;
  record.explanation = finding.explanation;
  record.timestamp = common::now_iso8601();
  record.snapshot_sha256 = common::sha256_hex(snapshot);
  record.snapshot_length = snapshot.size();
  if (include_excerpt && finding.start <= finding.end && finding.end <= snapshot.size()) {
    record.excerpt = snapshot.substr(finding.start, finding.end - finding.start);
  }
  return record;
}

std::string encode_audit_record_jsonl(const AuditRecord &record) {
  std::ostringstream out;
  out << "{";
  out << "\"guard\":\"" << common::json_escape(record.guard) << "\",";
  out << "\"entity\":\"" << common::json_escape(record.entity) << "\",";
  out << "\"start\":" << record.start << ",";
  out << "\"end\":" << record.end << ",";
  out << "\"explanation\":\"" << common::json_escape(record.explanation) << "\",";
  out << "\"timestamp\":\"" << common::json_escape(record.timestamp) << "\",";
  out << "\"snapshot_sha256\":\"" << common::json_escape(record.snapshot_sha256) << "\",";
  out << "\"snapshot_length\":" << record.snapshot_length;
  if (record.excerpt.has_value()) {
    out << ",\"excerpt\":\"" << common::json_escape(*record.excerpt) << "\"";
  }
  out << "}";
  return out.str();
}

common::Result<AuditRecord> parse_audit_record_jsonl(const std::string &line) {
  if (common::trim(line).empty()) {
    return common::Result<AuditRecord>::failure("empty audit line", common::ErrorKind::Parse);
  }

  AuditRecord record;
  record.guard = common::json_get_string(line, "guard");
  record.entity = common::json_get_string(line, "entity");
  if (record.guard.empty() || record.entity.empty()) {
    return common::Result<AuditRecord>::failure("audit record missing guard or entity",
                                                common::ErrorKind::Parse);
  }

  const auto start = parse_size(common::json_get_number(line, "start"));
  const auto end = parse_size(common::json_get_number(line, "end"));
  if (!start.has_value() || !end.has_value()) {
    return common::Result<AuditRecord>::failure("audit record has invalid offsets",
                                                common::ErrorKind::Parse);
  }
  record.start = *start;
  record.end = *end;
  record.explanation = common::json_get_string(line, "explanation");
  record.timestamp = common::json_get_string(line, "timestamp");
  record.snapshot_sha256 = common::json_get_string(line, "snapshot_sha256");
  record.snapshot_length = parse_size(common::json_get_number(line, "snapshot_length")).value_or(0);
  if (common::json_find_key(line, "excerpt") != std::string::npos) {
    record.excerpt = common::json_get_string(line, "excerpt");
  }
  return common::Result<AuditRecord>::success(std::move(record));
}

common::Status MemoryAuditSink::append(const AuditRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
  return common::Status::success();
}

std::vector<AuditRecord> MemoryAuditSink::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::size_t MemoryAuditSink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

JsonlAuditSink::JsonlAuditSink(std::filesystem::path path) : path_(std::move(path)) {}

common::Status JsonlAuditSink::append(const AuditRecord &record) {
  const std::string line = encode_audit_record_jsonl(record);

  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto dir = common::ensure_dir(path_.parent_path()); !dir.ok()) {
    return common::Status::error(dir.error(), common::ErrorKind::Io);
  }
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    return common::Status::error("failed to open audit log: " + path_.string(),
                                 common::ErrorKind::Io);
  }
  out << line << "\n";
  out.flush();
  if (!out) {
    return common::Status::error("failed to write audit log: " + path_.string(),
                                 common::ErrorKind::Io);
  }
  return common::Status::success();
}

common::Result<std::vector<AuditRecord>> read_audit_log(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return common::Result<std::vector<AuditRecord>>::failure(
        "audit log not found: " + path.string(), common::ErrorKind::NotFound);
  }

  std::vector<AuditRecord> records;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = parse_audit_record_jsonl(line);
    if (!parsed.ok()) {
      return common::Result<std::vector<AuditRecord>>::failure(
          path.string() + ":" + std::to_string(line_number) + ": " + parsed.error(),
          common::ErrorKind::Parse);
    }
    records.push_back(std::move(parsed.value()));
  }
  return common::Result<std::vector<AuditRecord>>::success(std::move(records));
}

} // namespace safelayer::audit
