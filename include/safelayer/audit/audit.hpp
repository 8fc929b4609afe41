#pragma once

#include "safelayer/common/result.hpp"
#include "safelayer/guards/guard.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace safelayer::audit {

/// Immutable record of one finding.
///
/// `start`/`end` are the offsets the guard reported and are only meaningful against the text
/// identified by `snapshot_sha256`/`snapshot_length`: the input that guard's `check` saw. They
/// are not corrected for masking done afterwards and usually do not index the final output.
struct AuditRecord {
  std::string guard;
  std::string entity;
  std::size_t start = 0;
  std::size_t end = 0;
  std::string explanation;
  std::string timestamp;
  std::string snapshot_sha256;
  std::size_t snapshot_length = 0;
  std::optional<std::string> excerpt;

  bool operator==(const AuditRecord &) const = default;
};

/// Builds a record for `finding`, fingerprinting the snapshot the finding was computed on.
[[nodiscard]] AuditRecord make_record(const std::string &guard, const guards::Finding &finding,
                                      const std::string &snapshot, bool include_excerpt);

[[nodiscard]] std::string encode_audit_record_jsonl(const AuditRecord &record);
[[nodiscard]] common::Result<AuditRecord> parse_audit_record_jsonl(const std::string &line);

/// Append-only destination for audit records.
class IAuditSink {
public:
  virtual ~IAuditSink() = default;
  [[nodiscard]] virtual common::Status append(const AuditRecord &record) = 0;
};

class NoopAuditSink final : public IAuditSink {
public:
  [[nodiscard]] common::Status append(const AuditRecord &) override {
    return common::Status::success();
  }
};

class MemoryAuditSink final : public IAuditSink {
public:
  [[nodiscard]] common::Status append(const AuditRecord &record) override;
  [[nodiscard]] std::vector<AuditRecord> records() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<AuditRecord> records_;
};

/// One JSON object per line, appended to `path`. Parent directories are created on demand.
class JsonlAuditSink final : public IAuditSink {
public:
  explicit JsonlAuditSink(std::filesystem::path path);

  [[nodiscard]] common::Status append(const AuditRecord &record) override;
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  std::mutex mutex_;
};

[[nodiscard]] common::Result<std::vector<AuditRecord>>
read_audit_log(const std::filesystem::path &path);

} // namespace safelayer::audit
