#pragma once

// ramws/audit.hpp — Append-only, hash-chained audit log for destructive actions.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: sequence numbers increase by one per entry, across
//      processes. Opening an existing log resumes from its last entry.
//   3. CHAINED: each entry carries `prev`, the BLAKE3 domain digest
//      ("audit:") of the previous entry's line. The first entry's prev is 64
//      zeros.
//   4. FAIL-SAFE: a write failure never fails the workspace operation; it is
//      logged and counted.
//
// Recorded actions: "destroy", "destroy.forced", "sync.from_disk.forced".

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ramws {

struct AuditRecord {
  std::uint64_t sequence{0};          // assigned by append()
  std::string previous_digest;        // assigned by append()
  std::string action;
  std::string project_key;
  std::string ram_root;
  bool forced{false};
  bool forced_data_loss{false};       // dirty work was discarded
  std::vector<std::string> roles;     // affected roles
  std::uint64_t changed{0};           // paths discarded or removed
  bool ok{false};
  std::string error_code;
  std::uint64_t timestamp_unix_ms{0}; // assigned by append()
};

std::string audit_record_to_json(const AuditRecord& r);

class ImmutableAuditLog {
 public:
  // Empty path disables the log: append() is a successful no-op.
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, previous_digest and timestamp in place.
  // Returns false if the entry was not written.
  bool append(AuditRecord& record);

  bool enabled() const;
  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

struct AuditVerifyResult {
  bool ok{false};
  std::uint64_t entries{0};
  std::string error;   // first broken link, if any
};

// Re-walks the chain of an existing log file.
AuditVerifyResult verify_audit_log(const std::string& path);

// Process-wide log, configured from RAMWS_AUDIT_LOG unless
// set_audit_log_path() ran first.
ImmutableAuditLog& global_audit_log();
void set_audit_log_path(const std::string& path);

}  // namespace ramws
