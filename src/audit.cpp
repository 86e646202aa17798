#include "ramws/audit.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <mutex>

#include "ramws/hash.hpp"
#include "ramws/jsonlite.hpp"
#include "ramws/observability.hpp"
#include "ramws/types.hpp"
#include "ramws/version.hpp"

namespace ramws {

namespace {

const std::string kGenesisDigest(64, '0');

std::string chain_digest(const std::string& line) { return hash_domain("audit:", line); }

}  // namespace

std::string audit_record_to_json(const AuditRecord& r) {
  jsonlite::Object o;
  o["seq"] = r.sequence;
  o["prev"] = r.previous_digest;
  o["v"] = std::uint64_t{version::AUDIT_LOG_VERSION};
  o["action"] = r.action;
  o["project_key"] = r.project_key;
  o["ram_root"] = r.ram_root;
  o["forced"] = r.forced;
  o["forced_data_loss"] = r.forced_data_loss;
  jsonlite::Array roles;
  for (const auto& role : r.roles) roles.emplace_back(role);
  o["roles"] = roles;
  o["changed"] = r.changed;
  o["ok"] = r.ok;
  o["error_code"] = r.error_code;
  o["timestamp_unix_ms"] = r.timestamp_unix_ms;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  std::uint64_t seq{0};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path) : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;

  // Resume the chain from the last complete line of an existing log.
  {
    std::ifstream in(path_, std::ios::binary);
    std::string line, last;
    while (std::getline(in, line)) {
      if (!line.empty()) last = line;
    }
    if (!last.empty()) {
      std::optional<jsonlite::JsonError> err;
      const auto o = jsonlite::parse(last, &err);
      if (err) {
        log_warn("audit", "last entry of " + path_ + " is malformed; chain restarts at its digest");
      }
      impl_->seq = jsonlite::get_u64(o, "seq", 0);
      impl_->last_digest = chain_digest(last);
    }
  }

  impl_->file = std::fopen(path_.c_str(), "a");
  if (!impl_->file) log_warn("audit", "cannot open audit log " + path_);
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_ && impl_->file) std::fclose(impl_->file);
}

bool ImmutableAuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (path_.empty()) return true;
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.timestamp_unix_ms = now_unix_ms();

  const std::string line = audit_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written = std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  const bool flushed = std::fflush(impl_->file) == 0;
  if (!written || !flushed) {
    ++impl_->failure_count;
    log_warn("audit", "failed to append to " + path_);
    return false;
  }

  impl_->seq = record.sequence;
  impl_->last_digest = chain_digest(line);
  ++impl_->entry_count;
  return true;
}

bool ImmutableAuditLog::enabled() const { return !path_.empty(); }

std::uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

AuditVerifyResult verify_audit_log(const std::string& path) {
  AuditVerifyResult r;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    r.error = "cannot open " + path;
    return r;
  }
  std::string expected_prev = kGenesisDigest;
  std::uint64_t expected_seq = 0;
  std::string line;
  bool first = true;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto o = jsonlite::parse(line, &err);
    if (err) {
      r.error = "entry " + std::to_string(r.entries + 1) + ": " + err->message;
      return r;
    }
    const auto seq = jsonlite::get_u64(o, "seq", 0);
    if (!first && seq != expected_seq + 1) {
      r.error = "sequence gap at " + std::to_string(seq) + " (expected " + std::to_string(expected_seq + 1) + ")";
      return r;
    }
    // A log may start mid-chain only if it was rotated; its first prev is
    // accepted as given.
    if (!first && jsonlite::get_string(o, "prev") != expected_prev) {
      r.error = "chain broken at sequence " + std::to_string(seq);
      return r;
    }
    first = false;
    expected_seq = seq;
    expected_prev = chain_digest(line);
    ++r.entries;
  }
  r.ok = true;
  return r;
}

// ---------------------------------------------------------------------------
// Global singleton
// ---------------------------------------------------------------------------

namespace {
std::mutex g_audit_init_mu;
std::string g_audit_path;
bool g_audit_path_set = false;
std::unique_ptr<ImmutableAuditLog> g_audit_log;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_init_mu);
  g_audit_path = path;
  g_audit_path_set = true;
  g_audit_log.reset();
}

ImmutableAuditLog& global_audit_log() {
  std::lock_guard<std::mutex> lk(g_audit_init_mu);
  if (!g_audit_log) {
    std::string path = g_audit_path;
    if (!g_audit_path_set) {
      const char* env = std::getenv("RAMWS_AUDIT_LOG");
      if (env && env[0]) path = env;
    }
    g_audit_log = std::make_unique<ImmutableAuditLog>(path);
  }
  return *g_audit_log;
}

}  // namespace ramws
