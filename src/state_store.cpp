#include "ramws/state_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

#include "ramws/jsonlite.hpp"
#include "ramws/observability.hpp"
#include "ramws/version.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

constexpr std::uint64_t kLockPollMs = 25;

std::string make_tmp_name(const fs::path& dir) {
  static std::uint64_t counter = 0;
  return (dir / (".state.tmp." + std::to_string(::getpid()) + "." + std::to_string(++counter))).string();
}

bool atomic_write(const fs::path& target, const std::string& data, std::string* error) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    if (error) *error = "cannot create " + target.parent_path().string() + ": " + ec.message();
    return false;
  }
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      if (error) *error = "cannot write " + tmp;
      return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      if (error) *error = "short write to " + tmp;
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    if (error) *error = "cannot replace " + target.string() + ": " + ec.message();
    return false;
  }
  return true;
}

// Manifest entries are written compactly: {"k":kind,"s":size,"m":mtime,"h":digest}.
jsonlite::Object manifest_to_object(const TreeManifest& manifest) {
  jsonlite::Object o;
  for (const auto& [key, stamp] : manifest) {
    jsonlite::Object e;
    e["k"] = std::string(1, stamp.kind);
    if (stamp.kind == 'f') {
      e["s"] = stamp.size;
      e["m"] = stamp.mtime;
    }
    if (!stamp.digest.empty()) e["h"] = stamp.digest;
    o[key] = e;
  }
  return o;
}

bool manifest_from_object(const jsonlite::Object& o, TreeManifest& out, std::string* error) {
  for (const auto& [key, v] : o) {
    const auto* e = std::get_if<jsonlite::Object>(&v.v);
    const std::string kind = e ? jsonlite::get_string(*e, "k") : std::string();
    if (kind != "f" && kind != "d" && kind != "l") {
      if (error) *error = "invalid baseline entry '" + key + "'";
      return false;
    }
    FileStamp stamp;
    stamp.kind = kind[0];
    stamp.size = jsonlite::get_u64(*e, "s", 0);
    stamp.mtime = jsonlite::get_u64(*e, "m", 0);
    stamp.digest = jsonlite::get_string(*e, "h");
    out[key] = std::move(stamp);
  }
  return true;
}

jsonlite::Object sync_record_to_object(const SyncRecord& rec) {
  jsonlite::Object o;
  o["dirty"] = rec.dirty;
  o["last_to_disk_ms"] = rec.last_to_disk_ms;
  o["last_from_disk_ms"] = rec.last_from_disk_ms;
  jsonlite::Object pending;
  for (const auto& [path, count] : rec.pending) pending[path] = count;
  o["pending"] = pending;
  if (!rec.baseline.empty()) {
    jsonlite::Object baseline;
    for (const auto& [rule, manifest] : rec.baseline) baseline[rule] = manifest_to_object(manifest);
    o["baseline"] = baseline;
  }
  return o;
}

bool sync_record_from_object(const jsonlite::Object& o, SyncRecord& rec, std::string* error) {
  rec.dirty = jsonlite::get_bool(o, "dirty", false);
  rec.last_to_disk_ms = jsonlite::get_u64(o, "last_to_disk_ms", 0);
  rec.last_from_disk_ms = jsonlite::get_u64(o, "last_from_disk_ms", 0);
  if (const auto* pending = jsonlite::get_object(o, "pending")) {
    for (const auto& [path, v] : *pending) {
      if (const auto* n = std::get_if<std::uint64_t>(&v.v)) rec.pending[path] = *n;
    }
  }
  if (const auto* baseline = jsonlite::get_object(o, "baseline")) {
    for (const auto& [rule, v] : *baseline) {
      const auto* m = std::get_if<jsonlite::Object>(&v.v);
      if (!m) {
        if (error) *error = "invalid baseline for '" + rule + "'";
        return false;
      }
      if (!manifest_from_object(*m, rec.baseline[rule], error)) return false;
    }
  }
  return true;
}

// True when `fd` still refers to the file currently linked at `path`.
bool lock_file_current(int fd, const std::string& path) {
  struct stat held {};
  struct stat named {};
  if (fstat(fd, &held) != 0) return false;
  if (stat(path.c_str(), &named) != 0) return false;
  return held.st_dev == named.st_dev && held.st_ino == named.st_ino;
}

std::string read_small_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

}  // namespace

std::string record_to_json(const WorkspaceRecord& record) {
  jsonlite::Object o;
  o["format_version"] = std::uint64_t{version::STATE_FORMAT_VERSION};
  o["project_key"] = record.project_key;
  o["project_root"] = record.project_root;
  o["ram_root"] = record.ram_root;
  o["state"] = to_string(record.state);
  o["created_at_ms"] = record.created_at_ms;
  jsonlite::Object roles;
  for (const auto& [role, rec] : record.roles) roles[to_string(role)] = sync_record_to_object(rec);
  o["roles"] = roles;
  if (record.in_flight) {
    jsonlite::Object f;
    f["role"] = to_string(record.in_flight->role);
    f["direction"] = to_string(record.in_flight->direction);
    f["rule_path"] = record.in_flight->rule_path;
    f["started_at_ms"] = record.in_flight->started_at_ms;
    o["in_flight"] = f;
  }
  return jsonlite::to_json(o) + "\n";
}

std::optional<WorkspaceRecord> record_from_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  const auto o = jsonlite::parse(text, &jerr);
  if (jerr) {
    if (error) *error = jerr->code + ": " + jerr->message;
    return std::nullopt;
  }
  const auto fmt = jsonlite::get_u64(o, "format_version", 0);
  if (fmt == 0 || fmt > version::STATE_FORMAT_VERSION) {
    if (error) {
      *error = "unsupported state format_version " + std::to_string(fmt) + " (this build reads up to " +
               std::to_string(version::STATE_FORMAT_VERSION) + ")";
    }
    return std::nullopt;
  }

  WorkspaceRecord rec;
  rec.project_key = jsonlite::get_string(o, "project_key");
  rec.project_root = jsonlite::get_string(o, "project_root");
  rec.ram_root = jsonlite::get_string(o, "ram_root");
  rec.created_at_ms = jsonlite::get_u64(o, "created_at_ms", 0);
  auto state = parse_workspace_state(jsonlite::get_string(o, "state"));
  if (!state) {
    if (error) *error = "invalid workspace state '" + jsonlite::get_string(o, "state") + "'";
    return std::nullopt;
  }
  rec.state = *state;

  if (const auto* roles = jsonlite::get_object(o, "roles")) {
    for (const auto& [name, v] : *roles) {
      auto role = parse_role(name);
      if (!role || !std::holds_alternative<jsonlite::Object>(v.v)) {
        if (error) *error = "invalid role entry '" + name + "'";
        return std::nullopt;
      }
      if (!sync_record_from_object(std::get<jsonlite::Object>(v.v), rec.roles[*role], error)) return std::nullopt;
    }
  }

  if (const auto* f = jsonlite::get_object(o, "in_flight")) {
    auto role = parse_role(jsonlite::get_string(*f, "role"));
    auto dir = parse_direction(jsonlite::get_string(*f, "direction"));
    if (!role || !dir) {
      if (error) *error = "invalid in_flight marker";
      return std::nullopt;
    }
    InFlightOp op;
    op.role = *role;
    op.direction = *dir;
    op.rule_path = jsonlite::get_string(*f, "rule_path");
    op.started_at_ms = jsonlite::get_u64(*f, "started_at_ms", 0);
    rec.in_flight = op;
  }
  return rec;
}

StateStore::StateStore(fs::path ram_root) : ram_root_(std::move(ram_root)) {}

LoadResult StateStore::load(const std::string& project_key) const {
  LoadResult r;
  std::error_code ec;
  if (!fs::exists(state_path(), ec)) {
    r.ok = true;
    return r;
  }
  const std::string text = read_small_file(state_path());
  std::string error;
  auto rec = record_from_json(text, &error);
  if (!rec) {
    r.error = state_path().string() + ": " + error;
    return r;
  }
  r.ok = true;
  if (rec->project_key != project_key) {
    log_warn("state", "state file belongs to project '" + rec->project_key + "', expected '" + project_key +
                          "'; treating workspace as not started");
    return r;
  }
  r.record = std::move(rec);
  return r;
}

bool StateStore::save(const WorkspaceRecord& record, std::string* error) {
  return atomic_write(state_path(), record_to_json(record), error);
}

bool StateStore::record_sync(WorkspaceRecord& record, Role role, Direction direction,
                             std::uint64_t timestamp_ms, std::string* error) {
  SyncRecord& rec = record.record(role);
  if (direction == Direction::to_disk) {
    rec.last_to_disk_ms = timestamp_ms;
  } else {
    rec.last_from_disk_ms = timestamp_ms;
  }
  return save(record, error);
}

bool StateStore::mark_dirty(WorkspaceRecord& record, Role role, std::string* error) {
  record.record(role).dirty = true;
  record.refresh_state();
  return save(record, error);
}

bool StateStore::clear(const std::string& project_key, std::string* error) {
  std::error_code ec;
  if (!fs::exists(state_path(), ec)) return true;
  auto loaded = load(project_key);
  if (loaded.ok && !loaded.record) {
    if (error) *error = "state file at " + state_path().string() + " belongs to another project";
    return false;
  }
  fs::remove(state_path(), ec);
  if (ec) {
    if (error) *error = "cannot remove " + state_path().string() + ": " + ec.message();
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// WorkspaceLock
// ---------------------------------------------------------------------------

WorkspaceLock::~WorkspaceLock() { release(); }

WorkspaceLock::WorkspaceLock(WorkspaceLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

WorkspaceLock& WorkspaceLock::operator=(WorkspaceLock&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void WorkspaceLock::release() {
  if (fd_ >= 0) {
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
  }
}

WorkspaceLock::Outcome WorkspaceLock::acquire(const fs::path& ram_root, std::uint64_t timeout_ms,
                                              WorkspaceLock& out) {
  Outcome o;
  const StateStore layout(ram_root);
  const std::string path = layout.lock_path().string();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

  int fd = -1;
  while (fd < 0) {
    std::error_code ec;
    fs::create_directories(layout.meta_dir(), ec);
    if (ec) {
      o.error = ErrorCode::io_error;
      o.message = "cannot create " + layout.meta_dir().string() + ": " + ec.message();
      return o;
    }
    fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      o.error = ErrorCode::io_error;
      o.message = "cannot open " + path + ": " + std::strerror(errno);
      return o;
    }

    bool locked = false;
    while (!locked) {
      if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
        locked = true;
        break;
      }
      const int err = errno;
      if (err == EINTR) continue;
      if (err != EWOULDBLOCK) {
        close(fd);
        o.error = ErrorCode::io_error;
        o.message = "flock " + path + ": " + std::strerror(err);
        return o;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        std::string holder = read_small_file(path);
        while (!holder.empty() && (holder.back() == '\n' || holder.back() == ' ')) holder.pop_back();
        close(fd);
        o.error = ErrorCode::workspace_busy;
        o.message = "workspace is locked by another ramws process" +
                    (holder.empty() ? std::string() : " (pid " + holder + ")") + "; retry later";
        return o;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kLockPollMs));
    }

    // The previous holder may have removed the workspace (and this lock file)
    // while we waited. A lock on an unlinked file excludes nobody: start over
    // on whatever file the path names now.
    if (!lock_file_current(fd, path)) {
      log_debug("state", "lock file " + path + " was replaced while waiting; retrying");
      close(fd);
      fd = -1;
      if (std::chrono::steady_clock::now() >= deadline) {
        o.error = ErrorCode::workspace_busy;
        o.message = "workspace lock at " + path + " kept changing; retry later";
        return o;
      }
    }
  }

  // Record the holder for diagnostics. Failure here does not affect the lock.
  const std::string pid = std::to_string(::getpid()) + "\n";
  if (ftruncate(fd, 0) == 0) {
    if (pwrite(fd, pid.data(), pid.size(), 0) < 0) {
      log_debug("state", "cannot record lock holder in " + path);
    }
  }

  out = WorkspaceLock();
  out.fd_ = fd;
  o.acquired = true;
  return o;
}

WorkspaceLock::Outcome WorkspaceLock::try_acquire(const fs::path& ram_root, WorkspaceLock& out) {
  Outcome o;
  const StateStore layout(ram_root);
  const std::string path = layout.lock_path().string();
  int fd = open(path.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    if (errno != ENOENT) {
      o.error = ErrorCode::io_error;
      o.message = "cannot open " + path + ": " + std::strerror(errno);
    }
    return o;
  }
  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    close(fd);
    o.error = err == EWOULDBLOCK ? ErrorCode::workspace_busy : ErrorCode::io_error;
    o.message = "flock " + path + ": " + std::strerror(err);
    return o;
  }
  if (!lock_file_current(fd, path)) {
    // Removed under us by a destroy: there is no workspace left to guard.
    close(fd);
    return o;
  }
  out = WorkspaceLock();
  out.fd_ = fd;
  o.acquired = true;
  return o;
}

}  // namespace ramws
