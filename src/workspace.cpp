#include "ramws/workspace.hpp"

#include <sys/vfs.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "ramws/audit.hpp"
#include "ramws/glob.hpp"
#include "ramws/jsonlite.hpp"
#include "ramws/observability.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

// statfs(2) f_type values, from linux/magic.h.
constexpr unsigned long kTmpfsMagic = 0x01021994UL;
constexpr unsigned long kRamfsMagic = 0x858458f6UL;

CommandReport fail(ErrorCode code, std::string message) {
  CommandReport r;
  r.error = code;
  r.message = std::move(message);
  return r;
}

CommandReport denied(const GuardDecision& d) {
  CommandReport r = fail(ErrorCode::denied_by_safety_guard, d.reason);
  r.guard = d;
  return r;
}

void copy_execution(const ExecutionReport& ex, CommandReport& r) {
  r.changed += ex.changed;
  for (const auto& op : ex.completed) r.completed.push_back(describe(op));
  if (ex.failed) r.unstarted.push_back(describe(*ex.failed) + " (failed)");
  for (const auto& op : ex.unstarted) r.unstarted.push_back(describe(op));
}

void emit_command_event(const std::string& name, const std::string& project_key, const std::string& direction,
                        const CommandReport& r, std::uint64_t duration_ns) {
  WorkspaceEvent ev;
  ev.name = name;
  ev.project_key = project_key;
  ev.direction = direction;
  ev.ok = r.ok;
  if (!r.ok) ev.error_code = to_string(r.error);
  ev.changed = r.changed;
  ev.duration_ns = duration_ns;
  emit_workspace_event(ev);
}

jsonlite::Array string_array(const std::vector<std::string>& items) {
  jsonlite::Array a;
  for (const auto& s : items) a.emplace_back(s);
  return a;
}

}  // namespace

// ---------------------------------------------------------------------------
// Filesystem inspection
// ---------------------------------------------------------------------------

FsStatus inspect_filesystem(const fs::path& path) {
  FsStatus st;
  fs::path dir = path;
  std::error_code ec;
  while (!dir.empty() && !fs::exists(dir, ec)) {
    const fs::path parent = dir.parent_path();
    if (parent == dir) break;
    dir = parent;
  }
  st.inspected_path = dir.string();

  struct statfs sfs;
  if (statfs(dir.c_str(), &sfs) != 0) {
    st.error = "statfs " + dir.string() + ": " + std::strerror(errno);
    return st;
  }
  const auto magic = static_cast<unsigned long>(sfs.f_type);
  if (magic == kTmpfsMagic) {
    st.fs_type = "tmpfs";
  } else if (magic == kRamfsMagic) {
    st.fs_type = "ramfs";
  } else {
    std::ostringstream hex;
    hex << "0x" << std::hex << magic;
    st.fs_type = hex.str();
  }
  st.is_volatile = magic == kTmpfsMagic || magic == kRamfsMagic;
  const auto frsize = static_cast<std::uint64_t>(sfs.f_frsize ? sfs.f_frsize : sfs.f_bsize);
  st.total_bytes = static_cast<std::uint64_t>(sfs.f_blocks) * frsize;
  st.available_bytes = static_cast<std::uint64_t>(sfs.f_bavail) * frsize;
  st.used_bytes = static_cast<std::uint64_t>(sfs.f_blocks - sfs.f_bfree) * frsize;
  st.ok = true;
  return st;
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

std::string CommandReport::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  o["error"] = ok ? std::string() : to_string(error);
  o["message"] = message;
  o["changed"] = changed;
  o["completed"] = string_array(completed);
  o["unstarted"] = string_array(unstarted);
  o["notes"] = string_array(notes);
  if (guard) {
    jsonlite::Object g;
    g["verdict"] = to_string(guard->verdict);
    g["reason"] = guard->reason;
    g["roles"] = string_array(guard->roles);
    g["paths"] = string_array(guard->paths);
    g["changed"] = guard->changed;
    g["forced_data_loss"] = guard->forced_data_loss;
    o["guard"] = g;
  }
  return jsonlite::to_json(o);
}

const RoleStatus* StatusReport::find(Role role) const {
  for (const auto& r : roles) {
    if (r.role == role) return &r;
  }
  return nullptr;
}

bool StatusReport::source_dirty() const {
  const RoleStatus* s = find(Role::source);
  return s && s->dirty;
}

std::string StatusReport::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  if (!ok) {
    o["error"] = to_string(error);
    o["message"] = message;
  }
  o["project_key"] = project_key;
  o["project_root"] = project_root;
  o["workspace_root"] = workspace_root;
  o["config_path"] = config_path;
  o["workspace_exists"] = exists;
  o["state"] = to_string(state);

  jsonlite::Object f;
  f["inspected_path"] = fs.inspected_path;
  if (fs.ok) {
    f["type"] = fs.fs_type;
    f["volatile"] = fs.is_volatile;
    f["total_bytes"] = fs.total_bytes;
    f["used_bytes"] = fs.used_bytes;
    f["available_bytes"] = fs.available_bytes;
    f["total"] = format_bytes(fs.total_bytes);
    f["used"] = format_bytes(fs.used_bytes);
    f["available"] = format_bytes(fs.available_bytes);
  } else {
    f["error"] = fs.error;
  }
  o["filesystem"] = f;

  jsonlite::Object roles_obj;
  for (const auto& r : roles) {
    jsonlite::Object ro;
    ro["dirty"] = r.dirty;
    ro["pending"] = r.pending;
    jsonlite::Object pp;
    for (const auto& [path, count] : r.pending_paths) pp[path] = count;
    ro["pending_paths"] = pp;
    ro["last_to_disk_ms"] = r.last_to_disk_ms;
    ro["last_from_disk_ms"] = r.last_from_disk_ms;
    roles_obj[to_string(r.role)] = ro;
  }
  o["roles"] = roles_obj;

  jsonlite::Object diff;
  diff["changed"] = diff_updated;
  diff["added"] = diff_created;
  diff["deleted"] = diff_deleted;
  o["diff"] = diff;

  jsonlite::Object rules;
  rules["sources"] = static_cast<std::uint64_t>(source_rules);
  rules["cache_dirs"] = static_cast<std::uint64_t>(cache_dirs);
  rules["scratch_dirs"] = static_cast<std::uint64_t>(scratch_dirs);
  o["rules"] = rules;

  o["sync_on_exit"] = to_string(on_exit);
  o["mirror"] = mirror_backend;
  o["possibly_stale"] = possibly_stale;
  o["interrupted"] = interrupted;
  if (in_flight) {
    jsonlite::Object fo;
    fo["role"] = to_string(in_flight->role);
    fo["direction"] = to_string(in_flight->direction);
    fo["rule_path"] = in_flight->rule_path;
    fo["started_at_ms"] = in_flight->started_at_ms;
    o["in_flight"] = fo;
  }
  o["notes"] = string_array(notes);
  return jsonlite::to_json(o);
}

std::string StatusReport::to_text() const {
  std::ostringstream out;
  out << "Workspace: " << workspace_root << "\n";
  out << "Project: " << project_root << " (" << project_key << ")\n";
  out << "Exists: " << (exists ? "true" : "false") << "\n";
  out << "State: " << to_string(state) << "\n";
  if (fs.ok) {
    out << "Filesystem: " << fs.fs_type << (fs.is_volatile ? "" : " (not RAM-backed)") << "\n";
    out << "Capacity: total " << format_bytes(fs.total_bytes) << ", used " << format_bytes(fs.used_bytes) << "\n";
    out << "Available: " << format_bytes(fs.available_bytes) << "\n";
  } else if (!fs.error.empty()) {
    out << "Filesystem: unknown (" << fs.error << ")\n";
  }
  if (exists) {
    out << "Diff summary: changed " << diff_updated << ", added " << diff_created << ", deleted " << diff_deleted
        << "\n";
    for (const auto& r : roles) {
      out << "Role " << to_string(r.role) << ": " << (r.dirty ? "dirty" : "clean");
      if (r.pending) out << ", " << r.pending << " pending";
      out << ", last to-disk " << r.last_to_disk_ms << ", last from-disk " << r.last_from_disk_ms << "\n";
    }
  }
  out << "Sync on exit: " << to_string(on_exit) << "\n";
  if (possibly_stale) out << "Note: another ramws process holds the workspace; figures may be stale\n";
  if (interrupted) out << "Note: a previous operation was interrupted; state re-derived from the trees\n";
  for (const auto& n : notes) out << "Note: " << n << "\n";
  return out.str();
}

// ---------------------------------------------------------------------------
// WorkspaceController
// ---------------------------------------------------------------------------

WorkspaceController::WorkspaceController(ResolvedConfig resolved, IMirror& mirror)
    : resolved_(std::move(resolved)), mirror_(mirror), store_(resolved_.workspace_root) {}

bool WorkspaceController::started() const {
  std::error_code ec;
  return fs::exists(store_.state_path(), ec);
}

CommandReport WorkspaceController::lock_workspace(WorkspaceLock& lock) {
  const auto outcome = WorkspaceLock::acquire(resolved_.workspace_root, resolved_.config.sync.lock_timeout_ms, lock);
  if (!outcome.acquired) return fail(outcome.error, outcome.message);
  CommandReport r;
  r.ok = true;
  return r;
}

Classification WorkspaceController::classify_rules(bool with_snapshot, std::string* error) const {
  if (!with_snapshot) return classify(resolved_.config, {});
  // Only the rule set is needed to prune the walk.
  auto rs = build_rule_set(resolved_.config);
  if (!rs.ok) return classify(resolved_.config, {});
  const Snapshot disk = snapshot_tree(resolved_.project_root, &rs.rules, error);
  const Snapshot ram = snapshot_tree(resolved_.workspace_root, &rs.rules, error);
  return classify(resolved_.config, merge_snapshots(disk, ram));
}

void WorkspaceController::audit(const std::string& action, bool forced, const GuardDecision& guard, bool ok,
                                ErrorCode error) const {
  AuditRecord rec;
  rec.action = action;
  rec.project_key = resolved_.project_key;
  rec.ram_root = resolved_.workspace_root.string();
  rec.forced = forced;
  rec.forced_data_loss = guard.forced_data_loss;
  rec.roles = guard.roles;
  rec.changed = guard.changed;
  rec.ok = ok;
  if (!ok) rec.error_code = to_string(error);
  if (!global_audit_log().append(rec)) log_warn("audit", "audit entry for " + action + " was not written");
}

CommandReport WorkspaceController::start(const StartOptions& options) {
  std::uint64_t duration_ns = 0;
  CommandReport report;
  {
    ScopeTimer timer(duration_ns);
    report = [&]() -> CommandReport {
      const FsStatus fst = inspect_filesystem(resolved_.workspace_root);
      CommandReport r;
      if (!fst.ok) {
        r.notes.push_back("cannot determine filesystem of " + fst.inspected_path + ": " + fst.error);
      } else if (!fst.is_volatile) {
        const std::string note = resolved_.workspace_root.string() + " is on " + fst.fs_type +
                                 ", not tmpfs or ramfs; the workspace will not be memory-backed";
        log_warn("workspace", note);
        r.notes.push_back(note);
      }

      std::error_code ec;
      fs::create_directories(resolved_.workspace_root, ec);
      if (ec) return fail(ErrorCode::io_error, "cannot create " + resolved_.workspace_root.string() + ": " + ec.message());

      WorkspaceLock lock;
      if (auto l = lock_workspace(lock); !l.ok) return l;

      auto loaded = store_.load(resolved_.project_key);
      if (!loaded.ok) return fail(ErrorCode::io_error, loaded.error);

      Classification cls = classify_rules(false, nullptr);
      if (!cls.ok) return fail(cls.error, cls.message);

      WorkspaceRecord record;
      bool forced_pull = false;
      GuardDecision guard;
      if (loaded.record) {
        record = *loaded.record;
        if (record.in_flight) r.notes.push_back("previous operation was interrupted; dirtiness re-derived");
        auto dirt = derive_dirtiness(resolved_, cls, mirror_, record);
        if (!dirt.ok) return fail(dirt.error, dirt.message);
        guard = check_start(record, options.force);
        if (!guard.allowed()) return denied(guard);
        forced_pull = guard.forced_data_loss;
      } else {
        record.project_key = resolved_.project_key;
        record.project_root = resolved_.project_root.string();
        record.ram_root = resolved_.workspace_root.string();
        record.created_at_ms = now_unix_ms();
      }
      if (forced_pull) {
        log_warn("workspace", "discarding " + std::to_string(guard.changed) + " unsynced RAM change(s) on forced start");
        r.guard = guard;
      }

      std::vector<Role> roles{Role::source};
      if (!options.refresh_sources_only) roles.push_back(Role::cache);
      const PlanResult plan = plan_sync(resolved_, cls, Direction::from_disk, SyncScope::for_roles(roles));
      if (!plan.ok) return fail(plan.error, plan.message);

      const ExecutionReport ex = execute_plan(plan.operations, mirror_, store_, record);
      copy_execution(ex, r);
      if (forced_pull) audit("sync.from_disk.forced", true, guard, ex.ok, ex.error);
      if (!ex.ok) {
        r.error = ex.error;
        r.message = ex.message;
        return r;
      }

      if (!options.refresh_sources_only) {
        for (std::size_t i = 0; i < cls.rules.build_dirs.size(); ++i) {
          const auto& b = cls.rules.build_dirs[i];
          if (b.role != Role::scratch || build_dir_shadowed(cls.rules, i)) continue;
          fs::create_directories(resolved_.workspace_root / b.path, ec);
          if (ec) return fail(ErrorCode::io_error, "cannot create scratch dir " + b.path + ": " + ec.message());
        }
      }

      if (record.state == WorkspaceState::uninitialized || record.state == WorkspaceState::destroyed) {
        record.state = WorkspaceState::populated;
      }
      auto dirt = derive_dirtiness(resolved_, cls, mirror_, record);
      if (!dirt.ok) {
        r.notes.push_back("dirtiness not re-derived after start: " + dirt.message);
      }
      std::string err;
      if (!store_.save(record, &err)) return fail(ErrorCode::io_error, err);

      r.ok = true;
      r.message = "workspace ready at " + resolved_.workspace_root.string();
      return r;
    }();
  }
  emit_command_event("workspace.start", resolved_.project_key, to_string(Direction::from_disk), report, duration_ns);
  return report;
}

StatusReport WorkspaceController::status() {
  StatusReport s;
  s.project_key = resolved_.project_key;
  s.project_root = resolved_.project_root.string();
  s.workspace_root = resolved_.workspace_root.string();
  s.config_path = resolved_.config_path.string();
  s.on_exit = resolved_.config.sync.on_exit;
  s.mirror_backend = mirror_.backend_id();
  s.fs = inspect_filesystem(resolved_.workspace_root);

  Classification cls = classify_rules(false, nullptr);
  if (!cls.ok) {
    s.error = cls.error;
    s.message = cls.message;
    return s;
  }
  s.source_rules = cls.rules.sources.size();
  for (const auto& b : cls.rules.build_dirs) (b.role == Role::cache ? s.cache_dirs : s.scratch_dirs)++;

  s.exists = started();
  if (!s.exists) {
    s.ok = true;
    return s;
  }

  WorkspaceLock lock;
  const auto peek = WorkspaceLock::try_acquire(resolved_.workspace_root, lock);
  if (!peek.acquired) {
    if (peek.error == ErrorCode::workspace_busy) {
      s.possibly_stale = true;
    } else if (peek.error != ErrorCode::none) {
      s.possibly_stale = true;
      s.notes.push_back(peek.message);
    }
  }

  auto loaded = store_.load(resolved_.project_key);
  if (!loaded.ok) {
    s.error = ErrorCode::io_error;
    s.message = loaded.error;
    return s;
  }
  if (!loaded.record) {
    s.exists = false;
    s.ok = true;
    return s;
  }
  WorkspaceRecord record = *loaded.record;
  s.interrupted = record.in_flight.has_value();
  s.in_flight = record.in_flight;

  auto dirt = derive_dirtiness(resolved_, cls, mirror_, record);
  if (dirt.ok) {
    // The summary compares the trees as they stand, whichever side changed.
    const PlanResult push = plan_sync(resolved_, cls, Direction::to_disk, SyncScope::for_roles({Role::source}));
    const DirtinessResult diff = push.ok ? dry_run_changes(push.operations, mirror_) : DirtinessResult{};
    if (diff.ok) {
      s.diff_created = diff.created;
      s.diff_updated = diff.updated;
      s.diff_deleted = diff.deleted;
    } else {
      s.notes.push_back("diff summary unavailable: " + (push.ok ? diff.message : push.message));
    }
    if (lock.held()) {
      record.in_flight.reset();
      std::string err;
      if (!store_.save(record, &err)) s.notes.push_back("re-derived state not saved: " + err);
    }
  } else {
    s.possibly_stale = true;
    s.notes.push_back("dirtiness not re-derived: " + dirt.message);
  }

  s.state = record.state;
  for (const auto& [role, rec] : record.roles) {
    RoleStatus rs;
    rs.role = role;
    rs.dirty = rec.dirty;
    rs.pending = rec.pending_total();
    rs.pending_paths = rec.pending;
    rs.last_to_disk_ms = rec.last_to_disk_ms;
    rs.last_from_disk_ms = rec.last_from_disk_ms;
    s.roles.push_back(std::move(rs));
  }
  if (!s.find(Role::source)) {
    RoleStatus rs;
    rs.role = Role::source;
    s.roles.insert(s.roles.begin(), rs);
  }
  s.ok = true;
  return s;
}

CommandReport WorkspaceController::sync(const SyncOptions& options) {
  std::uint64_t duration_ns = 0;
  CommandReport report;
  {
    ScopeTimer timer(duration_ns);
    report = [&]() -> CommandReport {
      if (!started()) {
        return fail(ErrorCode::workspace_missing,
                    "no workspace at " + resolved_.workspace_root.string() + "; run `ramws start` first");
      }
      WorkspaceLock lock;
      if (auto l = lock_workspace(lock); !l.ok) return l;

      auto loaded = store_.load(resolved_.project_key);
      if (!loaded.ok) return fail(ErrorCode::io_error, loaded.error);
      if (!loaded.record) {
        return fail(ErrorCode::workspace_missing,
                    "no workspace record for " + resolved_.project_key + "; run `ramws start` first");
      }
      WorkspaceRecord record = *loaded.record;

      std::string snap_err;
      const bool explicit_paths = options.scope.kind == SyncScope::Kind::paths;
      Classification cls = classify_rules(explicit_paths, &snap_err);
      if (!cls.ok) return fail(cls.error, cls.message);
      if (!snap_err.empty()) log_warn("workspace", snap_err);

      // Validate the whole scope before touching anything.
      const PlanResult plan = plan_sync(resolved_, cls, options.direction, options.scope);
      if (!plan.ok) return fail(plan.error, plan.message);

      CommandReport r;
      if (record.in_flight) r.notes.push_back("previous operation was interrupted; dirtiness re-derived");
      auto dirt = derive_dirtiness(resolved_, cls, mirror_, record);
      if (!dirt.ok) return fail(dirt.error, dirt.message);
      record.in_flight.reset();

      // RAM edits a pull would overwrite, per planned source path.
      std::map<std::string, std::uint64_t> ram_changes;
      if (options.direction == Direction::from_disk) {
        for (const auto& op : plan.operations) {
          if (op.role != Role::source) continue;
          ram_changes[op.path] = dirt.count_under(op.rule_path, glob::relative_to(op.path, op.rule_path));
        }
      }

      const GuardDecision guard = check_sync(options.direction, ram_changes, options.force);
      if (!guard.allowed()) {
        log_info("workspace", guard.reason);
        std::string err;
        if (!store_.save(record, &err)) log_warn("workspace", "re-derived state not saved: " + err);
        return denied(guard);
      }
      if (guard.forced_data_loss) {
        log_warn("workspace", "discarding " + std::to_string(guard.changed) + " unsynced RAM change(s) by request");
        r.guard = guard;
        WorkspaceEvent ev;
        ev.name = "workspace.sync.forced";
        ev.project_key = resolved_.project_key;
        ev.role = to_string(Role::source);
        ev.direction = to_string(options.direction);
        ev.ok = true;
        ev.changed = guard.changed;
        emit_workspace_event(ev);
      }

      const ExecutionReport ex = execute_plan(plan.operations, mirror_, store_, record);
      copy_execution(ex, r);
      if (guard.forced_data_loss) audit("sync.from_disk.forced", true, guard, ex.ok, ex.error);
      if (!ex.ok) {
        r.error = ex.error;
        r.message = ex.message;
        return r;
      }
      auto after = derive_dirtiness(resolved_, cls, mirror_, record);
      if (after.ok) {
        std::string err;
        if (!store_.save(record, &err)) r.notes.push_back("re-derived state not saved: " + err);
      } else {
        r.notes.push_back("dirtiness not re-derived after sync: " + after.message);
      }
      r.ok = true;
      r.message = std::to_string(ex.completed.size()) + " operation(s), " + std::to_string(ex.changed) +
                  " path(s) changed";
      return r;
    }();
  }
  emit_command_event("workspace.sync", resolved_.project_key, to_string(options.direction), report, duration_ns);
  return report;
}

CommandReport WorkspaceController::destroy(const DestroyOptions& options) {
  std::uint64_t duration_ns = 0;
  CommandReport report;
  std::string event_name = "workspace.destroy";
  {
    ScopeTimer timer(duration_ns);
    report = [&]() -> CommandReport {
      std::error_code ec;
      if (!fs::exists(resolved_.workspace_root, ec)) {
        CommandReport r;
        r.ok = true;
        r.message = "workspace not found at " + resolved_.workspace_root.string();
        r.notes.push_back("nothing to destroy");
        return r;
      }

      WorkspaceLock lock;
      if (auto l = lock_workspace(lock); !l.ok) return l;

      auto loaded = store_.load(resolved_.project_key);
      if (!loaded.ok && !options.force) {
        return fail(ErrorCode::io_error, loaded.error + "; use --force to remove the workspace anyway");
      }

      CommandReport r;
      GuardDecision guard;
      if (loaded.ok && loaded.record) {
        WorkspaceRecord record = *loaded.record;
        Classification cls = classify_rules(false, nullptr);
        if (!cls.ok) return fail(cls.error, cls.message);
        auto dirt = derive_dirtiness(resolved_, cls, mirror_, record);
        if (!dirt.ok) {
          if (!options.force) return fail(dirt.error, dirt.message + "; use --force to destroy anyway");
          // Unknown state under --force: assume the recorded pending counts.
          r.notes.push_back("dirtiness could not be re-derived: " + dirt.message);
        }
        guard = check_destroy(record, options.force);
        if (!guard.allowed()) {
          log_info("workspace", guard.reason);
          std::string err;
          if (!store_.save(record, &err)) log_warn("workspace", "re-derived state not saved: " + err);
          return denied(guard);
        }
        if (guard.forced_data_loss) {
          log_warn("workspace", "destroying workspace with " + std::to_string(guard.changed) +
                                    " unsynced change(s) discarded");
          event_name = "workspace.destroy.forced";
          r.guard = guard;
        }
      }

      std::string err;
      if (!store_.clear(resolved_.project_key, &err)) {
        if (!options.force) return fail(ErrorCode::io_error, err);
        log_warn("workspace", err);
      }
      fs::remove_all(resolved_.workspace_root, ec);
      const bool removed = !ec;
      audit(options.force ? "destroy.forced" : "destroy", options.force, guard, removed,
            removed ? ErrorCode::none : ErrorCode::io_error);
      if (!removed) {
        return fail(ErrorCode::io_error, "cannot remove " + resolved_.workspace_root.string() + ": " + ec.message());
      }
      r.ok = true;
      r.message = "workspace " + to_string(WorkspaceState::destroyed) + ": " + resolved_.workspace_root.string();
      return r;
    }();
  }
  emit_command_event(event_name, resolved_.project_key, "", report, duration_ns);
  return report;
}

CommandReport init_config(const fs::path& project_root, bool force) {
  const fs::path target = project_root / ".ramws.yml";
  std::error_code ec;
  if (fs::exists(target, ec) && !force) {
    return fail(ErrorCode::configuration_error, target.string() + " already exists; use --force to overwrite");
  }
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) return fail(ErrorCode::io_error, "cannot write " + target.string());
  out << default_config_yaml();
  out.flush();
  if (!out) return fail(ErrorCode::io_error, "short write to " + target.string());
  CommandReport r;
  r.ok = true;
  r.message = "created " + target.string();
  return r;
}

}  // namespace ramws
