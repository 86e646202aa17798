#pragma once

// ramws/workspace.hpp — Workspace lifecycle controller.
//
// Every mutating command follows the same sequence:
//   lock -> load record -> classify -> re-derive dirtiness -> safety guard
//   -> plan -> execute -> save -> event (+ audit for destructive actions)
// The lock is held for the whole command and released by RAII on return.
//
// `status` never blocks: it tries the lock once and, if another invocation
// holds it, reports from a read-only view with possibly_stale = true.

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ramws/classifier.hpp"
#include "ramws/config.hpp"
#include "ramws/mirror.hpp"
#include "ramws/planner.hpp"
#include "ramws/safety_guard.hpp"
#include "ramws/state_store.hpp"

namespace ramws {

// ---------------------------------------------------------------------------
// Filesystem inspection for the RAM root
// ---------------------------------------------------------------------------
struct FsStatus {
  bool ok{false};
  std::string error;
  std::string inspected_path;    // RAM root, or its nearest existing ancestor
  std::string fs_type;        // "tmpfs", "ramfs", or "0x<magic>"
  bool is_volatile{false};
  std::uint64_t total_bytes{0};
  std::uint64_t used_bytes{0};
  std::uint64_t available_bytes{0};
};

FsStatus inspect_filesystem(const std::filesystem::path& path);

// ---------------------------------------------------------------------------
// Command reports
// ---------------------------------------------------------------------------
struct CommandReport {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  std::uint64_t changed{0};
  std::vector<std::string> completed;   // describe(op) of finished operations
  std::vector<std::string> unstarted;
  std::vector<std::string> notes;       // non-fatal observations
  std::optional<GuardDecision> guard;   // set when the safety guard spoke

  std::string to_json() const;
};

struct RoleStatus {
  Role role{Role::source};
  bool dirty{false};
  std::uint64_t pending{0};
  std::map<std::string, std::uint64_t> pending_paths;
  std::uint64_t last_to_disk_ms{0};
  std::uint64_t last_from_disk_ms{0};
};

struct StatusReport {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;

  std::string project_key;
  std::string project_root;
  std::string workspace_root;
  std::string config_path;
  bool exists{false};
  WorkspaceState state{WorkspaceState::uninitialized};
  FsStatus fs;
  std::vector<RoleStatus> roles;
  ExitPolicy on_exit{ExitPolicy::ask};
  std::string mirror_backend;
  std::size_t source_rules{0};
  std::size_t cache_dirs{0};
  std::size_t scratch_dirs{0};
  std::uint64_t diff_created{0};
  std::uint64_t diff_updated{0};
  std::uint64_t diff_deleted{0};
  bool possibly_stale{false};
  bool interrupted{false};
  std::optional<InFlightOp> in_flight;
  std::vector<std::string> notes;

  const RoleStatus* find(Role role) const;
  bool source_dirty() const;
  std::string to_json() const;
  std::string to_text() const;
};

struct StartOptions {
  bool refresh_sources_only{false};
  bool force{false};
};

struct SyncOptions {
  Direction direction{Direction::to_disk};
  SyncScope scope;
  bool force{false};
};

struct DestroyOptions {
  bool force{false};
};

// ---------------------------------------------------------------------------
// WorkspaceController
// ---------------------------------------------------------------------------
// `mirror` must outlive the controller.
class WorkspaceController {
 public:
  WorkspaceController(ResolvedConfig resolved, IMirror& mirror);

  CommandReport start(const StartOptions& options);
  StatusReport status();
  CommandReport sync(const SyncOptions& options);
  CommandReport destroy(const DestroyOptions& options);

  // True when the RAM root holds a workspace record.
  bool started() const;

  const ResolvedConfig& resolved() const { return resolved_; }

 private:
  CommandReport lock_workspace(WorkspaceLock& lock);
  Classification classify_rules(bool with_snapshot, std::string* error) const;
  void audit(const std::string& action, bool forced, const GuardDecision& guard, bool ok,
             ErrorCode error) const;

  ResolvedConfig resolved_;
  IMirror& mirror_;
  StateStore store_;
};

// Writes the default .ramws.yml into `project_root`. Refuses to overwrite an
// existing file unless `force`.
CommandReport init_config(const std::filesystem::path& project_root, bool force);

}  // namespace ramws
