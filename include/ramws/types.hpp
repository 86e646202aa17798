#pragma once

// ramws/types.hpp — Core data structures for the ramws workspace sync engine.
//
// ARCHITECTURE NOTES:
//
// STATE OWNERSHIP:
//   - WorkspaceRecord is the only persisted structure. It lives in
//     <ram_root>/.ramws/state.json and is owned by the StateStore for the
//     duration of one CLI invocation. There is no process-wide workspace state.
//   - TrackedPath and MirrorOperation are derived per operation and never stored.
//
// ROLE TABLE:
//   Role is a closed set. role_allows() is the single permitted-operation table
//   consulted by the planner; adding a role requires extending that switch.
//
//     role     | to_disk | from_disk
//     ---------+---------+----------
//     source   |   yes   |   yes
//     cache    |   no    |   yes (always delete-mirroring)
//     scratch  |   no    |   no
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - No raw pointer members in any public API type.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ramws {

enum class ErrorCode {
  none,
  configuration_error,
  unknown_path,
  invalid_role,
  workspace_busy,
  denied_by_safety_guard,
  mirror_failure,
  workspace_missing,
  io_error,
  usage_error,
};

std::string to_string(ErrorCode code);

// Process exit status reported by the CLI for a given error. Distinct per
// error class so scripts can branch on it.
int exit_code_for(ErrorCode code);

enum class Role { source, cache, scratch };
enum class Direction { to_disk, from_disk };
enum class WorkspaceState { uninitialized, populated, dirty, destroyed };
enum class ExitPolicy { ask, always, never };

std::string to_string(Role role);
std::string to_string(Direction direction);
std::string to_string(WorkspaceState state);
std::string to_string(ExitPolicy policy);

std::optional<Role> parse_role(std::string_view text);
std::optional<Direction> parse_direction(std::string_view text);
std::optional<WorkspaceState> parse_workspace_state(std::string_view text);
// Accepts "auto" as an alias of "always".
std::optional<ExitPolicy> parse_exit_policy(std::string_view text);

// Permitted-operation table. Exhaustive over Role x Direction.
bool role_allows(Role role, Direction direction);

// ---------------------------------------------------------------------------
// Configuration rules (immutable once loaded)
// ---------------------------------------------------------------------------
struct SourceRule {
  std::string path;                  // normalized, relative to project root; "." = root
  std::vector<std::string> include;  // re-include patterns, evaluated before excludes
  std::vector<std::string> exclude;
};

struct BuildDirRule {
  std::string path;
  Role role{Role::scratch};          // cache or scratch
};

// ---------------------------------------------------------------------------
// TrackedPath — one resolved path and its role for a single operation
// ---------------------------------------------------------------------------
struct TrackedPath {
  std::string path;                  // relative to project root
  Role role{Role::source};
  std::size_t rule_index{0};         // index into sources or build_dirs, by role
  bool is_dir{false};
};

// ---------------------------------------------------------------------------
// FileStamp / TreeManifest — RAM-side baseline of one source rule
// ---------------------------------------------------------------------------
// Taken from the RAM tree after every successful source mirror operation, when
// RAM and disk agree. A RAM entry that no longer matches its stamp is an
// unsynced RAM edit. Edits made on the disk side never touch the baseline.
struct FileStamp {
  char kind{'f'};                    // 'f' file, 'd' directory, 'l' symlink
  std::uint64_t size{0};
  std::uint64_t mtime{0};            // file_time_type tick count, stored as raw bits
  std::string digest;                // BLAKE3 hex for files, target for symlinks

  // Content identity; mtime only decides whether the digest must be recomputed.
  bool same_content(const FileStamp& other) const {
    return kind == other.kind && size == other.size && digest == other.digest;
  }
};

// rule-relative path ("" = the rule root itself) -> stamp
using TreeManifest = std::map<std::string, FileStamp>;

// ---------------------------------------------------------------------------
// SyncRecord — per-role sync metadata
// ---------------------------------------------------------------------------
struct SyncRecord {
  std::uint64_t last_to_disk_ms{0};
  std::uint64_t last_from_disk_ms{0};
  bool dirty{false};
  // rule path -> number of RAM-side changes against the baseline.
  std::map<std::string, std::uint64_t> pending;
  // rule path -> RAM tree as of the last sync of that rule (source role only).
  std::map<std::string, TreeManifest> baseline;

  std::uint64_t pending_total() const;
};

// Marker written before a mirror operation starts and removed after its
// outcome is recorded. A marker found on load means the previous invocation
// was interrupted and the record must not be trusted for that role.
struct InFlightOp {
  Role role{Role::source};
  Direction direction{Direction::to_disk};
  std::string rule_path;
  std::uint64_t started_at_ms{0};
};

struct WorkspaceRecord {
  std::string project_key;
  std::string project_root;
  std::string ram_root;
  WorkspaceState state{WorkspaceState::uninitialized};
  std::uint64_t created_at_ms{0};
  std::map<Role, SyncRecord> roles;
  std::optional<InFlightOp> in_flight;

  SyncRecord& record(Role role) { return roles[role]; }
  const SyncRecord* find(Role role) const;
  bool any_source_dirty() const;
  // Recomputes state from the source SyncRecord (Populated <-> Dirty).
  void refresh_state();
};

// ---------------------------------------------------------------------------
// MirrorOperation — one planned reconciliation of a subtree
// ---------------------------------------------------------------------------
struct MirrorOperation {
  Role role{Role::source};
  Direction direction{Direction::to_disk};
  std::string rule_path;             // configured rule this operation belongs to
  std::string path;                  // synced path, equal to rule_path or inside it
  std::string from;                  // absolute origin root
  std::string to;                    // absolute destination root
  std::vector<std::string> includes;
  std::vector<std::string> excludes;
  bool delete_mirroring{false};
  bool is_dir{true};

  bool covers_whole_rule() const { return path == rule_path; }
};

std::string describe(const MirrorOperation& op);

// Generic outcome of a controller operation.
struct OpResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;

  static OpResult success(std::string message = {});
  static OpResult failure(ErrorCode code, std::string message);
};

std::uint64_t now_unix_ms();

}  // namespace ramws
