#pragma once

// ramws/planner.hpp — Sync planning, plan execution and dirtiness detection.
//
// PLANNING TABLE (role_allows):
//   source   to-disk    RAM -> disk, delete = sync.delete
//   source   from-disk  disk -> RAM, delete = sync.delete
//   cache    from-disk  disk -> RAM, delete = true
//   cache    to-disk    invalid_role
//   scratch  any        invalid_role
//
// Planning validates the whole scope before returning anything: a single
// unknown_path or invalid_role yields no operations at all.
//
// OPERATION FILTERS (relative to the operation path):
//   - the owning rule's includes and excludes, rebased for sub-path scopes
//   - "/<rel>" for every build dir nested below a source operation path
//   - "/<rel>" for every earlier-declared rule nested below the operation path
//   - "/.ramws" when the operation covers the project root
//
// EXECUTION:
//   Operations run in order. The in_flight marker is saved before each one
//   and cleared with its outcome. The first mirror failure halts the plan;
//   completed operations keep their record updates, the rest stay untouched.
//   A completed source operation, in either direction, re-takes the RAM
//   baseline of the synced path, because RAM and disk agree there now.
//
// DIRTINESS:
//   A source rule is dirty when its RAM tree differs from its baseline. Disk
//   edits never count. A rule with no baseline yet (a record from an older
//   build, or a rule added to the config) falls back to a dry-run RAM -> disk
//   reconcile until its next sync.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ramws/classifier.hpp"
#include "ramws/config.hpp"
#include "ramws/manifest.hpp"
#include "ramws/mirror.hpp"
#include "ramws/state_store.hpp"

namespace ramws {

struct SyncScope {
  enum class Kind { roles, paths };
  Kind kind{Kind::roles};
  std::vector<Role> roles{Role::source};
  std::vector<std::string> paths;     // relative to the project root

  static SyncScope for_roles(std::vector<Role> roles);
  static SyncScope for_paths(std::vector<std::string> paths);
};

struct PlanResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  std::vector<MirrorOperation> operations;
};

PlanResult plan_sync(const ResolvedConfig& resolved, const Classification& classification, Direction direction,
                     const SyncScope& scope);

// Rewrites a rule-relative pattern for a transfer rooted `offset` below the
// rule path. Unanchored patterns are returned unchanged; anchored ones lose
// the matched prefix, or nullopt when they cannot apply below `offset`.
std::optional<std::string> rebase_pattern(const std::string& pattern, const std::string& offset);

struct ExecutionReport {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  std::vector<MirrorOperation> completed;
  std::vector<MirrorOperation> unstarted;
  std::optional<MirrorOperation> failed;
  std::uint64_t changed{0};
};

ExecutionReport execute_plan(const std::vector<MirrorOperation>& operations, IMirror& mirror, StateStore& store,
                             WorkspaceRecord& record);

// ---------------------------------------------------------------------------
// Dirtiness detection
// ---------------------------------------------------------------------------
struct DirtinessResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  std::map<std::string, std::uint64_t> pending;                 // rule path -> change count
  std::map<std::string, std::vector<std::string>> changed;      // rule path -> rule-relative paths
  std::uint64_t created{0};
  std::uint64_t updated{0};
  std::uint64_t deleted{0};
  std::uint64_t total() const;
  // Changes of `rule_path` at or below the rule-relative `offset` ("" = all).
  std::uint64_t count_under(const std::string& rule_path, const std::string& offset) const;
};

// Dry-runs each operation and reports what it would change. Over RAM -> disk
// operations this is the status diff summary: it cannot tell which side was
// edited, so it never decides dirtiness for a rule that has a baseline.
DirtinessResult dry_run_changes(const std::vector<MirrorOperation>& operations, IMirror& mirror);

// Re-derives the source SyncRecord of `record` (pending, dirty, state) from
// the RAM baselines, and drops baselines of rules no longer configured.
DirtinessResult derive_dirtiness(const ResolvedConfig& resolved, const Classification& classification,
                                 IMirror& mirror, WorkspaceRecord& record);

}  // namespace ramws
