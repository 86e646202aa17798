#pragma once

// ramws/safety_guard.hpp — Vets destructive requests against dirty state.
//
// POLICY:
//   destroy            deny while any source SyncRecord is dirty; --force
//                      always proceeds and flags forced_data_loss when dirty
//   sync to-disk       always allowed
//   sync from-disk     deny while the scope holds RAM-side source changes;
//                      --force proceeds and flags forced_data_loss
//   start              deny on a dirty workspace unless forced (repopulating
//                      from disk would overwrite RAM edits)
//   exit (shell)       on_exit policy: never -> none, always -> sync,
//                      ask -> ask (yes when noninteractive); nothing when clean
//
// The guard is pure: callers re-derive dirtiness from the RAM baselines
// before asking, so edits made on disk never count against a request.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "ramws/types.hpp"

namespace ramws {

enum class Verdict { allow, deny, ask };

std::string to_string(Verdict v);

struct GuardDecision {
  Verdict verdict{Verdict::allow};
  std::string reason;                 // set for deny and ask
  std::vector<std::string> roles;     // roles holding unsynced changes
  std::vector<std::string> paths;     // rule or scope paths holding them
  std::uint64_t changed{0};
  bool forced_data_loss{false};       // allowed only because of force

  bool allowed() const { return verdict == Verdict::allow; }
};

GuardDecision check_destroy(const WorkspaceRecord& record, bool force);

// `ram_changes` maps each from-disk scope path to the number of RAM edits
// (changes against the baseline) it would discard. Ignored for to-disk.
GuardDecision check_sync(Direction direction, const std::map<std::string, std::uint64_t>& ram_changes, bool force);

GuardDecision check_start(const WorkspaceRecord& record, bool force);

enum class ExitAction { none, sync, ask };

std::string to_string(ExitAction a);

ExitAction check_exit(ExitPolicy policy, bool dirty, bool noninteractive);

}  // namespace ramws
