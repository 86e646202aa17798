#include "ramws/types.hpp"

#include <chrono>
#include <utility>

namespace ramws {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::configuration_error: return "configuration_error";
    case ErrorCode::unknown_path: return "unknown_path";
    case ErrorCode::invalid_role: return "invalid_role";
    case ErrorCode::workspace_busy: return "workspace_busy";
    case ErrorCode::denied_by_safety_guard: return "denied_by_safety_guard";
    case ErrorCode::mirror_failure: return "mirror_failure";
    case ErrorCode::workspace_missing: return "workspace_missing";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::usage_error: return "usage_error";
  }
  return "";
}

int exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return 0;
    case ErrorCode::io_error: return 1;
    case ErrorCode::configuration_error: return 2;
    case ErrorCode::unknown_path: return 3;
    case ErrorCode::invalid_role: return 4;
    case ErrorCode::workspace_busy: return 5;
    case ErrorCode::denied_by_safety_guard: return 6;
    case ErrorCode::mirror_failure: return 7;
    case ErrorCode::workspace_missing: return 8;
    case ErrorCode::usage_error: return 64;
  }
  return 1;
}

std::string to_string(Role role) {
  switch (role) {
    case Role::source: return "source";
    case Role::cache: return "cache";
    case Role::scratch: return "scratch";
  }
  return "";
}

std::string to_string(Direction direction) {
  switch (direction) {
    case Direction::to_disk: return "to-disk";
    case Direction::from_disk: return "from-disk";
  }
  return "";
}

std::string to_string(WorkspaceState state) {
  switch (state) {
    case WorkspaceState::uninitialized: return "uninitialized";
    case WorkspaceState::populated: return "populated";
    case WorkspaceState::dirty: return "dirty";
    case WorkspaceState::destroyed: return "destroyed";
  }
  return "";
}

std::string to_string(ExitPolicy policy) {
  switch (policy) {
    case ExitPolicy::ask: return "ask";
    case ExitPolicy::always: return "always";
    case ExitPolicy::never: return "never";
  }
  return "";
}

std::optional<Role> parse_role(std::string_view text) {
  if (text == "source") return Role::source;
  if (text == "cache") return Role::cache;
  if (text == "scratch") return Role::scratch;
  return std::nullopt;
}

std::optional<Direction> parse_direction(std::string_view text) {
  if (text == "to-disk") return Direction::to_disk;
  if (text == "from-disk") return Direction::from_disk;
  return std::nullopt;
}

std::optional<WorkspaceState> parse_workspace_state(std::string_view text) {
  if (text == "uninitialized") return WorkspaceState::uninitialized;
  if (text == "populated") return WorkspaceState::populated;
  if (text == "dirty") return WorkspaceState::dirty;
  if (text == "destroyed") return WorkspaceState::destroyed;
  return std::nullopt;
}

std::optional<ExitPolicy> parse_exit_policy(std::string_view text) {
  if (text == "ask") return ExitPolicy::ask;
  if (text == "always" || text == "auto") return ExitPolicy::always;
  if (text == "never") return ExitPolicy::never;
  return std::nullopt;
}

bool role_allows(Role role, Direction direction) {
  switch (role) {
    case Role::source: return true;
    case Role::cache: return direction == Direction::from_disk;
    case Role::scratch: return false;
  }
  return false;
}

std::uint64_t SyncRecord::pending_total() const {
  std::uint64_t total = 0;
  for (const auto& [path, count] : pending) total += count;
  return total;
}

const SyncRecord* WorkspaceRecord::find(Role role) const {
  auto it = roles.find(role);
  return it == roles.end() ? nullptr : &it->second;
}

bool WorkspaceRecord::any_source_dirty() const {
  const SyncRecord* rec = find(Role::source);
  return rec != nullptr && rec->dirty;
}

void WorkspaceRecord::refresh_state() {
  if (state != WorkspaceState::populated && state != WorkspaceState::dirty) return;
  state = any_source_dirty() ? WorkspaceState::dirty : WorkspaceState::populated;
}

std::string describe(const MirrorOperation& op) {
  return to_string(op.role) + " " + to_string(op.direction) + " " + op.path;
}

OpResult OpResult::success(std::string message) {
  OpResult r;
  r.ok = true;
  r.message = std::move(message);
  return r;
}

OpResult OpResult::failure(ErrorCode code, std::string message) {
  OpResult r;
  r.ok = false;
  r.error = code;
  r.message = std::move(message);
  return r;
}

std::uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

}  // namespace ramws
