#pragma once

// ramws/state_store.hpp — Persistent workspace record and cross-process lock.
//
// LAYOUT (inside the RAM root, so removing the root removes the state):
//   <ram_root>/.ramws/state.json   WorkspaceRecord, JSON, format_version-tagged
//   <ram_root>/.ramws/lock         flock(2) target
//
// INVARIANTS:
//   1. save() is atomic: write to a temp file in .ramws/, then rename().
//      Readers see the old record or the new one, never a partial file.
//   2. load() refuses a record written by a newer STATE_FORMAT_VERSION.
//   3. Mutating callers hold a WorkspaceLock for the whole load-modify-save
//      sequence. The lock is advisory; the store itself does not check it.
//   4. A lock only counts when the locked inode is still the one linked at
//      .ramws/lock. destroy removes the file, so a waiter that wins the flock
//      on the removed inode re-opens the path and locks again.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "ramws/types.hpp"

namespace ramws {

std::string record_to_json(const WorkspaceRecord& record);
// Returns nullopt and sets *error on malformed input.
std::optional<WorkspaceRecord> record_from_json(const std::string& text, std::string* error);

struct LoadResult {
  bool ok{false};                       // false only on a read/parse failure
  std::optional<WorkspaceRecord> record;  // nullopt = NotFound
  std::string error;
};

class StateStore {
 public:
  explicit StateStore(std::filesystem::path ram_root);

  static constexpr const char* kMetaDir = ".ramws";

  LoadResult load(const std::string& project_key) const;
  bool save(const WorkspaceRecord& record, std::string* error);

  // Applies the transition to `record` and persists it.
  bool record_sync(WorkspaceRecord& record, Role role, Direction direction, std::uint64_t timestamp_ms,
                   std::string* error);
  bool mark_dirty(WorkspaceRecord& record, Role role, std::string* error);

  // Removes the state file. Succeeds when there is nothing to remove.
  bool clear(const std::string& project_key, std::string* error);

  const std::filesystem::path& ram_root() const { return ram_root_; }
  std::filesystem::path meta_dir() const { return ram_root_ / kMetaDir; }
  std::filesystem::path state_path() const { return meta_dir() / "state.json"; }
  std::filesystem::path lock_path() const { return meta_dir() / "lock"; }

 private:
  std::filesystem::path ram_root_;
};

// ---------------------------------------------------------------------------
// WorkspaceLock — exclusive flock on <ram_root>/.ramws/lock
// ---------------------------------------------------------------------------
// Move-only RAII handle; the lock is released when the handle is destroyed.
class WorkspaceLock {
 public:
  WorkspaceLock() = default;
  ~WorkspaceLock();
  WorkspaceLock(WorkspaceLock&& other) noexcept;
  WorkspaceLock& operator=(WorkspaceLock&& other) noexcept;
  WorkspaceLock(const WorkspaceLock&) = delete;
  WorkspaceLock& operator=(const WorkspaceLock&) = delete;

  struct Outcome {
    bool acquired{false};
    ErrorCode error{ErrorCode::none};   // workspace_busy or io_error
    std::string message;
  };

  // Polls LOCK_EX|LOCK_NB until acquired or timeout_ms elapses.
  // Creates the .ramws directory (and the lock file) when needed.
  static Outcome acquire(const std::filesystem::path& ram_root, std::uint64_t timeout_ms, WorkspaceLock& out);

  // Single non-blocking attempt; never creates anything.
  static Outcome try_acquire(const std::filesystem::path& ram_root, WorkspaceLock& out);

  bool held() const { return fd_ >= 0; }
  void release();

 private:
  int fd_{-1};
};

}  // namespace ramws
