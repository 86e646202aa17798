#pragma once

// ramws/observability.hpp — Leveled diagnostics and structured workspace events.
//
// DESIGN:
//   Two channels, both best-effort and never able to fail an operation:
//     - Human diagnostics: "ramws: <level>: [component] message" on stderr,
//       filtered by the process log level (-v / -q, or RAMWS_LOG_LEVEL).
//     - WorkspaceEvent: one JSON object per line appended to the file named by
//       RAMWS_EVENT_LOG, and counted in SessionStats. Events carry metadata
//       only (roles, counts, codes); never file contents.
//
// Each CLI invocation is single-threaded, but SessionStats uses atomics so the
// test harness can exercise it from helper threads.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "ramws/types.hpp"

namespace ramws {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, silent = 4 };

void set_log_level(LogLevel level);
LogLevel log_level();
// Reads RAMWS_LOG_LEVEL (debug|info|warn|error|silent). Unset or unknown
// values leave the current level unchanged.
void init_log_level_from_env();

void log_message(LogLevel level, const std::string& component, const std::string& message);
inline void log_debug(const std::string& c, const std::string& m) { log_message(LogLevel::debug, c, m); }
inline void log_info(const std::string& c, const std::string& m) { log_message(LogLevel::info, c, m); }
inline void log_warn(const std::string& c, const std::string& m) { log_message(LogLevel::warn, c, m); }

// ---------------------------------------------------------------------------
// WorkspaceEvent — per-operation observable unit
// ---------------------------------------------------------------------------
struct WorkspaceEvent {
  std::string name;              // e.g. "workspace.sync", "mirror.operation"
  std::string project_key;
  std::string role;              // empty when not role-specific
  std::string direction;         // empty when not a sync
  std::string path;
  bool ok{false};
  std::string error_code;
  std::uint64_t changed{0};
  std::uint64_t duration_ns{0};
  std::uint64_t timestamp_unix_ms{0};  // stamped by emit_workspace_event
};

std::string event_to_json(const WorkspaceEvent& ev);

// ---------------------------------------------------------------------------
// SessionStats — process-lifetime counters
// ---------------------------------------------------------------------------
struct SessionStats {
  std::atomic<std::uint64_t> events{0};
  std::atomic<std::uint64_t> failures{0};
  std::atomic<std::uint64_t> mirror_operations{0};
  std::atomic<std::uint64_t> paths_changed{0};
  std::atomic<std::uint64_t> event_write_failures{0};

  void record(const WorkspaceEvent& ev);
  std::string to_json() const;
};

SessionStats& global_session_stats();

// Records the event in SessionStats and appends it to RAMWS_EVENT_LOG if set.
void emit_workspace_event(WorkspaceEvent ev);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

// Human-readable byte count ("1.50 GiB").
std::string format_bytes(std::uint64_t bytes);

}  // namespace ramws
