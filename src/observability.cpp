#include "ramws/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "ramws/jsonlite.hpp"

namespace ramws {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::info)};

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
    case LogLevel::silent: return "silent";
  }
  return "";
}

}  // namespace

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void init_log_level_from_env() {
  const char* env = std::getenv("RAMWS_LOG_LEVEL");
  if (!env || !env[0]) return;
  const std::string v(env);
  if (v == "debug") set_log_level(LogLevel::debug);
  else if (v == "info") set_log_level(LogLevel::info);
  else if (v == "warn") set_log_level(LogLevel::warn);
  else if (v == "error") set_log_level(LogLevel::error);
  else if (v == "silent") set_log_level(LogLevel::silent);
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
  if (level == LogLevel::silent) return;
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;
  std::cerr << "ramws: " << level_name(level) << ": [" << component << "] " << message << "\n";
}

std::string event_to_json(const WorkspaceEvent& ev) {
  jsonlite::Object o;
  o["event"] = ev.name;
  o["project_key"] = ev.project_key;
  if (!ev.role.empty()) o["role"] = ev.role;
  if (!ev.direction.empty()) o["direction"] = ev.direction;
  if (!ev.path.empty()) o["path"] = ev.path;
  o["ok"] = ev.ok;
  o["error_code"] = ev.error_code;
  o["changed"] = ev.changed;
  o["duration_ns"] = ev.duration_ns;
  o["timestamp_unix_ms"] = ev.timestamp_unix_ms;
  return jsonlite::to_json(o);
}

void SessionStats::record(const WorkspaceEvent& ev) {
  events.fetch_add(1, std::memory_order_relaxed);
  if (!ev.ok) failures.fetch_add(1, std::memory_order_relaxed);
  if (ev.name == "mirror.operation") mirror_operations.fetch_add(1, std::memory_order_relaxed);
  paths_changed.fetch_add(ev.changed, std::memory_order_relaxed);
}

std::string SessionStats::to_json() const {
  jsonlite::Object o;
  o["events"] = std::uint64_t{events.load(std::memory_order_relaxed)};
  o["failures"] = std::uint64_t{failures.load(std::memory_order_relaxed)};
  o["mirror_operations"] = std::uint64_t{mirror_operations.load(std::memory_order_relaxed)};
  o["paths_changed"] = std::uint64_t{paths_changed.load(std::memory_order_relaxed)};
  o["event_write_failures"] = std::uint64_t{event_write_failures.load(std::memory_order_relaxed)};
  return jsonlite::to_json(o);
}

SessionStats& global_session_stats() {
  static SessionStats inst;
  return inst;
}

void emit_workspace_event(WorkspaceEvent ev) {
  ev.timestamp_unix_ms = now_unix_ms();
  global_session_stats().record(ev);

  // Activation: RAMWS_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("RAMWS_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = event_to_json(ev) + "\n";
  // O_APPEND keeps concurrent short writes from separate processes intact.
  FILE* f = std::fopen(log_path, "a");
  if (!f) {
    global_session_stats().event_write_failures.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
    global_session_stats().event_write_failures.fetch_add(1, std::memory_order_relaxed);
  }
  std::fclose(f);
}

std::string format_bytes(std::uint64_t bytes) {
  static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f %s", value, kUnits[unit]);
  return buf;
}

}  // namespace ramws
