#include "ramws/safety_guard.hpp"

namespace ramws {

namespace {

// Collects the dirty source paths of a record into a decision.
void collect_dirty_sources(const WorkspaceRecord& record, GuardDecision& d) {
  const SyncRecord* src = record.find(Role::source);
  if (!src || !src->dirty) return;
  d.roles.push_back(to_string(Role::source));
  for (const auto& [path, count] : src->pending) {
    if (count == 0) continue;
    d.paths.push_back(path);
    d.changed += count;
  }
}

std::string summarize(const GuardDecision& d) {
  std::string s = std::to_string(d.changed) + " unsynced change" + (d.changed == 1 ? "" : "s");
  if (!d.paths.empty()) {
    s += " in ";
    for (std::size_t i = 0; i < d.paths.size(); ++i) {
      if (i) s += ", ";
      s += d.paths[i];
    }
  }
  return s;
}

}  // namespace

std::string to_string(Verdict v) {
  switch (v) {
    case Verdict::allow: return "allow";
    case Verdict::deny: return "deny";
    case Verdict::ask: return "ask";
  }
  return "unknown";
}

std::string to_string(ExitAction a) {
  switch (a) {
    case ExitAction::none: return "none";
    case ExitAction::sync: return "sync";
    case ExitAction::ask: return "ask";
  }
  return "unknown";
}

GuardDecision check_destroy(const WorkspaceRecord& record, bool force) {
  GuardDecision d;
  collect_dirty_sources(record, d);
  if (d.roles.empty()) return d;
  if (force) {
    d.forced_data_loss = true;
    return d;
  }
  d.verdict = Verdict::deny;
  d.reason = "workspace has " + summarize(d) +
             "; run `ramws sync` first, or `ramws destroy --force` to discard them";
  return d;
}

GuardDecision check_sync(Direction direction, const std::map<std::string, std::uint64_t>& ram_changes, bool force) {
  GuardDecision d;
  if (direction == Direction::to_disk) return d;

  for (const auto& [path, count] : ram_changes) {
    if (count == 0) continue;
    d.paths.push_back(path);
    d.changed += count;
  }
  if (d.paths.empty()) return d;
  d.roles.push_back(to_string(Role::source));
  if (force) {
    d.forced_data_loss = true;
    return d;
  }
  d.verdict = Verdict::deny;
  d.reason = "pulling from disk would discard " + summarize(d) +
             "; run `ramws sync` first, or pass --force to discard them";
  return d;
}

GuardDecision check_start(const WorkspaceRecord& record, bool force) {
  GuardDecision d;
  collect_dirty_sources(record, d);
  if (d.roles.empty()) return d;
  if (force) {
    d.forced_data_loss = true;
    return d;
  }
  d.verdict = Verdict::deny;
  d.reason = "workspace already holds " + summarize(d) +
             "; repopulating from disk would overwrite them. Run `ramws sync` first";
  return d;
}

ExitAction check_exit(ExitPolicy policy, bool dirty, bool noninteractive) {
  if (!dirty) return ExitAction::none;
  switch (policy) {
    case ExitPolicy::never: return ExitAction::none;
    case ExitPolicy::always: return ExitAction::sync;
    case ExitPolicy::ask: return noninteractive ? ExitAction::sync : ExitAction::ask;
  }
  return ExitAction::none;
}

}  // namespace ramws
