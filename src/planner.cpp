#include "ramws/planner.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <tuple>

#include "ramws/glob.hpp"
#include "ramws/observability.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

std::string under(const fs::path& root, const std::string& rel) {
  if (rel == ".") return root.string();
  return (root / rel).string();
}

std::vector<std::string> split_components(std::string_view path) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    if (slash == std::string_view::npos) slash = path.size();
    if (slash > start) out.emplace_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return out;
}

void add_anchored_exclude(MirrorOperation& op, const std::string& nested) {
  const std::string pattern = "/" + glob::relative_to(nested, op.path);
  if (std::find(op.excludes.begin(), op.excludes.end(), pattern) == op.excludes.end()) {
    op.excludes.push_back(pattern);
  }
}

MirrorOperation make_operation(const ResolvedConfig& resolved, const RuleSet& rules, Role role, std::size_t index,
                               const std::string& path, bool is_dir, Direction direction) {
  MirrorOperation op;
  op.role = role;
  op.direction = direction;
  op.path = path;
  op.is_dir = is_dir;

  const std::string ram = under(resolved.workspace_root, path);
  const std::string disk = under(resolved.project_root, path);
  op.from = direction == Direction::to_disk ? ram : disk;
  op.to = direction == Direction::to_disk ? disk : ram;

  if (path == ".") op.excludes.push_back(std::string("/") + StateStore::kMetaDir);

  if (role == Role::source) {
    const SourceRule& rule = rules.sources[index];
    op.rule_path = rule.path;
    op.delete_mirroring = resolved.config.sync.delete_mirroring;
    const std::string offset = glob::relative_to(path, rule.path);
    for (const auto& inc : rule.include) {
      auto p = offset.empty() ? std::optional<std::string>(inc) : rebase_pattern(inc, offset);
      if (p) op.includes.push_back(*p);
    }
    for (const auto& exc : rule.exclude) {
      auto p = offset.empty() ? std::optional<std::string>(exc) : rebase_pattern(exc, offset);
      if (p) op.excludes.push_back(*p);
    }
    for (const auto& b : rules.build_dirs) {
      if (b.path != path && glob::is_under(b.path, path)) add_anchored_exclude(op, b.path);
    }
    for (std::size_t j = 0; j < index; ++j) {
      const auto& other = rules.sources[j].path;
      if (other != path && glob::is_under(other, path)) add_anchored_exclude(op, other);
    }
  } else {
    op.rule_path = rules.build_dirs[index].path;
    op.delete_mirroring = true;
    for (std::size_t j = 0; j < index; ++j) {
      const auto& other = rules.build_dirs[j].path;
      if (other != path && glob::is_under(other, path)) add_anchored_exclude(op, other);
    }
  }
  return op;
}

PlanResult plan_failure(ErrorCode code, std::string message) {
  PlanResult r;
  r.error = code;
  r.message = std::move(message);
  return r;
}

std::string role_refusal(Role role, Direction direction) {
  if (role == Role::scratch) {
    return "scratch paths live only in RAM and are never synced";
  }
  return to_string(role) + " paths cannot be synced " + to_string(direction) + "; caches are pull-only";
}

// Re-takes the RAM baseline of a completed source operation. A whole-rule
// operation replaces the rule's manifest; a sub-path operation replaces the
// entries at and below its path, and only when the rule already has one.
void refresh_baseline(const MirrorOperation& op, SyncRecord& sr) {
  auto found = sr.baseline.find(op.rule_path);
  if (!op.covers_whole_rule() && found == sr.baseline.end()) return;

  const std::string offset = glob::relative_to(op.path, op.rule_path);
  const std::string& ram = op.direction == Direction::to_disk ? op.from : op.to;
  const TreeManifest* previous = found == sr.baseline.end() ? nullptr : &found->second;
  ManifestScan scan = scan_tree(ram, glob::FilterSet{op.includes, op.excludes}, offset, previous);
  if (!scan.ok) {
    log_warn("planner", "cannot record RAM baseline of " + op.rule_path + ": " + scan.error);
    sr.baseline.erase(op.rule_path);
    return;
  }
  if (op.covers_whole_rule()) {
    sr.baseline[op.rule_path] = std::move(scan.entries);
    return;
  }

  TreeManifest& base = found->second;
  std::erase_if(base, [&](const auto& entry) { return in_subtree(entry.first, offset); });
  base.merge(scan.entries);
  // Directories between the rule root and the synced path may have been
  // created by a pull.
  fs::path dir(ram);
  std::string key = offset;
  while (!key.empty()) {
    const auto slash = key.rfind('/');
    key = slash == std::string::npos ? std::string() : key.substr(0, slash);
    dir = dir.parent_path();
    std::error_code ec;
    if (!base.contains(key) && fs::is_directory(dir, ec)) base[key] = FileStamp{'d', 0, 0, {}};
  }
}

}  // namespace

SyncScope SyncScope::for_roles(std::vector<Role> roles) {
  SyncScope s;
  s.kind = Kind::roles;
  s.roles = std::move(roles);
  return s;
}

SyncScope SyncScope::for_paths(std::vector<std::string> paths) {
  SyncScope s;
  s.kind = Kind::paths;
  s.roles.clear();
  s.paths = std::move(paths);
  return s;
}

std::optional<std::string> rebase_pattern(const std::string& pattern, const std::string& offset) {
  if (pattern.empty() || pattern.front() != '/') return pattern;

  std::string body = pattern.substr(1);
  const bool dir_only = !body.empty() && body.back() == '/';
  if (dir_only) body.pop_back();
  const auto pcomps = split_components(body);
  const auto ocomps = split_components(offset);

  std::size_t i = 0;
  for (; i < ocomps.size(); ++i) {
    if (i >= pcomps.size()) return std::nullopt;
    if (pcomps[i].find("**") != std::string::npos) break;
    if (!glob::match(pcomps[i], ocomps[i], true)) return std::nullopt;
  }
  if (i >= pcomps.size()) return std::nullopt;

  std::string out;
  for (std::size_t k = i; k < pcomps.size(); ++k) {
    out += "/";
    out += pcomps[k];
  }
  if (dir_only) out += "/";
  return out;
}

PlanResult plan_sync(const ResolvedConfig& resolved, const Classification& classification, Direction direction,
                     const SyncScope& scope) {
  if (!classification.ok) return plan_failure(classification.error, classification.message);
  const RuleSet& rules = classification.rules;
  PlanResult r;

  if (scope.kind == SyncScope::Kind::roles) {
    bool want_source = false;
    bool want_cache = false;
    for (Role role : scope.roles) {
      if (!role_allows(role, direction)) return plan_failure(ErrorCode::invalid_role, role_refusal(role, direction));
      if (role == Role::source) want_source = true;
      if (role == Role::cache) want_cache = true;
    }
    if (want_source) {
      for (std::size_t i = 0; i < rules.sources.size(); ++i) {
        if (source_rule_shadowed(rules, i)) {
          log_warn("planner", "source '" + rules.sources[i].path + "' is covered by an earlier rule; skipped");
          continue;
        }
        r.operations.push_back(
            make_operation(resolved, rules, Role::source, i, rules.sources[i].path, true, direction));
      }
    }
    if (want_cache) {
      for (std::size_t i = 0; i < rules.build_dirs.size(); ++i) {
        const auto& b = rules.build_dirs[i];
        if (b.role != Role::cache) continue;
        if (build_dir_shadowed(rules, i)) {
          log_warn("planner", "build dir '" + b.path + "' is covered by an earlier build dir; skipped");
          continue;
        }
        r.operations.push_back(make_operation(resolved, rules, Role::cache, i, b.path, true, direction));
      }
    }
    r.ok = true;
    return r;
  }

  // Explicit paths: validate everything first, then order by owning rule.
  std::vector<std::tuple<std::size_t, std::string, PathClass>> picked;
  for (const auto& raw : scope.paths) {
    bool escapes = false;
    const std::string norm = raw.empty() ? std::string() : glob::normalize_relative(raw, &escapes);
    if (raw.empty() || escapes) {
      return plan_failure(ErrorCode::unknown_path, "path '" + raw + "' is outside the project root");
    }
    const PathClass* known = classification.find(norm);
    PathClass pc = known ? *known : resolve_path(rules, norm, true);
    if (!pc.role) {
      return plan_failure(ErrorCode::unknown_path, "path '" + norm + "' is not tracked by any rule");
    }
    const bool source = *pc.role == Role::source;
    const std::string& rule_path = source ? rules.sources[pc.rule_index].path : rules.build_dirs[pc.rule_index].path;
    if (!known && source && norm != rule_path) {
      return plan_failure(ErrorCode::unknown_path, "path '" + norm + "' exists neither in the workspace nor on disk");
    }
    if (!role_allows(*pc.role, direction)) {
      return plan_failure(ErrorCode::invalid_role, "'" + norm + "': " + role_refusal(*pc.role, direction));
    }
    const std::size_t rank = source ? pc.rule_index : rules.sources.size() + pc.rule_index;
    picked.emplace_back(rank, norm, std::move(pc));
  }

  std::sort(picked.begin(), picked.end(),
            [](const auto& a, const auto& b) { return std::tie(std::get<0>(a), std::get<1>(a)) <
                                                      std::tie(std::get<0>(b), std::get<1>(b)); });
  for (std::size_t k = 0; k < picked.size(); ++k) {
    const std::size_t rank = std::get<0>(picked[k]);
    const std::string& path = std::get<1>(picked[k]);
    const PathClass& pc = std::get<2>(picked[k]);
    // Skip duplicates and paths inside an already planned path of the same rule.
    const bool covered = std::any_of(picked.begin(), picked.begin() + static_cast<std::ptrdiff_t>(k),
                                     [&](const auto& prev) {
                                       return std::get<0>(prev) == rank && glob::is_under(path, std::get<1>(prev));
                                     });
    if (covered) continue;
    r.operations.push_back(make_operation(resolved, rules, *pc.role, pc.rule_index, path, pc.is_dir, direction));
  }
  r.ok = true;
  return r;
}

ExecutionReport execute_plan(const std::vector<MirrorOperation>& operations, IMirror& mirror, StateStore& store,
                             WorkspaceRecord& record) {
  ExecutionReport report;
  for (std::size_t i = 0; i < operations.size(); ++i) {
    const MirrorOperation& op = operations[i];
    auto stop = [&](ErrorCode code, std::string message, bool started) {
      report.error = code;
      report.message = std::move(message);
      if (started) report.failed = op;
      report.unstarted.assign(operations.begin() + static_cast<std::ptrdiff_t>(i + (started ? 1 : 0)),
                              operations.end());
      return report;
    };

    record.in_flight = InFlightOp{op.role, op.direction, op.rule_path, now_unix_ms()};
    std::string err;
    if (!store.save(record, &err)) return stop(ErrorCode::io_error, err, false);

    WorkspaceEvent ev;
    ev.name = "mirror.operation";
    ev.project_key = record.project_key;
    ev.role = to_string(op.role);
    ev.direction = to_string(op.direction);
    ev.path = op.path;

    MirrorResult result;
    {
      ScopeTimer timer(ev.duration_ns);
      std::error_code ec;
      if (!fs::exists(fs::symlink_status(op.from, ec))) {
        if (op.direction == Direction::from_disk) {
          log_warn("planner", "'" + op.path + "' does not exist on disk; nothing to pull");
          result.ok = true;
          if (op.is_dir) {
            fs::create_directories(op.to, ec);
            if (ec) {
              result.ok = false;
              result.error = "cannot create " + op.to + ": " + ec.message();
            }
          }
        } else {
          result.error = "'" + op.path + "' is missing from the workspace";
        }
      } else {
        MirrorRequest req;
        req.source_root = op.from;
        req.dest_root = op.to;
        req.includes = op.includes;
        req.excludes = op.excludes;
        req.delete_mirroring = op.delete_mirroring;
        result = mirror.reconcile(req);
      }
    }
    ev.ok = result.ok;
    ev.changed = result.changed();
    if (!result.ok) ev.error_code = to_string(ErrorCode::mirror_failure);
    emit_workspace_event(ev);

    record.in_flight.reset();
    if (!result.ok) {
      std::string save_err;
      if (!store.save(record, &save_err)) log_warn("planner", "cannot clear in-flight marker: " + save_err);
      return stop(ErrorCode::mirror_failure, "mirror failed for " + describe(op) + ": " + result.error, true);
    }

    if (op.role == Role::source) {
      SyncRecord& sr = record.record(Role::source);
      refresh_baseline(op, sr);
      // A sub-path leaves the rest of its rule as it was; callers re-derive.
      if (op.covers_whole_rule()) sr.pending.erase(op.rule_path);
      sr.dirty = sr.pending_total() > 0;
      record.refresh_state();
    }
    if (!store.record_sync(record, op.role, op.direction, now_unix_ms(), &err)) {
      report.completed.push_back(op);
      report.changed += result.changed();
      report.error = ErrorCode::io_error;
      report.message = err;
      report.unstarted.assign(operations.begin() + static_cast<std::ptrdiff_t>(i + 1), operations.end());
      return report;
    }
    log_debug("planner", describe(op) + ": " + std::to_string(result.changed()) + " changed");
    report.completed.push_back(op);
    report.changed += result.changed();
  }
  report.ok = true;
  return report;
}

std::uint64_t DirtinessResult::total() const {
  std::uint64_t t = 0;
  for (const auto& [path, count] : pending) t += count;
  return t;
}

std::uint64_t DirtinessResult::count_under(const std::string& rule_path, const std::string& offset) const {
  auto it = changed.find(rule_path);
  if (it == changed.end()) return 0;
  return static_cast<std::uint64_t>(std::count_if(it->second.begin(), it->second.end(),
                                                  [&](const std::string& p) { return in_subtree(p, offset); }));
}

DirtinessResult dry_run_changes(const std::vector<MirrorOperation>& operations, IMirror& mirror) {
  DirtinessResult r;
  for (const auto& op : operations) {
    auto& paths = r.changed[op.rule_path];
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(op.from, ec))) {
      // The whole origin is gone: one deletion if the other side still has it.
      const bool other_exists = fs::exists(fs::symlink_status(op.to, ec));
      r.pending[op.rule_path] += other_exists ? 1 : 0;
      if (other_exists) {
        ++r.deleted;
        paths.push_back(glob::relative_to(op.path, op.rule_path));
      }
      continue;
    }
    MirrorRequest req;
    req.source_root = op.from;
    req.dest_root = op.to;
    req.includes = op.includes;
    req.excludes = op.excludes;
    req.delete_mirroring = op.delete_mirroring;
    req.dry_run = true;
    const MirrorResult res = mirror.reconcile(req);
    if (!res.ok) {
      r.error = ErrorCode::mirror_failure;
      r.message = "dry-run failed for " + describe(op) + ": " + res.error;
      return r;
    }
    r.pending[op.rule_path] += res.changed();
    r.created += res.created.size();
    r.updated += res.updated.size();
    r.deleted += res.deleted.size();
    const std::string offset = glob::relative_to(op.path, op.rule_path);
    for (const auto* list : {&res.created, &res.updated, &res.deleted}) {
      for (const auto& p : *list) paths.push_back(offset.empty() ? p : offset + "/" + p);
    }
  }
  r.ok = true;
  return r;
}

DirtinessResult derive_dirtiness(const ResolvedConfig& resolved, const Classification& classification,
                                 IMirror& mirror, WorkspaceRecord& record) {
  DirtinessResult r;
  const PlanResult plan = plan_sync(resolved, classification, Direction::to_disk, SyncScope::for_roles({Role::source}));
  if (!plan.ok) {
    r.error = plan.error;
    r.message = plan.message;
    return r;
  }

  SyncRecord& sr = record.record(Role::source);
  std::vector<MirrorOperation> without_baseline;
  std::map<std::string, TreeManifest> kept;
  for (const auto& op : plan.operations) {
    auto it = sr.baseline.find(op.rule_path);
    if (it == sr.baseline.end()) {
      without_baseline.push_back(op);
      continue;
    }
    const ManifestScan scan = scan_tree(op.from, glob::FilterSet{op.includes, op.excludes}, "", &it->second);
    if (!scan.ok) {
      r.error = ErrorCode::io_error;
      r.message = "cannot scan " + op.from + ": " + scan.error;
      return r;
    }
    ManifestDiff diff = diff_manifest(it->second, scan.entries);
    r.pending[op.rule_path] = diff.total();
    r.created += diff.created.size();
    r.updated += diff.updated.size();
    r.deleted += diff.deleted.size();
    auto& paths = r.changed[op.rule_path];
    for (auto* list : {&diff.created, &diff.updated, &diff.deleted}) {
      paths.insert(paths.end(), list->begin(), list->end());
    }
    kept[op.rule_path] = std::move(it->second);
  }

  if (!without_baseline.empty()) {
    log_debug("planner", std::to_string(without_baseline.size()) + " source rule(s) have no RAM baseline; using a dry run");
    DirtinessResult dry = dry_run_changes(without_baseline, mirror);
    if (!dry.ok) return dry;
    for (auto& [rule, count] : dry.pending) r.pending[rule] = count;
    for (auto& [rule, paths] : dry.changed) r.changed[rule] = std::move(paths);
    r.created += dry.created;
    r.updated += dry.updated;
    r.deleted += dry.deleted;
  }

  sr.baseline = std::move(kept);
  sr.pending.clear();
  for (const auto& [path, count] : r.pending) {
    if (count > 0) sr.pending[path] = count;
  }
  sr.dirty = sr.pending_total() > 0;
  record.refresh_state();
  r.ok = true;
  return r;
}

}  // namespace ramws
