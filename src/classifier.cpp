#include "ramws/classifier.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <system_error>

#include "ramws/glob.hpp"
#include "ramws/observability.hpp"
#include "ramws/state_store.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

bool check_rule_path(const std::string& raw, const char* kind, std::string& out, std::string& message) {
  if (raw.empty()) {
    message = std::string(kind) + " path is empty";
    return false;
  }
  bool escapes = false;
  out = glob::normalize_relative(raw, &escapes);
  if (escapes) {
    message = std::string(kind) + " path '" + raw + "' is absolute or escapes the project root";
    return false;
  }
  return true;
}

bool holds_rule_path(const RuleSet& rules, const std::string& dir) {
  for (const auto& s : rules.sources) {
    if (glob::is_under(s.path, dir)) return true;
  }
  for (const auto& b : rules.build_dirs) {
    if (glob::is_under(b.path, dir)) return true;
  }
  return false;
}

}  // namespace

RuleSetResult build_rule_set(const WorkspaceConfig& config) {
  RuleSetResult r;
  std::map<std::string, Role> build_roles;

  for (const auto& b : config.build_dirs) {
    std::string path;
    if (!check_rule_path(b.path, "build dir", path, r.message)) {
      r.error = ErrorCode::configuration_error;
      return r;
    }
    if (path == ".") {
      r.error = ErrorCode::configuration_error;
      r.message = "build dir may not be the project root";
      return r;
    }
    if (b.role == Role::source) {
      r.error = ErrorCode::configuration_error;
      r.message = "build dir '" + path + "' must be cache or scratch";
      return r;
    }
    auto it = build_roles.find(path);
    if (it != build_roles.end()) {
      if (it->second != b.role) {
        r.error = ErrorCode::configuration_error;
        r.message = "build dir '" + path + "' is declared as both " + to_string(it->second) + " and " +
                    to_string(b.role);
        return r;
      }
      log_debug("classifier", "duplicate build dir '" + path + "' ignored");
      continue;
    }
    build_roles.emplace(path, b.role);
    r.rules.build_dirs.push_back(BuildDirRule{path, b.role});
  }

  for (const auto& s : config.sources) {
    std::string path;
    if (!check_rule_path(s.path, "source", path, r.message)) {
      r.error = ErrorCode::configuration_error;
      return r;
    }
    auto bit = build_roles.find(path);
    if (bit != build_roles.end()) {
      r.error = ErrorCode::configuration_error;
      r.message = "path '" + path + "' is declared both as a source and as a " + to_string(bit->second) +
                  " build dir";
      return r;
    }
    const bool dup = std::any_of(r.rules.sources.begin(), r.rules.sources.end(),
                                 [&](const SourceRule& seen) { return seen.path == path; });
    if (dup) {
      log_debug("classifier", "duplicate source '" + path + "' ignored; first declaration wins");
      continue;
    }
    SourceRule rule = s;
    rule.path = path;
    r.rules.sources.push_back(std::move(rule));
  }

  r.ok = true;
  return r;
}

PathClass resolve_path(const RuleSet& rules, std::string_view path, bool is_dir) {
  PathClass pc;
  pc.path = std::string(path);
  pc.is_dir = is_dir;

  for (std::size_t i = 0; i < rules.build_dirs.size(); ++i) {
    if (glob::is_under(path, rules.build_dirs[i].path)) {
      pc.role = rules.build_dirs[i].role;
      pc.rule_index = i;
      return pc;
    }
  }
  for (std::size_t i = 0; i < rules.sources.size(); ++i) {
    const auto& rule = rules.sources[i];
    if (!glob::is_under(path, rule.path)) continue;
    const std::string rel = glob::relative_to(path, rule.path);
    if (!rel.empty()) {
      const glob::FilterSet filters{rule.include, rule.exclude};
      if (filters.excluded(rel, is_dir)) return pc;
    }
    pc.role = Role::source;
    pc.rule_index = i;
    return pc;
  }
  return pc;
}

bool source_rule_shadowed(const RuleSet& rules, std::size_t index) {
  const std::string& path = rules.sources[index].path;
  for (const auto& b : rules.build_dirs) {
    if (glob::is_under(path, b.path)) return true;
  }
  for (std::size_t i = 0; i < index; ++i) {
    if (glob::is_under(path, rules.sources[i].path)) return true;
  }
  return false;
}

bool build_dir_shadowed(const RuleSet& rules, std::size_t index) {
  const std::string& path = rules.build_dirs[index].path;
  for (std::size_t i = 0; i < index; ++i) {
    if (glob::is_under(path, rules.build_dirs[i].path)) return true;
  }
  return false;
}

const PathClass* Classification::find(std::string_view path) const {
  auto it = std::lower_bound(paths.begin(), paths.end(), path,
                             [](const PathClass& pc, std::string_view p) { return pc.path < p; });
  if (it == paths.end() || it->path != path) return nullptr;
  return &*it;
}

std::size_t Classification::count(Role role) const {
  return static_cast<std::size_t>(
      std::count_if(tracked.begin(), tracked.end(), [&](const TrackedPath& t) { return t.role == role; }));
}

Classification classify(const WorkspaceConfig& config, const Snapshot& snapshot) {
  Classification c;
  auto rs = build_rule_set(config);
  if (!rs.ok) {
    c.error = rs.error;
    c.message = rs.message;
    return c;
  }
  c.rules = std::move(rs.rules);

  c.paths.reserve(snapshot.size());
  for (const auto& entry : snapshot) {
    PathClass pc = resolve_path(c.rules, entry.path, entry.is_dir);
    if (!pc.role) {
      c.excluded.push_back(pc.path);
    } else if (*pc.role == Role::source) {
      c.tracked.push_back(TrackedPath{pc.path, Role::source, pc.rule_index, pc.is_dir});
    }
    c.paths.push_back(std::move(pc));
  }
  for (std::size_t i = 0; i < c.rules.build_dirs.size(); ++i) {
    if (build_dir_shadowed(c.rules, i)) continue;
    const auto& b = c.rules.build_dirs[i];
    c.tracked.push_back(TrackedPath{b.path, b.role, i, true});
  }
  c.ok = true;
  return c;
}

Snapshot snapshot_tree(const fs::path& root, const RuleSet* rules, std::string* error) {
  Snapshot out;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return out;

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    if (error) *error = "cannot list " + root.string() + ": " + ec.message();
    return out;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const std::string rel = it->path().lexically_relative(root).generic_string();
    std::error_code sec;
    const bool is_dir = fs::is_directory(it->symlink_status(sec));
    if (it.depth() == 0 && rel == StateStore::kMetaDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (rules && is_dir) {
      const PathClass pc = resolve_path(*rules, rel, true);
      const bool build = pc.role && *pc.role != Role::source;
      if (build || (!pc.role && !holds_rule_path(*rules, rel))) it.disable_recursion_pending();
    }
    out.push_back(SnapshotEntry{rel, is_dir});
  }
  if (ec) {
    if (error) *error = "cannot list " + root.string() + ": " + ec.message();
    return {};
  }
  std::sort(out.begin(), out.end(), [](const SnapshotEntry& a, const SnapshotEntry& b) { return a.path < b.path; });
  return out;
}

Snapshot merge_snapshots(const Snapshot& a, const Snapshot& b) {
  Snapshot out;
  out.reserve(a.size() + b.size());
  std::merge(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out),
             [](const SnapshotEntry& x, const SnapshotEntry& y) { return x.path < y.path; });
  out.erase(std::unique(out.begin(), out.end(),
                        [](const SnapshotEntry& x, const SnapshotEntry& y) { return x.path == y.path; }),
            out.end());
  return out;
}

}  // namespace ramws
