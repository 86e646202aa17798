#pragma once

// ramws/classifier.hpp — Role resolution for every path under the project root.
//
// RESOLUTION ORDER (first match wins):
//   1. Build directory rules, in declaration order. A build dir claims its
//      whole subtree regardless of contents.
//   2. Source rules, in declaration order. The first source rule whose path
//      contains the candidate claims it; that rule's filters then decide
//      whether the candidate is tracked or excluded. There is no fall-through
//      to a later source rule.
//   3. Anything else is excluded (untracked).
//
// A rule whose whole path is claimed by an earlier rule is "shadowed": it
// never owns a path and the planner skips it.
//
// Everything here is pure except snapshot_tree(), which only reads.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ramws/config.hpp"
#include "ramws/types.hpp"

namespace ramws {

struct SnapshotEntry {
  std::string path;   // relative, '/'-separated
  bool is_dir{false};
};

// Sorted by path, unique.
using Snapshot = std::vector<SnapshotEntry>;

// Rules after conflict checking and de-duplication. Rule indices in
// TrackedPath and PathClass refer into these vectors.
struct RuleSet {
  std::vector<SourceRule> sources;
  std::vector<BuildDirRule> build_dirs;
};

struct RuleSetResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  RuleSet rules;
};

// Fails with configuration_error when a source path equals a build dir path,
// when one build dir path is declared with both types, or when a rule path
// is empty, absolute or escapes the project root. Same-role duplicates are
// dropped (first declaration wins).
RuleSetResult build_rule_set(const WorkspaceConfig& config);

struct PathClass {
  std::string path;
  bool is_dir{false};
  std::optional<Role> role;     // nullopt = excluded
  std::size_t rule_index{0};    // valid when role is set
};

// Classification of one path against the rules.
PathClass resolve_path(const RuleSet& rules, std::string_view path, bool is_dir);

// True when a build dir declared before `index` contains the rule path
// (for source rules: any build dir), or an earlier rule of the same kind does.
bool source_rule_shadowed(const RuleSet& rules, std::size_t index);
bool build_dir_shadowed(const RuleSet& rules, std::size_t index);

struct Classification {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  RuleSet rules;
  std::vector<PathClass> paths;       // one per snapshot entry, same order
  std::vector<TrackedPath> tracked;   // source paths, then one per build dir
  std::vector<std::string> excluded;

  // Looks up a snapshot path; nullptr when the snapshot does not list it.
  const PathClass* find(std::string_view path) const;
  std::size_t count(Role role) const;
};

Classification classify(const WorkspaceConfig& config, const Snapshot& snapshot);

// Lists `root` recursively. The .ramws metadata directory at the top level is
// never listed; a missing root yields an empty snapshot. With `rules`, build
// dirs and excluded directories that hold no rule path are listed but not
// descended into.
Snapshot snapshot_tree(const std::filesystem::path& root, const RuleSet* rules, std::string* error);

Snapshot merge_snapshots(const Snapshot& a, const Snapshot& b);

}  // namespace ramws
