#pragma once

// ramws/glob.hpp — Pure include/exclude pattern matching (rsync filter rules).
//
// PATTERN SEMANTICS:
//   *      any run of characters except '/'
//   **     any run of characters including '/'; "**/" may also match nothing
//   ?      one character except '/'
//   [...]  character class ("[!...]" or "[^...]" negates, ranges allowed)
//   \x     literal x
//   /p     leading '/' anchors the pattern at the transfer root
//   p/     trailing '/' matches directories only
//   A pattern with no '/' and no "**" is matched against the final path
//   component at any depth. Any other unanchored pattern is matched against
//   the whole path or any suffix that starts at a component boundary.
//
// FILTER EVALUATION:
//   A path is excluded when it, or any ancestor directory, matches an exclude
//   pattern and that same component does not first match an include pattern.
//   Excluding a directory therefore excludes its whole subtree, and
//   ".git/**" excludes everything below .git.
//
// Paths are relative, '/'-separated, with no leading "./" and no trailing '/'.
// Nothing here touches the filesystem.

#include <string>
#include <string_view>
#include <vector>

namespace ramws::glob {

bool match(std::string_view pattern, std::string_view path, bool is_dir);

struct FilterSet {
  std::vector<std::string> includes;
  std::vector<std::string> excludes;

  bool excluded(std::string_view path, bool is_dir) const;
  bool empty() const { return includes.empty() && excludes.empty(); }
};

// Normalizes a relative path: strips "./" components and duplicate or
// trailing slashes. Returns "." for the root. Sets *escapes when the path is
// absolute or a ".." climbs above the root.
std::string normalize_relative(std::string_view path, bool* escapes = nullptr);

// True when `path` equals `base` or lies inside it ("." contains everything).
bool is_under(std::string_view path, std::string_view base);

// Path of `path` relative to `base`; "" when they are equal.
// Precondition: is_under(path, base).
std::string relative_to(std::string_view path, std::string_view base);

// Joins a base ("." allowed) and a relative tail ("" allowed).
std::string join(std::string_view base, std::string_view tail);

}  // namespace ramws::glob
