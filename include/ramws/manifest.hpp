#pragma once

// ramws/manifest.hpp — RAM-side tree manifests for dirtiness detection.
//
// A manifest records every entry of a source rule's RAM tree that the rule's
// filters keep, keyed by path relative to the rule. Dirtiness is the
// difference between the current RAM tree and the baseline taken at the last
// sync, so it only ever reflects edits made in RAM.
//
// HASHING:
//   scan_tree() reuses the previous digest when size and mtime are unchanged
//   and hashes the file with BLAKE3 otherwise. An equal digest under a new
//   mtime is not a change.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ramws/glob.hpp"
#include "ramws/types.hpp"

namespace ramws {

struct ManifestScan {
  bool ok{false};
  std::string error;
  TreeManifest entries;
};

// Walks `root` (a directory or a single file) and stamps every entry the
// filters keep. Keys are prefixed with `prefix`, and the root itself is
// stored under `prefix` ("" for a rule root). A missing root yields an empty
// manifest.
ManifestScan scan_tree(const std::string& root, const glob::FilterSet& filters, const std::string& prefix,
                       const TreeManifest* previous);

struct ManifestDiff {
  std::vector<std::string> created;
  std::vector<std::string> updated;
  std::vector<std::string> deleted;

  std::uint64_t total() const { return created.size() + updated.size() + deleted.size(); }
};

ManifestDiff diff_manifest(const TreeManifest& baseline, const TreeManifest& current);

// True when `key` is `prefix` or lies below it; an empty prefix holds everything.
bool in_subtree(std::string_view key, std::string_view prefix);

}  // namespace ramws
