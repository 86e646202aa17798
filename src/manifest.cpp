#include "ramws/manifest.hpp"

#include <filesystem>
#include <system_error>

#include "ramws/hash.hpp"
#include "ramws/observability.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

std::string key_for(const std::string& prefix, const std::string& rel) {
  if (prefix.empty()) return rel;
  if (rel.empty()) return prefix;
  return prefix + "/" + rel;
}

// Adds one entry. Special files are skipped, as the mirrors skip them.
bool stamp_entry(const fs::path& p, const fs::file_status& st, const std::string& key,
                 const TreeManifest* previous, ManifestScan& scan) {
  std::error_code ec;
  FileStamp stamp;
  if (fs::is_symlink(st)) {
    stamp.kind = 'l';
    stamp.digest = fs::read_symlink(p, ec).string();
    if (ec) {
      scan.error = "cannot read link " + p.string() + ": " + ec.message();
      return false;
    }
  } else if (fs::is_directory(st)) {
    stamp.kind = 'd';
  } else if (fs::is_regular_file(st)) {
    stamp.kind = 'f';
    stamp.size = fs::file_size(p, ec);
    if (ec) {
      scan.error = "cannot stat " + p.string() + ": " + ec.message();
      return false;
    }
    const auto mtime = fs::last_write_time(p, ec);
    if (ec) {
      scan.error = "cannot stat " + p.string() + ": " + ec.message();
      return false;
    }
    stamp.mtime = static_cast<std::uint64_t>(mtime.time_since_epoch().count());
    const FileStamp* prev = nullptr;
    if (previous) {
      auto it = previous->find(key);
      if (it != previous->end()) prev = &it->second;
    }
    if (prev && prev->kind == 'f' && prev->size == stamp.size && prev->mtime == stamp.mtime) {
      stamp.digest = prev->digest;
    } else {
      stamp.digest = hash_file_blake3_hex(p.string());
      if (stamp.digest.empty()) log_debug("manifest", "cannot hash " + p.string());
    }
  } else {
    return true;
  }
  scan.entries[key] = std::move(stamp);
  return true;
}

}  // namespace

ManifestScan scan_tree(const std::string& root, const glob::FilterSet& filters, const std::string& prefix,
                       const TreeManifest* previous) {
  ManifestScan scan;
  const fs::path root_path(root);
  std::error_code ec;
  const auto root_st = fs::status(root_path, ec);
  if (ec || !fs::exists(root_st)) {
    scan.ok = true;
    return scan;
  }
  if (!stamp_entry(root_path, root_st, prefix, previous, scan)) return scan;
  if (!fs::is_directory(root_st)) {
    scan.ok = true;
    return scan;
  }

  fs::recursive_directory_iterator it(root_path, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const std::string rel = it->path().lexically_relative(root_path).generic_string();
    std::error_code tec;
    const bool is_link = it->is_symlink(tec);
    const bool is_dir = !is_link && it->is_directory(tec);
    if (filters.excluded(rel, is_dir)) {
      if (is_dir) it.disable_recursion_pending();
      continue;
    }
    const auto st = it->symlink_status(tec);
    if (tec) {
      scan.error = "cannot stat " + it->path().string() + ": " + tec.message();
      return scan;
    }
    if (!stamp_entry(it->path(), st, key_for(prefix, rel), previous, scan)) return scan;
  }
  if (ec) {
    scan.error = "cannot read " + root + ": " + ec.message();
    return scan;
  }
  scan.ok = true;
  return scan;
}

ManifestDiff diff_manifest(const TreeManifest& baseline, const TreeManifest& current) {
  ManifestDiff d;
  for (const auto& [key, stamp] : current) {
    auto it = baseline.find(key);
    if (it == baseline.end()) {
      d.created.push_back(key);
    } else if (!it->second.same_content(stamp)) {
      d.updated.push_back(key);
    }
  }
  for (const auto& [key, stamp] : baseline) {
    if (!current.contains(key)) d.deleted.push_back(key);
  }
  return d;
}

bool in_subtree(std::string_view key, std::string_view prefix) {
  if (prefix.empty() || key == prefix) return true;
  return key.size() > prefix.size() && key.substr(0, prefix.size()) == prefix && key[prefix.size()] == '/';
}

}  // namespace ramws
