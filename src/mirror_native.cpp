#include "ramws/mirror.hpp"

// NativeMirror: in-process tree reconciliation.
//
// Change detection per regular file:
//   1. size differs                  -> copy
//   2. size and mtime equal          -> unchanged
//   3. size equal, mtime differs     -> BLAKE3 both sides; equal content only
//                                       gets its mtime aligned and is not
//                                       reported as changed
// Copies go through a temp file in the destination directory and rename(),
// then mtime and permission bits are carried over (like rsync -a).
// Symlinks are mirrored as links. Directory attributes are not tracked.

#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>

#include "ramws/glob.hpp"
#include "ramws/hash.hpp"
#include "ramws/observability.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

struct Reconciler {
  const MirrorRequest& req;
  MirrorResult& result;

  bool fail(const std::string& what, const fs::path& p, const std::error_code& ec) {
    result.ok = false;
    result.error = what + " " + p.string() + ": " + ec.message();
    return false;
  }

  bool same_content(const fs::path& a, const fs::path& b) {
    const std::string ha = hash_file_blake3_hex(a.string());
    const std::string hb = hash_file_blake3_hex(b.string());
    return !ha.empty() && ha == hb;
  }

  bool copy_file_atomic(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    const fs::path tmp = dst.parent_path() / ("." + dst.filename().string() + ".ramws-tmp");
    fs::remove(tmp, ec);
    if (!fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec)) {
      fs::remove(tmp, ec);
      return fail("cannot copy to", dst, ec);
    }
    const auto mtime = fs::last_write_time(src, ec);
    if (!ec) fs::last_write_time(tmp, mtime, ec);
    const auto perms = fs::status(src, ec).permissions();
    if (!ec) fs::permissions(tmp, perms, ec);
    fs::rename(tmp, dst, ec);
    if (ec) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return fail("cannot replace", dst, ec);
    }
    return true;
  }

  bool remove_existing(const fs::path& dst) {
    std::error_code ec;
    fs::remove_all(dst, ec);
    if (ec) return fail("cannot remove", dst, ec);
    return true;
  }

  // Brings one destination entry in line with its source entry.
  bool sync_entry(const fs::path& src, const fs::path& dst, const std::string& rel) {
    std::error_code ec;
    const auto sst = fs::symlink_status(src, ec);
    if (ec) return fail("cannot stat", src, ec);
    const auto dstat = fs::symlink_status(dst, ec);
    const bool dest_exists = !ec && fs::exists(dstat);

    if (fs::is_symlink(sst)) {
      const fs::path target = fs::read_symlink(src, ec);
      if (ec) return fail("cannot read link", src, ec);
      if (dest_exists && fs::is_symlink(dstat)) {
        const fs::path current = fs::read_symlink(dst, ec);
        if (!ec && current == target) return true;
      }
      (dest_exists ? result.updated : result.created).push_back(rel);
      if (req.dry_run) return true;
      if (dest_exists && !remove_existing(dst)) return false;
      fs::create_symlink(target, dst, ec);
      if (ec) return fail("cannot create link", dst, ec);
      return true;
    }

    if (fs::is_directory(sst)) {
      if (dest_exists && fs::is_directory(dstat)) return true;
      (dest_exists ? result.updated : result.created).push_back(rel);
      if (req.dry_run) return true;
      if (dest_exists && !remove_existing(dst)) return false;
      fs::create_directories(dst, ec);
      if (ec) return fail("cannot create directory", dst, ec);
      fs::permissions(dst, sst.permissions(), ec);
      return true;
    }

    if (!fs::is_regular_file(sst)) {
      log_debug("mirror", "skipping special file " + src.string());
      return true;
    }

    if (dest_exists && fs::is_regular_file(dstat)) {
      const auto ssize = fs::file_size(src, ec);
      if (ec) return fail("cannot stat", src, ec);
      const auto dsize = fs::file_size(dst, ec);
      if (ec) return fail("cannot stat", dst, ec);
      if (ssize == dsize) {
        const auto smtime = fs::last_write_time(src, ec);
        if (ec) return fail("cannot stat", src, ec);
        const auto dmtime = fs::last_write_time(dst, ec);
        if (ec) return fail("cannot stat", dst, ec);
        if (smtime == dmtime) return true;
        if (same_content(src, dst)) {
          if (!req.dry_run) fs::last_write_time(dst, smtime, ec);
          return true;
        }
      }
      result.updated.push_back(rel);
      if (req.dry_run) return true;
      return copy_file_atomic(src, dst);
    }

    (dest_exists ? result.updated : result.created).push_back(rel);
    if (req.dry_run) return true;
    if (dest_exists && !remove_existing(dst)) return false;
    return copy_file_atomic(src, dst);
  }
};

}  // namespace

MirrorResult NativeMirror::reconcile(const MirrorRequest& request) {
  MirrorResult result;
  result.ok = true;
  Reconciler rec{request, result};

  const fs::path src_root(request.source_root);
  const fs::path dst_root(request.dest_root);
  std::error_code ec;
  const auto sst = fs::status(src_root, ec);
  if (ec || !fs::exists(sst)) {
    result.ok = false;
    result.error = "mirror source does not exist: " + request.source_root;
    return result;
  }

  if (!fs::is_directory(sst)) {
    if (!request.dry_run) {
      fs::create_directories(dst_root.parent_path(), ec);
      if (ec) {
        rec.fail("cannot create directory", dst_root.parent_path(), ec);
        return result;
      }
    }
    rec.sync_entry(src_root, dst_root, src_root.filename().string());
    return result;
  }

  if (!request.dry_run) {
    const auto dstat = fs::symlink_status(dst_root, ec);
    if (!ec && fs::exists(dstat) && !fs::is_directory(dstat)) {
      if (!rec.remove_existing(dst_root)) return result;
    }
    fs::create_directories(dst_root, ec);
    if (ec) {
      rec.fail("cannot create directory", dst_root, ec);
      return result;
    }
  }

  const glob::FilterSet filters{request.includes, request.excludes};
  std::set<std::string> seen;

  fs::recursive_directory_iterator it(src_root, ec);
  if (ec) {
    rec.fail("cannot read", src_root, ec);
    return result;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      rec.fail("cannot read", src_root, ec);
      return result;
    }
    const fs::path& p = it->path();
    const std::string rel = p.lexically_relative(src_root).generic_string();
    std::error_code tec;
    const bool is_dir = it->is_directory(tec) && !it->is_symlink(tec);
    if (filters.excluded(rel, is_dir)) {
      if (is_dir) it.disable_recursion_pending();
      continue;
    }
    seen.insert(rel);
    if (!rec.sync_entry(p, dst_root / rel, rel)) return result;
  }
  if (ec) {
    rec.fail("cannot read", src_root, ec);
    return result;
  }

  if (request.delete_mirroring && fs::is_directory(dst_root, ec)) {
    std::vector<std::pair<std::string, bool>> doomed;
    fs::recursive_directory_iterator dit(dst_root, ec);
    for (; !ec && dit != fs::recursive_directory_iterator(); dit.increment(ec)) {
      const std::string rel = dit->path().lexically_relative(dst_root).generic_string();
      std::error_code tec;
      const bool is_dir = dit->is_directory(tec) && !dit->is_symlink(tec);
      if (filters.excluded(rel, is_dir)) {
        if (is_dir) dit.disable_recursion_pending();
        continue;
      }
      if (!seen.contains(rel)) doomed.emplace_back(rel, is_dir);
    }
    if (ec) {
      rec.fail("cannot read", dst_root, ec);
      return result;
    }
    // Deepest first, so directories are empty when their turn comes. A
    // directory still holding excluded entries is left in place.
    std::sort(doomed.begin(), doomed.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    for (const auto& [rel, is_dir] : doomed) {
      if (request.dry_run) {
        result.deleted.push_back(rel);
        continue;
      }
      std::error_code rec_ec;
      if (fs::remove(dst_root / rel, rec_ec)) {
        result.deleted.push_back(rel);
      } else if (rec_ec && !(is_dir && rec_ec == std::errc::directory_not_empty)) {
        rec.fail("cannot delete", dst_root / rel, rec_ec);
        return result;
      } else if (rec_ec) {
        log_debug("mirror", "keeping " + rel + ": holds excluded entries");
      }
    }
  }

  std::sort(result.created.begin(), result.created.end());
  std::sort(result.updated.begin(), result.updated.end());
  std::sort(result.deleted.begin(), result.deleted.end());
  return result;
}

}  // namespace ramws
