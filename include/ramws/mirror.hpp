#pragma once

// ramws/mirror.hpp — Mirror primitive: reconcile one directory tree into another.
//
// CONTRACT:
//   reconcile() makes dest_root match source_root for every path not excluded
//   by the request filters. With delete_mirroring, destination entries absent
//   from the source are removed, except excluded ones, which are never touched.
//   With dry_run, nothing is modified and the result lists what would change.
//   A regular-file source_root mirrors that single file onto dest_root.
//   The result paths are relative to the roots, '/'-separated, sorted.
//
// Implementations:
//   RsyncMirror   drives `rsync -a --itemize-changes` and parses its output.
//   NativeMirror  std::filesystem walk; size+mtime quick check, BLAKE3 on ties.
// Tests substitute their own IMirror.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ramws/config.hpp"

namespace ramws {

struct MirrorRequest {
  std::string source_root;
  std::string dest_root;
  std::vector<std::string> includes;
  std::vector<std::string> excludes;
  bool delete_mirroring{false};
  bool dry_run{false};
};

struct MirrorResult {
  bool ok{false};
  std::string error;
  std::vector<std::string> created;
  std::vector<std::string> updated;
  std::vector<std::string> deleted;

  std::uint64_t changed() const { return created.size() + updated.size() + deleted.size(); }
};

// ---------------------------------------------------------------------------
// IMirror — abstract tree reconciliation interface
// ---------------------------------------------------------------------------
class IMirror {
 public:
  virtual ~IMirror() = default;

  virtual MirrorResult reconcile(const MirrorRequest& request) = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;
};

class RsyncMirror : public IMirror {
 public:
  // rsync_binary: path or bare name resolved against PATH.
  explicit RsyncMirror(std::string rsync_binary = "rsync", std::uint64_t timeout_seconds = 0);

  MirrorResult reconcile(const MirrorRequest& request) override;
  std::string backend_id() const override { return "rsync"; }

  // Argument vector (without argv[0]) for a request.
  static std::vector<std::string> build_arguments(const MirrorRequest& request, bool source_is_dir);

 private:
  std::string rsync_binary_;
  std::uint64_t timeout_seconds_{0};
};

// Parses `rsync --itemize-changes` output into created/updated/deleted.
// Directory attribute-only lines (".d...") are ignored.
MirrorResult parse_itemized_output(std::string_view text);

class NativeMirror : public IMirror {
 public:
  MirrorResult reconcile(const MirrorRequest& request) override;
  std::string backend_id() const override { return "native"; }
};

std::unique_ptr<IMirror> make_mirror(const SyncSettings& settings);

}  // namespace ramws
