#include "ramws/mirror.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "ramws/observability.hpp"
#include "ramws/process.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

// rsync exit 24: "some files vanished before they could be transferred".
constexpr int kRsyncPartialVanished = 24;
constexpr std::size_t kMaxItemizeBytes = 64u << 20;

std::string with_trailing_slash(std::string path) {
  if (path.empty() || path.back() != '/') path.push_back('/');
  return path;
}

std::string first_line(const std::string& text) {
  const auto nl = text.find('\n');
  return nl == std::string::npos ? text : text.substr(0, nl);
}

}  // namespace

RsyncMirror::RsyncMirror(std::string rsync_binary, std::uint64_t timeout_seconds)
    : rsync_binary_(std::move(rsync_binary)), timeout_seconds_(timeout_seconds) {}

std::vector<std::string> RsyncMirror::build_arguments(const MirrorRequest& request, bool source_is_dir) {
  std::vector<std::string> args = {"-a", "--itemize-changes"};
  if (request.delete_mirroring && source_is_dir) args.push_back("--delete");
  if (request.dry_run) args.push_back("--dry-run");
  // rsync applies filter rules in order, first match wins: re-includes go first.
  for (const auto& inc : request.includes) args.push_back("--include=" + inc);
  for (const auto& exc : request.excludes) args.push_back("--exclude=" + exc);
  if (source_is_dir) {
    args.push_back(with_trailing_slash(request.source_root));
    args.push_back(with_trailing_slash(request.dest_root));
  } else {
    args.push_back(request.source_root);
    args.push_back(request.dest_root);
  }
  return args;
}

MirrorResult RsyncMirror::reconcile(const MirrorRequest& request) {
  MirrorResult result;
  std::error_code ec;
  const auto st = fs::status(request.source_root, ec);
  if (ec || !fs::exists(st)) {
    result.error = "mirror source does not exist: " + request.source_root;
    return result;
  }
  const bool source_is_dir = fs::is_directory(st);

  const std::string binary = find_executable(rsync_binary_);
  if (binary.empty()) {
    result.error = "rsync executable '" + rsync_binary_ + "' not found in PATH";
    return result;
  }

  if (!request.dry_run) {
    const fs::path dest_dir = source_is_dir ? fs::path(request.dest_root) : fs::path(request.dest_root).parent_path();
    fs::create_directories(dest_dir, ec);
    if (ec) {
      result.error = "cannot create " + dest_dir.string() + ": " + ec.message();
      return result;
    }
  }

  ProcessSpec spec;
  spec.command = binary;
  spec.argv = build_arguments(request, source_is_dir);
  spec.env = current_environment();
  spec.timeout_ms = timeout_seconds_ * 1000;
  spec.max_output_bytes = kMaxItemizeBytes;

  log_debug("mirror", "rsync " + std::string(request.dry_run ? "(dry-run) " : "") + request.source_root +
                          " -> " + request.dest_root);
  const ProcessResult proc = run_process(spec);
  if (!proc.spawned()) {
    result.error = "failed to run rsync: " + proc.error_message;
    return result;
  }
  if (proc.timed_out) {
    result.error = "rsync timed out after " + std::to_string(timeout_seconds_) + "s";
    return result;
  }
  if (proc.exit_code != 0 && proc.exit_code != kRsyncPartialVanished) {
    result.error = "rsync exited with code " + std::to_string(proc.exit_code) + ": " +
                   first_line(proc.stderr_text);
    return result;
  }
  if (proc.exit_code == kRsyncPartialVanished) {
    log_warn("mirror", "some files vanished during transfer from " + request.source_root);
  }
  if (proc.stdout_truncated) {
    log_warn("mirror", "rsync change list truncated; reported counts are a lower bound");
  }

  result = parse_itemized_output(proc.stdout_text);
  result.ok = true;
  return result;
}

MirrorResult parse_itemized_output(std::string_view text) {
  MirrorResult result;
  result.ok = true;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) nl = text.size();
    std::string_view line = text.substr(pos, nl - pos);
    pos = nl + 1;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) continue;

    constexpr std::string_view kDeleting = "*deleting";
    if (line.substr(0, kDeleting.size()) == kDeleting) {
      std::string_view path = line.substr(kDeleting.size());
      while (!path.empty() && path.front() == ' ') path.remove_prefix(1);
      while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
      if (!path.empty()) result.deleted.emplace_back(path);
      continue;
    }

    // YXcstpoguax <path>: 11 change flags, a space, the path.
    if (line.size() < 13 || line[11] != ' ') continue;
    const std::string_view flags = line.substr(0, 11);
    std::string_view path = line.substr(12);
    const char update = flags[0];
    const char type = flags[1];
    if (type == 'L') {
      const auto arrow = path.find(" -> ");
      if (arrow != std::string_view::npos) path = path.substr(0, arrow);
    }
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    if (path.empty() || path == ".") continue;

    const bool is_new = flags.substr(2).find_first_not_of('+') == std::string_view::npos;
    if (type == 'd') {
      if (update == 'c' && is_new) result.created.emplace_back(path);
      continue;
    }
    if (update != '>' && update != '<' && update != 'c' && update != '.' && update != 'h') continue;
    if (is_new) {
      result.created.emplace_back(path);
    } else {
      result.updated.emplace_back(path);
    }
  }
  std::sort(result.created.begin(), result.created.end());
  std::sort(result.updated.begin(), result.updated.end());
  std::sort(result.deleted.begin(), result.deleted.end());
  return result;
}

std::unique_ptr<IMirror> make_mirror(const SyncSettings& settings) {
  switch (settings.mirror) {
    case MirrorBackend::rsync:
      return std::make_unique<RsyncMirror>("rsync", settings.mirror_timeout_seconds);
    case MirrorBackend::native:
      return std::make_unique<NativeMirror>();
  }
  return std::make_unique<RsyncMirror>("rsync", settings.mirror_timeout_seconds);
}

}  // namespace ramws
