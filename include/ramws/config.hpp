#pragma once

// ramws/config.hpp — .ramws.yml loading, validation and resolution.
//
// The loader converts every yaml-cpp exception into a configuration_error
// result; nothing above this layer sees YAML types.
//
// RESOLUTION:
//   project root   nearest ancestor of the start directory holding a .git
//                  directory, else the start directory itself
//   config file    --config, else the nearest .ramws.yml walking up from the
//                  project root
//   project key    <basename>-<first 7 hex of BLAKE3("proj:" + canonical root)>
//   RAM root       workspace.root with ${USER} and ${PROJECT} (= project key)
//                  expanded; must be absolute and outside the project root

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ramws/types.hpp"

namespace ramws {

enum class MirrorBackend { rsync, native };

std::string to_string(MirrorBackend backend);

struct SyncSettings {
  ExitPolicy on_exit{ExitPolicy::ask};
  bool delete_mirroring{true};
  std::uint64_t lock_timeout_ms{2000};
  std::uint64_t mirror_timeout_seconds{0};  // 0 = unlimited
  MirrorBackend mirror{MirrorBackend::rsync};
};

struct WorkspaceConfig {
  std::string root_template{"/dev/shm/ramws-${USER}/${PROJECT}"};
  std::vector<SourceRule> sources;
  std::vector<BuildDirRule> build_dirs;
  SyncSettings sync;
};

// One source "." excluding .git, build, target and node_modules.
WorkspaceConfig default_config();

// YAML text written by `ramws init`.
std::string default_config_yaml();

struct ConfigLoadResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  WorkspaceConfig config;
};

ConfigLoadResult parse_config(const std::string& yaml_text);
ConfigLoadResult load_config_file(const std::filesystem::path& path);

struct ResolvedConfig {
  std::filesystem::path config_path;
  std::filesystem::path project_root;     // canonical
  std::filesystem::path workspace_root;   // RAM root
  std::string project_key;
  WorkspaceConfig config;
};

struct ResolveResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  ResolvedConfig resolved;
};

// Discovers the project root and config file starting at `start_dir` and
// loads it. `explicit_config` bypasses discovery.
ResolveResult resolve_config(const std::filesystem::path& start_dir,
                             const std::optional<std::filesystem::path>& explicit_config);

// Resolution against an already-loaded configuration (used by tests and by
// resolve_config itself).
ResolveResult resolve_loaded(const WorkspaceConfig& config,
                             const std::filesystem::path& project_root,
                             const std::filesystem::path& config_path);

std::filesystem::path find_project_root(const std::filesystem::path& start);
std::optional<std::filesystem::path> discover_config(const std::filesystem::path& project_root);

std::string project_key_for(const std::filesystem::path& canonical_root);
std::string expand_root_template(const std::string& tmpl, const std::string& user,
                                 const std::string& project_key);

}  // namespace ramws
