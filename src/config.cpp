#include "ramws/config.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "ramws/glob.hpp"
#include "ramws/hash.hpp"
#include "ramws/observability.hpp"

namespace fs = std::filesystem;

namespace ramws {

namespace {

ConfigLoadResult config_error(std::string message) {
  ConfigLoadResult r;
  r.ok = false;
  r.error = ErrorCode::configuration_error;
  r.message = std::move(message);
  return r;
}

// Normalizes a configured rule path. Empty, absolute and escaping paths are
// rejected.
bool normalize_rule_path(const std::string& raw, const std::string& where, std::string& out,
                         std::string& error) {
  if (raw.empty()) {
    error = where + ": path must not be empty";
    return false;
  }
  bool escapes = false;
  out = glob::normalize_relative(raw, &escapes);
  if (escapes) {
    error = where + ": path '" + raw + "' is absolute or escapes the project root";
    return false;
  }
  return true;
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& where) {
  std::vector<std::string> out;
  if (!node || node.IsNull()) return out;
  if (!node.IsSequence()) {
    throw std::runtime_error(where + " must be a list of patterns");
  }
  for (const auto& item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

std::string current_user() {
  const char* user = std::getenv("USER");
  if (user && user[0]) return user;
  if (const passwd* pw = getpwuid(geteuid())) {
    if (pw->pw_name && pw->pw_name[0]) return pw->pw_name;
  }
  return "unknown";
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

std::string to_string(MirrorBackend backend) {
  switch (backend) {
    case MirrorBackend::rsync: return "rsync";
    case MirrorBackend::native: return "native";
  }
  return "";
}

WorkspaceConfig default_config() {
  WorkspaceConfig cfg;
  SourceRule root;
  root.path = ".";
  root.exclude = {".git/**", "build/**", "target/**", "node_modules/**"};
  cfg.sources.push_back(root);
  return cfg;
}

std::string default_config_yaml() {
  const WorkspaceConfig cfg = default_config();
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "workspace" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "root" << YAML::Value << cfg.root_template;
  out << YAML::EndMap;

  out << YAML::Key << "sources" << YAML::Value << YAML::BeginSeq;
  for (const auto& src : cfg.sources) {
    out << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << src.path;
    out << YAML::Key << "include" << YAML::Value << YAML::Flow << src.include;
    out << YAML::Key << "exclude" << YAML::Value << src.exclude;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "build_dirs" << YAML::Value << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;

  out << YAML::Key << "sync" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "on_exit" << YAML::Value << to_string(cfg.sync.on_exit);
  out << YAML::Key << "delete" << YAML::Value << cfg.sync.delete_mirroring;
  out << YAML::Key << "lock_timeout_ms" << YAML::Value << cfg.sync.lock_timeout_ms;
  out << YAML::Key << "mirror_timeout_seconds" << YAML::Value << cfg.sync.mirror_timeout_seconds;
  out << YAML::Key << "mirror" << YAML::Value << to_string(cfg.sync.mirror);
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

ConfigLoadResult parse_config(const std::string& yaml_text) {
  ConfigLoadResult result;
  WorkspaceConfig cfg = default_config();
  std::string error;
  try {
    const YAML::Node root = YAML::Load(yaml_text);
    if (!root || root.IsNull()) {
      result.ok = true;
      result.config = cfg;
      return result;
    }
    if (!root.IsMap()) {
      return config_error("configuration must be a mapping");
    }

    if (const YAML::Node ws = root["workspace"]) {
      if (!ws.IsMap()) return config_error("workspace must be a mapping");
      if (ws["root"]) cfg.root_template = ws["root"].as<std::string>();
    }

    if (const YAML::Node sources = root["sources"]) {
      if (!sources.IsSequence()) return config_error("sources must be a list");
      cfg.sources.clear();
      for (std::size_t i = 0; i < sources.size(); ++i) {
        const YAML::Node entry = sources[i];
        const std::string where = "sources[" + std::to_string(i) + "]";
        SourceRule rule;
        std::string raw_path;
        if (entry.IsScalar()) {
          raw_path = entry.as<std::string>();
        } else if (entry.IsMap()) {
          if (!entry["path"]) return config_error(where + ": missing path");
          raw_path = entry["path"].as<std::string>();
          rule.include = string_list(entry["include"], where + ".include");
          rule.exclude = string_list(entry["exclude"], where + ".exclude");
        } else {
          return config_error(where + " must be a path or a mapping");
        }
        if (!normalize_rule_path(raw_path, where, rule.path, error)) return config_error(error);
        cfg.sources.push_back(std::move(rule));
      }
    }

    if (const YAML::Node dirs = root["build_dirs"]) {
      if (!dirs.IsSequence()) return config_error("build_dirs must be a list");
      for (std::size_t i = 0; i < dirs.size(); ++i) {
        const YAML::Node entry = dirs[i];
        const std::string where = "build_dirs[" + std::to_string(i) + "]";
        BuildDirRule rule;
        std::string raw_path;
        if (entry.IsScalar()) {
          raw_path = entry.as<std::string>();
        } else if (entry.IsMap()) {
          if (!entry["path"]) return config_error(where + ": missing path");
          raw_path = entry["path"].as<std::string>();
          const std::string type = entry["type"] ? entry["type"].as<std::string>() : "scratch";
          if (type == "cache") {
            rule.role = Role::cache;
          } else if (type == "scratch") {
            rule.role = Role::scratch;
          } else {
            return config_error(where + ": unknown type '" + type + "' (expected cache or scratch)");
          }
        } else {
          return config_error(where + " must be a path or a mapping");
        }
        if (!normalize_rule_path(raw_path, where, rule.path, error)) return config_error(error);
        if (rule.path == ".") {
          return config_error(where + ": a build directory cannot be the project root");
        }
        cfg.build_dirs.push_back(std::move(rule));
      }
    }

    if (const YAML::Node sync = root["sync"]) {
      if (!sync.IsMap()) return config_error("sync must be a mapping");
      if (sync["on_exit"]) {
        const std::string text = sync["on_exit"].as<std::string>();
        auto policy = parse_exit_policy(text);
        if (!policy) return config_error("sync.on_exit: unknown value '" + text + "' (expected ask, always or never)");
        cfg.sync.on_exit = *policy;
      }
      if (sync["delete"]) cfg.sync.delete_mirroring = sync["delete"].as<bool>();
      if (sync["lock_timeout_ms"]) cfg.sync.lock_timeout_ms = sync["lock_timeout_ms"].as<std::uint64_t>();
      if (sync["mirror_timeout_seconds"]) {
        cfg.sync.mirror_timeout_seconds = sync["mirror_timeout_seconds"].as<std::uint64_t>();
      }
      if (sync["mirror"]) {
        const std::string text = sync["mirror"].as<std::string>();
        if (text == "rsync") cfg.sync.mirror = MirrorBackend::rsync;
        else if (text == "native") cfg.sync.mirror = MirrorBackend::native;
        else return config_error("sync.mirror: unknown value '" + text + "' (expected rsync or native)");
      }
    }

    if (root["git"]) {
      log_debug("config", "ignoring git section (no git integration)");
    }
  } catch (const YAML::Exception& e) {
    return config_error(std::string("invalid yaml: ") + e.what());
  } catch (const std::runtime_error& e) {
    return config_error(e.what());
  }

  result.ok = true;
  result.config = std::move(cfg);
  return result;
}

ConfigLoadResult load_config_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return config_error("cannot read config " + path.string());
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();
  auto result = parse_config(buf.str());
  if (!result.ok) {
    result.message = path.string() + ": " + result.message;
  }
  return result;
}

fs::path find_project_root(const fs::path& start) {
  std::error_code ec;
  const fs::path canonical = fs::canonical(start, ec);
  const fs::path origin = ec ? start : canonical;
  fs::path current = origin;
  while (true) {
    if (fs::is_directory(current / ".git", ec)) return current;
    const fs::path parent = current.parent_path();
    if (parent == current || parent.empty()) break;
    current = parent;
  }
  return origin;
}

std::optional<fs::path> discover_config(const fs::path& project_root) {
  std::error_code ec;
  fs::path current = project_root;
  while (true) {
    const fs::path candidate = current / ".ramws.yml";
    if (fs::exists(candidate, ec)) return candidate;
    const fs::path parent = current.parent_path();
    if (parent == current || parent.empty()) break;
    current = parent;
  }
  return std::nullopt;
}

std::string project_key_for(const fs::path& canonical_root) {
  std::string name = canonical_root.filename().string();
  if (name.empty()) name = "project";
  return name + "-" + hash_domain("proj:", canonical_root.string()).substr(0, 7);
}

std::string expand_root_template(const std::string& tmpl, const std::string& user,
                                 const std::string& project_key) {
  std::string out = tmpl;
  replace_all(out, "${PROJECT}", project_key);
  replace_all(out, "${USER}", user);
  return out;
}

ResolveResult resolve_loaded(const WorkspaceConfig& config, const fs::path& project_root,
                             const fs::path& config_path) {
  ResolveResult r;
  r.error = ErrorCode::configuration_error;

  ResolvedConfig rc;
  rc.config = config;
  rc.config_path = config_path;
  rc.project_root = project_root.lexically_normal();
  rc.project_key = project_key_for(rc.project_root);

  const fs::path ram_root(expand_root_template(config.root_template, current_user(), rc.project_key));
  if (!ram_root.is_absolute()) {
    r.message = "workspace.root must resolve to an absolute path (got '" + ram_root.string() + "')";
    return r;
  }
  rc.workspace_root = ram_root.lexically_normal();
  if (rc.workspace_root.filename().empty()) {
    rc.workspace_root = rc.workspace_root.parent_path();
  }

  const std::string ws = rc.workspace_root.string();
  const std::string proj = rc.project_root.string();
  if (glob::is_under(ws, proj) || glob::is_under(proj, ws) || rc.workspace_root == rc.workspace_root.root_path()) {
    r.message = "workspace.root '" + ws + "' overlaps the project root '" + proj + "'";
    return r;
  }

  r.ok = true;
  r.error = ErrorCode::none;
  r.resolved = std::move(rc);
  return r;
}

ResolveResult resolve_config(const fs::path& start_dir, const std::optional<fs::path>& explicit_config) {
  ResolveResult r;
  r.error = ErrorCode::configuration_error;

  std::error_code ec;
  const fs::path start = fs::canonical(start_dir, ec);
  if (ec) {
    r.message = "cannot resolve directory " + start_dir.string() + ": " + ec.message();
    return r;
  }
  const fs::path project_root = find_project_root(start);

  fs::path config_path;
  if (explicit_config) {
    config_path = *explicit_config;
  } else if (auto found = discover_config(project_root)) {
    config_path = *found;
  } else {
    r.message = ".ramws.yml not found above " + project_root.string() + "; run ramws init";
    return r;
  }

  auto loaded = load_config_file(config_path);
  if (!loaded.ok) {
    r.message = loaded.message;
    return r;
  }
  log_debug("config", "loaded " + config_path.string() + " for project " + project_root.string());
  return resolve_loaded(loaded.config, project_root, config_path);
}

}  // namespace ramws
