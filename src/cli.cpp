#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ramws/config.hpp"
#include "ramws/mirror.hpp"
#include "ramws/observability.hpp"
#include "ramws/shell.hpp"
#include "ramws/version.hpp"
#include "ramws/workspace.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kUsage =
    "usage: ramws [-C DIR] [--config FILE] [--json] [-v|-q] <command> [options]\n"
    "\n"
    "commands:\n"
    "  init     [--force]                        write a default .ramws.yml\n"
    "  start    [--refresh-sources-only] [--force]\n"
    "                                            populate the RAM workspace from disk\n"
    "  shell    [--shell BIN] [--no-prompt] [--noninteractive] [-- cmd...]\n"
    "                                            run a shell (or cmd) inside the workspace\n"
    "  sync     [--back|--from] [--only PATH...] [--role ROLE...] [--force]\n"
    "                                            mirror RAM -> disk (default) or disk -> RAM\n"
    "  status                                    show workspace state and pending changes\n"
    "  destroy  [--force]                        remove the RAM workspace\n"
    "  version                                   print version information\n";

struct GlobalOptions {
  std::optional<fs::path> chdir;
  std::optional<fs::path> config;
  bool json{false};
  int verbosity{0};
};

int usage_error(const std::string& message) {
  std::cerr << "ramws: " << message << "\n\n" << kUsage;
  return ramws::exit_code_for(ramws::ErrorCode::usage_error);
}

int report_failure(ramws::ErrorCode code, const std::string& message, bool json) {
  if (json) {
    ramws::CommandReport r;
    r.error = code;
    r.message = message;
    std::cout << r.to_json() << "\n";
  }
  std::cerr << "ramws: " << ramws::to_string(code) << ": " << message << "\n";
  return ramws::exit_code_for(code);
}

int finish(const ramws::CommandReport& report, bool json) {
  if (json) {
    std::cout << report.to_json() << "\n";
  } else if (report.ok) {
    for (const auto& note : report.notes) std::cout << "note: " << note << "\n";
    if (!report.message.empty()) std::cout << report.message << "\n";
  } else {
    for (const auto& op : report.completed) std::cerr << "  completed: " << op << "\n";
    for (const auto& op : report.unstarted) std::cerr << "  not run:   " << op << "\n";
  }
  if (report.ok) return 0;
  std::cerr << "ramws: " << ramws::to_string(report.error) << ": " << report.message << "\n";
  return ramws::exit_code_for(report.error);
}

// Collects values after a multi-value flag up to the next option.
void take_values(const std::vector<std::string>& args, std::size_t& i, std::vector<std::string>& out) {
  while (i + 1 < args.size() && args[i + 1].rfind("-", 0) != 0) out.push_back(args[++i]);
}

std::vector<std::string> split_commas(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

ramws::ResolveResult load(const GlobalOptions& g) {
  std::error_code ec;
  const fs::path start = g.chdir ? *g.chdir : fs::current_path(ec);
  if (ec) {
    ramws::ResolveResult r;
    r.error = ramws::ErrorCode::io_error;
    r.message = "cannot read current directory: " + ec.message();
    return r;
  }
  return ramws::resolve_config(start, g.config);
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  GlobalOptions g;
  std::size_t i = 0;
  for (; i < args.size(); ++i) {
    const std::string& a = args[i];
    if ((a == "-C" || a == "--chdir") && i + 1 < args.size()) {
      g.chdir = fs::path(args[++i]);
    } else if (a == "--config" && i + 1 < args.size()) {
      g.config = fs::path(args[++i]);
    } else if (a == "--json") {
      g.json = true;
    } else if (a == "-v" || a == "--verbose") {
      ++g.verbosity;
    } else if (a == "-q" || a == "--quiet") {
      --g.verbosity;
    } else if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      return 0;
    } else if (a.rfind("-", 0) == 0) {
      return usage_error("unknown option '" + a + "'");
    } else {
      break;
    }
  }
  if (i >= args.size()) return usage_error("missing command");
  const std::string cmd = args[i];
  const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i + 1), args.end());

  ramws::init_log_level_from_env();
  if (g.verbosity > 0) ramws::set_log_level(ramws::LogLevel::debug);
  if (g.verbosity < 0) ramws::set_log_level(ramws::LogLevel::error);

  if (cmd == "version") {
    const auto m = ramws::version::current_manifest();
    if (g.json) {
      std::cout << ramws::version::manifest_to_json(m) << "\n";
    } else {
      std::cout << "ramws " << m.semver << " (state format " << m.state_format << ", " << m.hash_primitive << " "
                << m.hash_version << ")\n";
    }
    return 0;
  }

  if (cmd == "init") {
    bool force = false;
    for (const auto& a : rest) {
      if (a == "--force") force = true;
      else return usage_error("init: unknown option '" + a + "'");
    }
    std::error_code ec;
    const fs::path start = g.chdir ? *g.chdir : fs::current_path(ec);
    const fs::path canonical = fs::canonical(start, ec);
    if (ec) return report_failure(ramws::ErrorCode::io_error, "cannot resolve " + start.string(), g.json);
    return finish(ramws::init_config(ramws::find_project_root(canonical), force), g.json);
  }

  if (cmd != "start" && cmd != "shell" && cmd != "sync" && cmd != "status" && cmd != "destroy") {
    return usage_error("unknown command '" + cmd + "'");
  }

  // Parse command options before loading anything.
  ramws::StartOptions start_opts;
  ramws::SyncOptions sync_opts;
  ramws::DestroyOptions destroy_opts;
  ramws::ShellOptions shell_opts;
  bool back = false;
  bool from = false;
  std::vector<std::string> only;
  std::vector<std::string> role_names;
  for (std::size_t k = 0; k < rest.size(); ++k) {
    const std::string& a = rest[k];
    if (cmd == "shell" && a == "--") {
      shell_opts.command.assign(rest.begin() + static_cast<std::ptrdiff_t>(k + 1), rest.end());
      break;
    }
    if (cmd == "shell" && a.rfind("-", 0) != 0) {
      shell_opts.command.assign(rest.begin() + static_cast<std::ptrdiff_t>(k), rest.end());
      break;
    }
    if (a == "--force" && (cmd == "start" || cmd == "sync" || cmd == "destroy")) {
      start_opts.force = sync_opts.force = destroy_opts.force = true;
    } else if (a == "--noninteractive" && cmd == "shell") {
      shell_opts.noninteractive = true;
    } else if (a == "--refresh-sources-only" && cmd == "start") {
      start_opts.refresh_sources_only = true;
    } else if (a == "--back" && cmd == "sync") {
      back = true;
    } else if (a == "--from" && cmd == "sync") {
      from = true;
    } else if (a == "--only" && cmd == "sync") {
      const std::size_t before = only.size();
      take_values(rest, k, only);
      if (only.size() == before) return usage_error("sync: --only needs at least one path");
    } else if (a == "--role" && cmd == "sync") {
      std::vector<std::string> values;
      take_values(rest, k, values);
      if (values.empty()) return usage_error("sync: --role needs at least one role");
      for (const auto& v : values) {
        for (const auto& name : split_commas(v)) role_names.push_back(name);
      }
    } else if (a == "--shell" && cmd == "shell" && k + 1 < rest.size()) {
      shell_opts.shell = rest[++k];
    } else if (a == "--no-prompt" && cmd == "shell") {
      shell_opts.no_prompt = true;
    } else {
      return usage_error(cmd + ": unknown option '" + a + "'");
    }
  }
  if (back && from) return usage_error("sync: --back and --from are mutually exclusive");
  if (!only.empty() && !role_names.empty()) return usage_error("sync: --only and --role cannot be combined");
  sync_opts.direction = from ? ramws::Direction::from_disk : ramws::Direction::to_disk;
  if (!only.empty()) {
    sync_opts.scope = ramws::SyncScope::for_paths(only);
  } else if (!role_names.empty()) {
    std::vector<ramws::Role> roles;
    for (const auto& name : role_names) {
      auto role = ramws::parse_role(name);
      if (!role) return usage_error("sync: unknown role '" + name + "' (expected source, cache or scratch)");
      roles.push_back(*role);
    }
    sync_opts.scope = ramws::SyncScope::for_roles(roles);
  }

  const auto resolved = load(g);
  if (!resolved.ok) return report_failure(resolved.error, resolved.message, g.json);
  auto mirror = ramws::make_mirror(resolved.resolved.config.sync);
  ramws::WorkspaceController controller(resolved.resolved, *mirror);

  if (cmd == "start") return finish(controller.start(start_opts), g.json);
  if (cmd == "sync") return finish(controller.sync(sync_opts), g.json);
  if (cmd == "destroy") return finish(controller.destroy(destroy_opts), g.json);

  if (cmd == "status") {
    const ramws::StatusReport st = controller.status();
    if (g.json) {
      std::cout << st.to_json() << "\n";
    } else {
      std::cout << st.to_text();
    }
    if (st.ok) return 0;
    std::cerr << "ramws: " << ramws::to_string(st.error) << ": " << st.message << "\n";
    return ramws::exit_code_for(st.error);
  }

  // shell
  const ramws::ShellOutcome outcome = ramws::run_shell(controller, shell_opts, std::cin, std::cout);
  if (!outcome.ok) return report_failure(outcome.error, outcome.message, g.json);
  for (const auto& note : outcome.exit_sync.notes) std::cerr << "ramws: note: " << note << "\n";
  return outcome.exit_status;
}
