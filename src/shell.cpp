#include "ramws/shell.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <istream>
#include <ostream>

#include "ramws/observability.hpp"
#include "ramws/process.hpp"
#include "ramws/safety_guard.hpp"

namespace ramws {

namespace {

constexpr const char* kPromptPrefix = "(ramws)";

std::string resolve_shell_binary(const ShellOptions& options) {
  std::string name = options.shell;
  if (name.empty()) {
    const char* env = std::getenv("SHELL");
    name = (env && env[0]) ? env : "/bin/bash";
  }
  return find_executable(name);
}

bool read_yes(std::istream& in, bool default_yes) {
  std::string line;
  if (!std::getline(in, line)) return false;
  line.erase(std::remove_if(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); }), line.end());
  std::transform(line.begin(), line.end(), line.begin(), [](unsigned char c) { return std::tolower(c); });
  if (line.empty()) return default_yes;
  return line == "y" || line == "yes";
}

}  // namespace

std::map<std::string, std::string> shell_environment(const ResolvedConfig& resolved, const ShellOptions& options,
                                                     std::map<std::string, std::string> base) {
  unsigned long level = 0;
  auto it = base.find("RAMWS_LEVEL");
  if (it != base.end()) {
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(it->second.c_str(), &end, 10);
    if (end && *end == '\0' && !it->second.empty()) level = parsed;
  }
  base["RAMWS_ACTIVE"] = "1";
  base["RAMWS_LEVEL"] = std::to_string(level + 1);
  base["RAMWS_ORIG_ROOT"] = resolved.project_root.string();
  base["RAMWS_WS_ROOT"] = resolved.workspace_root.string();
  base["RAMWS_PROJECT"] = resolved.project_key;
  base["RAMWS_CONFIG"] = resolved.config_path.string();
  if (!options.no_prompt && options.command.empty()) {
    auto ps1 = base.find("PS1");
    base["PS1"] = std::string(kPromptPrefix) + " " + (ps1 != base.end() ? ps1->second : std::string("\\u$ "));
  }
  return base;
}

std::vector<std::string> shell_arguments(const ShellOptions& options) {
  if (options.command.empty()) return {"-i"};
  std::string joined;
  for (const auto& part : options.command) {
    if (!joined.empty()) joined += ' ';
    joined += part;
  }
  return {"-lc", joined};
}

CommandReport apply_exit_policy(WorkspaceController& controller, bool noninteractive, std::istream& in,
                                std::ostream& out) {
  CommandReport none;
  none.ok = true;
  const ExitPolicy policy = controller.resolved().config.sync.on_exit;
  if (policy == ExitPolicy::never) return none;

  const StatusReport st = controller.status();
  if (!st.ok) {
    CommandReport r;
    r.error = st.error;
    r.message = "cannot check workspace after shell exit: " + st.message;
    return r;
  }
  const ExitAction action = check_exit(policy, st.source_dirty(), noninteractive);
  if (action == ExitAction::none) return none;
  if (action == ExitAction::ask) {
    const RoleStatus* src = st.find(Role::source);
    out << "Sync " << (src ? src->pending : 0) << " change(s) back to disk? [Y/n] " << std::flush;
    if (!read_yes(in, true)) {
      log_info("shell", "leaving RAM changes unsynced");
      none.notes.push_back("RAM changes left unsynced");
      return none;
    }
  }
  return controller.sync(SyncOptions{});
}

ShellOutcome run_shell(WorkspaceController& controller, const ShellOptions& options, std::istream& in,
                       std::ostream& out) {
  ShellOutcome outcome;
  if (!controller.started()) {
    const CommandReport started = controller.start(StartOptions{});
    if (!started.ok) {
      outcome.error = started.error;
      outcome.message = started.message;
      return outcome;
    }
  }

  const std::string binary = resolve_shell_binary(options);
  if (binary.empty()) {
    outcome.error = ErrorCode::io_error;
    outcome.message = "shell '" + (options.shell.empty() ? std::string("$SHELL") : options.shell) + "' not found";
    return outcome;
  }

  const ResolvedConfig& resolved = controller.resolved();
  ProcessSpec spec;
  spec.command = binary;
  spec.argv = shell_arguments(options);
  spec.env = shell_environment(resolved, options, current_environment());
  spec.cwd = resolved.workspace_root.string();

  log_info("shell", "launching " + binary + " in " + spec.cwd);
  std::string err;
  const int status = run_interactive(spec, &err);
  if (status < 0) {
    outcome.error = ErrorCode::io_error;
    outcome.message = "failed to launch shell: " + err;
    return outcome;
  }
  outcome.exit_status = status;

  outcome.exit_sync = apply_exit_policy(controller, options.noninteractive, in, out);
  if (!outcome.exit_sync.ok) {
    outcome.error = outcome.exit_sync.error;
    outcome.message = outcome.exit_sync.message;
    return outcome;
  }
  outcome.ok = true;
  return outcome;
}

}  // namespace ramws
