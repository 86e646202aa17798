#pragma once

// ramws/shell.hpp — Interactive session inside the RAM workspace.
//
// The child shell runs with the RAM root as its working directory and these
// markers in its environment:
//   RAMWS_ACTIVE=1, RAMWS_LEVEL (nesting depth, parent + 1), RAMWS_ORIG_ROOT,
//   RAMWS_WS_ROOT, RAMWS_PROJECT, RAMWS_CONFIG, and a "(ramws)" PS1 prefix for
//   interactive sessions unless prompts are disabled.
// When it exits, the sync.on_exit policy decides whether RAM changes go back
// to disk.

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "ramws/workspace.hpp"

namespace ramws {

struct ShellOptions {
  std::string shell;                   // empty: $SHELL, then /bin/bash
  bool no_prompt{false};
  bool noninteractive{false};
  std::vector<std::string> command;    // empty: interactive shell
};

std::map<std::string, std::string> shell_environment(const ResolvedConfig& resolved, const ShellOptions& options,
                                                     std::map<std::string, std::string> base);

// Arguments after argv[0]: "-i", or "-lc" and the joined command.
std::vector<std::string> shell_arguments(const ShellOptions& options);

// Applies sync.on_exit after a session. Prompts on `out` and reads the answer
// from `in` when the policy asks.
CommandReport apply_exit_policy(WorkspaceController& controller, bool noninteractive, std::istream& in,
                                std::ostream& out);

struct ShellOutcome {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  int exit_status{0};                  // child's status when it ran
  CommandReport exit_sync;
};

ShellOutcome run_shell(WorkspaceController& controller, const ShellOptions& options, std::istream& in,
                       std::ostream& out);

}  // namespace ramws
