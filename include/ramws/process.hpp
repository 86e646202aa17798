#pragma once

// ramws/process.hpp — fork/exec process runner (POSIX).
//
// run_process() captures stdout/stderr through non-blocking pipes with a
// per-stream byte cap and an optional wall-clock deadline. On expiry the
// child is killed and exit_code is 124, matching timeout(1). Children stay in
// the caller's process group, so interrupting ramws interrupts them too.
// run_interactive() inherits the terminal and only waits.
//
// Commands are exec'd by absolute path; use find_executable() to resolve a
// bare name against PATH.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ramws {

struct ProcessSpec {
  std::string command;                      // absolute path
  std::vector<std::string> argv;            // arguments after argv[0]
  std::map<std::string, std::string> env;   // full child environment
  std::string cwd;
  std::uint64_t timeout_ms{0};              // 0 = no deadline
  std::size_t max_output_bytes{1 << 20};
};

struct ProcessResult {
  int exit_code{-1};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;                // set when the child could not be spawned

  bool spawned() const { return error_message.empty(); }
};

ProcessResult run_process(const ProcessSpec& spec);

// Runs with inherited stdin/stdout/stderr. Returns the child's exit status
// (128 + signal when killed), or -1 with *error set if it could not start.
int run_interactive(const ProcessSpec& spec, std::string* error);

// Resolves a command name against PATH. Names containing '/' are returned
// unchanged when executable. Returns an empty string when not found.
std::string find_executable(const std::string& name);

// Snapshot of the current process environment.
std::map<std::string, std::string> current_environment();

}  // namespace ramws
