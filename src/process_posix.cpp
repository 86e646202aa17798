#include "ramws/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

extern char** environ;

namespace ramws {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                    bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

// Reads everything currently available on a non-blocking fd.
void drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
  char buf[65536];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
}

struct ExecArgs {
  std::vector<std::string> storage;
  std::vector<char*> argv;
  std::vector<std::string> env_storage;
  std::vector<char*> envp;

  explicit ExecArgs(const ProcessSpec& spec) {
    storage.push_back(spec.command);
    storage.insert(storage.end(), spec.argv.begin(), spec.argv.end());
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);
    for (const auto& [k, v] : spec.env) env_storage.push_back(k + "=" + v);
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);
  }
};

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  // Build argv/envp before fork: only async-signal-safe calls after it.
  ExecArgs args(spec);

  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    return result;
  }
  if (pipe(err_pipe) != 0) {
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("fork: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    // Stays in the caller's process group, so a terminal ^C or a signal to
    // the group stops the child together with ramws.
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(127);
    execve(spec.command.c_str(), args.argv.data(), args.envp.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const bool has_deadline = spec.timeout_ms > 0;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  while (true) {
    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) {
      result.error_message = std::string("waitpid: ") + std::strerror(errno);
      break;
    }
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else {
    result.exit_code = decode_status(status);
  }
  return result;
}

int run_interactive(const ProcessSpec& spec, std::string* error) {
  ExecArgs args(spec);

  pid_t pid = fork();
  if (pid < 0) {
    if (error) *error = std::string("fork: ") + std::strerror(errno);
    return -1;
  }
  if (pid == 0) {
    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) _exit(127);
    execve(spec.command.c_str(), args.argv.data(), args.envp.data());
    _exit(127);
  }

  // The terminal delivers ^C/^\ to the whole foreground group; let the child
  // handle them and keep waiting.
  struct sigaction ignore {};
  struct sigaction old_int {};
  struct sigaction old_quit {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGINT, &ignore, &old_int);
  sigaction(SIGQUIT, &ignore, &old_quit);

  int status = 0;
  int rc = -1;
  while (true) {
    pid_t w = waitpid(pid, &status, 0);
    if (w == pid) {
      rc = decode_status(status);
      break;
    }
    if (w < 0 && errno != EINTR) {
      if (error) *error = std::string("waitpid: ") + std::strerror(errno);
      break;
    }
  }

  sigaction(SIGINT, &old_int, nullptr);
  sigaction(SIGQUIT, &old_quit, nullptr);
  return rc;
}

std::string find_executable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? name : std::string{};
  }
  const char* path_env = std::getenv("PATH");
  const std::string path = (path_env && path_env[0]) ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t colon = path.find(':', pos);
    if (colon == std::string::npos) colon = path.size();
    std::string dir = path.substr(pos, colon - pos);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + name;
    struct stat st {};
    if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    pos = colon + 1;
  }
  return {};
}

std::map<std::string, std::string> current_environment() {
  std::map<std::string, std::string> env;
  for (char** e = environ; e && *e; ++e) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    if (eq == std::string::npos) continue;
    env[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  return env;
}

}  // namespace ramws
