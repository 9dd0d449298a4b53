/**
 * @file process.cpp
 * @brief External process execution implementation
 */

#include "scene_encode/process.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "scene_encode/logging.hpp"

extern char **environ;

namespace scene_encode {

namespace {

std::string read_tail(const std::filesystem::path &path, size_t max_bytes) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in)
    return {};
  std::streamoff size = in.tellg();
  std::streamoff start =
      size > static_cast<std::streamoff>(max_bytes) ? size - max_bytes : 0;
  in.seekg(start);
  std::string tail(static_cast<size_t>(size - start), '\0');
  in.read(&tail[0], static_cast<std::streamsize>(tail.size()));

  while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r'))
    tail.pop_back();
  return tail;
}

/// waitpid without blocking; true once the child has been reaped
bool try_reap(pid_t pid, int &status) {
  for (;;) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return true;
    if (r == 0)
      return false;
    if (errno != EINTR)
      return true; ///\note ECHILD: already reaped elsewhere
  }
}

/// SIGTERM the group, wait for the grace period, then SIGKILL
void terminate_group(pid_t pid, int &status) {
  kill(-pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(PROCESS_KILL_GRACE_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    if (try_reap(pid, status))
      return;
    std::this_thread::sleep_for(std::chrono::milliseconds(PROCESS_POLL_MS));
  }
  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

} // anonymous namespace

std::string describe_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty())
      out += ' ';
    if (arg.find_first_of(" \t'\"") != std::string::npos) {
      out += '"';
      out += arg;
      out += '"';
    } else {
      out += arg;
    }
  }
  return out;
}

bool run_process(const std::vector<std::string> &argv,
                 const std::filesystem::path &log_path,
                 const std::atomic<bool> *cancel, ProcessResult &result,
                 std::string &error) {
  result = ProcessResult{};
  if (argv.empty()) {
    error = "Empty command";
    return false;
  }
  if (cancel && cancel->load()) {
    result.cancelled = true;
    error = "Cancelled before start";
    return false;
  }

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    cargv.push_back(const_cast<char *>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, log_path.c_str(),
                                   O_WRONLY | O_CREAT | O_TRUNC, 0644);

  /// Own process group so cancellation can signal the whole tree
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, cargv[0], &actions, &attr, cargv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);

  if (rc != 0) {
    error = fmt::format("Failed to start {}: {}", argv[0], std::strerror(rc));
    return false;
  }

  int status = 0;
  while (!try_reap(pid, status)) {
    if (cancel && cancel->load()) {
      terminate_group(pid, status);
      result.cancelled = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(PROCESS_POLL_MS));
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  result.log_tail = read_tail(log_path, PROCESS_LOG_TAIL);

  if (result.cancelled) {
    error = fmt::format("{} cancelled", argv[0]);
    return false;
  }
  if (result.term_signal != 0 || result.exit_code != 0) {
    LOG_WARN("Command failed: {} (log {})", describe_command(argv),
             log_path.string());
  }
  if (result.term_signal != 0) {
    error = fmt::format("{} killed by signal {}: {}", argv[0],
                        result.term_signal, result.log_tail);
    return false;
  }
  if (result.exit_code != 0) {
    error = fmt::format("{} exited with status {}: {}", argv[0],
                        result.exit_code, result.log_tail);
    return false;
  }
  return true;
}

} // namespace scene_encode
