/**
 * @file process.hpp
 * @brief External process execution with cancellation
 *
 * @details Child processes (ffmpeg) are started with posix_spawnp in their
 *          own process group, with stdin and stdout on /dev/null and stderr
 *          written to a fresh log file. The caller's thread waits for the child
 *          and polls a cancellation flag while doing so.
 *
 * @attention On cancellation the whole process group receives SIGTERM,
 *            then SIGKILL if it is still alive after the grace period, so
 *            no encoder is left orphaned.
 */

#ifndef SCENE_ENCODE_PROCESS_HPP
#define SCENE_ENCODE_PROCESS_HPP

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace scene_encode {

/// Poll interval while waiting for a child (milliseconds)
constexpr int PROCESS_POLL_MS = 50;

/// Time between SIGTERM and SIGKILL on cancellation (milliseconds)
constexpr int PROCESS_KILL_GRACE_MS = 3000;

/// Bytes of the child's stderr log quoted in error messages
constexpr size_t PROCESS_LOG_TAIL = 2048;

/**
 * @struct ProcessResult
 * @brief How a child process ended.
 */
struct ProcessResult {
  int exit_code = -1;   //< Exit status if the child exited normally
  int term_signal = 0;  //< Signal number if the child was killed
  bool cancelled = false;
  std::string log_tail; //< Last PROCESS_LOG_TAIL bytes of stderr
};

/**
 * @brief Run a command to completion.
 *
 * @param argv Program and arguments (argv[0] is looked up in PATH)
 * @param log_path File receiving the child's stderr (truncated first)
 * @param cancel Optional flag; when it becomes true the child is terminated
 * @param result Output: exit details
 * @param error Output: human readable cause when the return value is false
 * @return true only if the child exited with status 0
 * @note A failing child is logged with its full command line.
 */
bool run_process(const std::vector<std::string> &argv,
                 const std::filesystem::path &log_path,
                 const std::atomic<bool> *cancel, ProcessResult &result,
                 std::string &error);

/// Shell-like rendering of argv for log lines
std::string describe_command(const std::vector<std::string> &argv);

} // namespace scene_encode

#endif // SCENE_ENCODE_PROCESS_HPP
