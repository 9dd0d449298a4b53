/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count resolution
 *
 *          - Directory checks and formatting helpers
 */

#include "scene_encode/system.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

namespace scene_encode {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to parse cpuset string like "0,2,4,6,8" or "0-3" into CPU list
std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  if (line.empty())
    return cpus;

  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find_first_of(",-", pos);
    if (end == std::string::npos)
      end = line.size();

    int start_cpu = std::stoi(line.substr(pos, end - pos));

    if (end < line.size() && line[end] == '-') {
      /// Range like "0-3"
      pos = end + 1;
      end = line.find(',', pos);
      if (end == std::string::npos)
        end = line.size();
      int end_cpu = std::stoi(line.substr(pos, end - pos));
      for (int cpu = start_cpu; cpu <= end_cpu; ++cpu) {
        cpus.push_back(cpu);
      }
    } else {
      cpus.push_back(start_cpu);
    }

    pos = (end < line.size()) ? end + 1 : line.size();
  }
  return cpus;
}

/// Helper to count CPUs from cpuset string
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  try {
    auto cpus = parse_cpuset_string(line);
    return cpus.empty() ? -1 : static_cast<int>(cpus.size());
  } catch (const std::exception &) {
    ///\note Malformed cpuset contents mean "unknown", not an error
    return -1;
  }
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    std::string quota_str, period_str;
    if (f && (f >> quota_str >> period_str) && quota_str != "max") {
      long quota = std::strtol(quota_str.c_str(), nullptr, 10);
      long period = std::strtol(period_str.c_str(), nullptr, 10);
      if (quota > 0 && period > 0) {
        limit = static_cast<int>((quota + period - 1) / period);
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int resolve_worker_count(int configured, size_t scenes) {
  int workers = configured > 0 ? configured : detect_cpu_limit();
  if (scenes > 0 && static_cast<size_t>(workers) > scenes) {
    workers = static_cast<int>(scenes);
  }
  return std::max(1, workers);
}

// **---- Filesystem ----**

bool verify_directory(const std::filesystem::path &dir, std::string &error) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = fmt::format("Cannot create directory {}: {}", dir.string(),
                        ec.message());
    return false;
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    error = fmt::format("{} is not a directory", dir.string());
    return false;
  }

  /// Writability probe (access(2) does not see read-only mounts)
  auto probe = dir / fmt::format(".write-test.{}", getpid());
  int fd = open(probe.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd == -1) {
    error = fmt::format("Directory {} is not writable: {}", dir.string(),
                        std::strerror(errno));
    return false;
  }
  close(fd);
  unlink(probe.c_str());
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_bytes(uint64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0)
    return fmt::format("{} B", bytes);
  return fmt::format("{:.1f} {}", value, units[unit]);
}

} // namespace scene_encode
