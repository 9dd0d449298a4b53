/**
 * @file system.hpp
 * @brief System utilities: CPU detection, worker sizing, directories, time
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count resolution for the scene scheduler
 *
 *          - Output directory creation and writability checks
 *
 *          - Time formatting utilities
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef SCENE_ENCODE_SYSTEM_HPP
#define SCENE_ENCODE_SYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace scene_encode {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Resolve the number of scene workers.
 *
 * @param configured Requested workers (0 = auto)
 * @param scenes Number of scenes to process
 * @return min(configured or detected CPUs, scenes), at least 1
 */
int resolve_worker_count(int configured, size_t scenes);

// **---- Filesystem ----**

/**
 * @brief Create @p dir (and parents) if needed and check it is writable.
 * @param error Output: cause on failure
 * @return true if the directory exists and accepts new files
 */
bool verify_directory(const std::filesystem::path &dir, std::string &error);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count with a binary unit, e.g. "12.3 MiB".
 */
std::string format_bytes(uint64_t bytes);

} // namespace scene_encode

#endif // SCENE_ENCODE_SYSTEM_HPP
