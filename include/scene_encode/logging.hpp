/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so that interleaved worker output stays readable.
 *
 */

#ifndef SCENE_ENCODE_LOGGING_HPP
#define SCENE_ENCODE_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace scene_encode {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(scene_encode::log_mutex);                 \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(scene_encode::log_mutex);                 \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(scene_encode::log_mutex);                 \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(scene_encode::log_mutex);                 \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(scene_encode::log_mutex);                 \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

/**
 * @brief Format the "[Scene NNNNN]" prefix used by per-scene log lines.
 */
inline std::string scene_tag(size_t index) {
  return fmt::format("[Scene {:05}]", index);
}

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: accumulated measurements for one phase.
 * @note Per-scene phases are recorded once per scene and summed here.
 */
struct TimingEntry {
  std::string name;       //< Phase name
  long calls = 0;         //< Number of recorded measurements
  long microseconds = 0;  //< Sum of durations
  long max_microseconds = 0;
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for phase durations.
 * @note Entries keep first-recorded order so the summary reads top-down.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Add one measurement to the entry named @p name.
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /// Print collected timings, one row per phase
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    scene_encode::TimingCollector::record(#name, timer_duration_##name);       \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace scene_encode

#endif // SCENE_ENCODE_LOGGING_HPP
