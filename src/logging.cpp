/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "scene_encode/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace scene_encode {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const TimingEntry &e) { return e.name == name; });
  if (it == entries.end()) {
    entries.push_back({name, 0, 0, 0});
    it = entries.end() - 1;
  }
  it->calls++;
  it->microseconds += us;
  it->max_microseconds = std::max(it->max_microseconds, us);
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> out_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "======================== TIMING SUMMARY ========================\n");
  fmt::print("{:<16} {:>8} {:>12} {:>12} {:>12}\n", "Phase", "Calls",
             "Total [s]", "Mean [s]", "Max [s]");
  fmt::print("{:-<16} {:->8} {:->12} {:->12} {:->12}\n", "", "", "", "", "");

  for (const auto &e : entries) {
    double total = e.microseconds / 1000000.0;
    fmt::print("{:<16} {:>8} {:>12.2f} {:>12.2f} {:>12.2f}\n", e.name, e.calls,
               total, total / e.calls, e.max_microseconds / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "================================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace scene_encode
