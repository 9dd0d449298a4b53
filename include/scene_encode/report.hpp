/**
 * @file report.hpp
 * @brief Run summary, report.json and console statistics
 *
 * @details The report always lists every scene with its status, so a rerun
 *          is predictable from the previous report alone.
 */

#ifndef SCENE_ENCODE_REPORT_HPP
#define SCENE_ENCODE_REPORT_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aggregate.hpp"
#include "cache_store.hpp"
#include "layout.hpp"
#include "stages.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @struct RunSummary
 * @brief Everything known about a run once it stops.
 */
struct RunSummary {
  RunStatus status = RunStatus::Success;
  std::string source;
  std::string encoder;  //< PipelineConfig::output_identifier()
  std::string metric;   //< Metric name
  int workers = 0;
  bool searched = false; //< Scene qualities came from a quality search
  double seconds = 0.0; //< Wall time of the whole run

  ProbeInfo probe;
  std::vector<SceneResult> scenes;

  bool merged = false;
  ArtifactOutput output; //< Valid when merged
  double bitrate = 0.0;  //< Output bits per second of source duration

  bool has_aggregate = false;
  AggregateResult aggregate;
  uint64_t expected_metric_frames = 0; //< What the metric should have scored

  /// Metric frame count differs from the scene lengths and subsampling
  bool frame_mismatch() const {
    return has_aggregate &&
           aggregate.measured_frames != expected_metric_frames;
  }

  CacheCounters cache;
  std::array<uint64_t, STAGE_COUNT> hits{};
  std::array<uint64_t, STAGE_COUNT> misses{};

  size_t count(SceneStatus status) const;
  std::vector<size_t> failed_scenes() const;
};

/// report.json document; artifact paths are relative to @p layout root
nlohmann::json report_json(const RunSummary &summary,
                           const OutputLayout &layout);

/**
 * @brief Write report.json through a temporary file and rename.
 */
bool write_report(const RunSummary &summary, const OutputLayout &layout,
                  std::string &error);

/**
 * @brief Print the per-scene table, cache counters, histogram and
 *        statistics to stdout.
 */
void print_report(const RunSummary &summary);

} // namespace scene_encode

#endif // SCENE_ENCODE_REPORT_HPP
