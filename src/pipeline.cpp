/**
 * @file pipeline.cpp
 * @brief Whole-run orchestration implementation
 *
 * @details Fatal conditions (unreadable source, no video stream, broken scene
 *          partition, unusable cache record) end the run immediately. Scene
 *          failures are collected by the scheduler and end the run before
 *          merge. A cancelled run reports RunStatus::Interrupted; whatever was
 *          committed before the interrupt is reused by the next run.
 */

#include "scene_encode/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

#include <fmt/core.h>

#include "scene_encode/aggregate.hpp"
#include "scene_encode/fingerprint.hpp"
#include "scene_encode/logging.hpp"
#include "scene_encode/scene_scheduler.hpp"
#include "scene_encode/system.hpp"

namespace scene_encode {

// **---- Constructor ----**

Pipeline::Pipeline(PipelineConfig config, MediaBackend &media)
    : config_(std::move(config)),
      configured_encode_threads_(config_.encode_threads), media_(media),
      layout_(config_.output_dir), store_(layout_) {}

RunStatus Pipeline::fail(const std::string &what, const std::string &error) {
  LOG_ERROR("{}: {}", what, error);
  return RunStatus::Fatal;
}

// **---- Main Processing ----**

RunStatus Pipeline::run() {
  TIMER_START(total_run);
  auto start = std::chrono::steady_clock::now();

  summary_ = RunSummary{};
  counters_.reset();
  config_.encode_threads = configured_encode_threads_;
  summary_.source = config_.source.string();
  summary_.metric = metric_kind_name(config_.metric.kind);
  summary_.searched = config_.search.enabled();

  StageContext ctx{store_, media_, config_, layout_, counters_};

  RunStatus status;
  try {
    status = execute(ctx);
  } catch (const std::exception &e) {
    /// Digest or filesystem failures outside any scene task
    status = fail("Pipeline aborted", e.what());
  }

  if (status != RunStatus::Success && config_.cancelled()) {
    status = RunStatus::Interrupted;
  }

  summary_.status = status;
  summary_.encoder = config_.output_identifier();
  summary_.cache = store_.counters();
  for (size_t i = 0; i < STAGE_COUNT; ++i) {
    summary_.hits[i] = counters_.hits(static_cast<StageId>(i));
    summary_.misses[i] = counters_.misses(static_cast<StageId>(i));
  }
  summary_.seconds = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  TIMER_END(total_run);

  if (report_ && layout_ready_) {
    std::string error;
    if (!write_report(summary_, layout_, error)) {
      LOG_WARN("Report not written: {}", error);
    }
    print_report(summary_);
  }

  switch (status) {
  case RunStatus::Success:
    LOG_SUCCESS("Done: {} scenes, {} ({})", summary_.scenes.size(),
                summary_.merged ? summary_.output.path.string() : "",
                format_time(summary_.seconds));
    break;
  case RunStatus::Interrupted:
    LOG_WARN("Interrupted; rerun to resume from the committed scenes");
    break;
  case RunStatus::ScenesFailed:
  case RunStatus::Fatal:
    break;
  }
  return status;
}

RunStatus Pipeline::execute(StageContext &ctx) {
  std::string error;

  // **----- PHASE 0: OUTPUT DIRECTORY AND CACHE -----**

  LOG_PHASE("Opening {}...", config_.output_dir.string());
  if (!verify_directory(config_.output_dir, error))
    return fail("Output directory unusable", error);
  if (!layout_.create(error))
    return fail("Output directory unusable", error);
  layout_ready_ = true;

  if (!store_.load(error))
    return fail("Cache record unusable", error);
  LOG_INFO("Cache record: {} entries", store_.size());

  // **----- PHASE 1: PROBE -----**

  LOG_PHASE("Probing {}...", config_.source.string());
  TIMER_START(probe);

  Fingerprint source_id;
  if (!source_identity(config_.source, source_id, error))
    return fail("Cannot read source", error);

  ProbeOutput probe;
  if (!run_probe(ctx, source_id, probe, error))
    return fail("Probe failed", error);
  if (probe.info.frame_count == 0)
    return fail("Probe failed", "source has no video frames");
  TIMER_END(probe);

  summary_.probe = probe.info;
  config_.encoder.keyint = derive_keyint(probe.info, config_.keyint_sec);

  LOG_INFO("Duration: {} ({} frames @ {:.3f}fps, {}x{}){}",
           format_time(probe.info.duration), probe.info.frame_count,
           probe.info.frame_rate.value(), probe.info.width, probe.info.height,
           probe.cached ? " [cached]" : "");
  if (!probe.info.crop.empty()) {
    LOG_INFO("Crop: {}", probe.info.crop.filter());
  }

  // **----- PHASE 2: SCENE DETECTION -----**

  LOG_PHASE("Detecting scenes...");
  TIMER_START(detect);

  DetectOutput detect;
  if (!run_detect(ctx, probe, detect, error))
    return fail("Scene detection failed", error);
  TIMER_END(detect);

  LOG_INFO("{} scenes{}", detect.scenes.size(),
           detect.cached ? " [cached]" : "");

  if (config_.cancelled())
    return RunStatus::Interrupted;

  // **----- PHASE 3: PER-SCENE EXTRACT / ENCODE / MEASURE -----**

  int workers = resolve_worker_count(config_.workers, detect.scenes.size());
  summary_.workers = workers;
  if (config_.encode_threads <= 0)
    config_.encode_threads = std::max(1, detect_cpu_limit() / workers);
  LOG_PHASE("Encoding {} scenes ({}, {} workers)...", detect.scenes.size(),
            config_.output_identifier(), workers);

  TIMER_START(scenes);
  SceneScheduler scheduler(ctx, probe.fp, workers);
  summary_.scenes = scheduler.run(detect.scenes);
  TIMER_END(scenes);

  if (store_.failed())
    return fail("Cache record unusable", "record file could not be written");
  if (config_.cancelled())
    return RunStatus::Interrupted;

  std::vector<size_t> failed = summary_.failed_scenes();
  if (!failed.empty()) {
    std::string list;
    for (size_t i = 0; i < failed.size(); ++i) {
      list += (i ? ", " : "") + std::to_string(failed[i]);
    }
    LOG_ERROR("{} scene(s) failed: [{}]; not merging", failed.size(), list);
    return RunStatus::ScenesFailed;
  }
  if (summary_.count(SceneStatus::Skipped) > 0)
    return RunStatus::Interrupted;

  // **----- PHASE 4: MERGE -----**

  LOG_PHASE("Merging...");
  TIMER_START(merge);

  std::vector<ArtifactOutput> encoded;
  std::vector<SceneSample> samples;
  encoded.reserve(summary_.scenes.size());
  samples.reserve(summary_.scenes.size());
  for (const auto &r : summary_.scenes) {
    encoded.push_back(r.encoded);
    SceneSample sample;
    sample.frames = r.scene.length();
    sample.quality = r.quality;
    sample.scores = r.metrics.scores;
    samples.push_back(std::move(sample));
  }

  if (!run_merge(ctx, encoded, summary_.output, error))
    return fail("Merge failed", error);
  summary_.merged = true;
  TIMER_END(merge);

  if (probe.info.duration > 0.0) {
    summary_.bitrate =
        static_cast<double>(summary_.output.size) * 8.0 / probe.info.duration;
  }
  LOG_INFO("Output: {} ({}, {:.0f} kbps){}", summary_.output.path.string(),
           format_bytes(summary_.output.size), summary_.bitrate / 1000.0,
           summary_.output.cached ? " [cached]" : "");

  // **----- PHASE 5: AGGREGATE -----**

  if (!aggregate(samples, summary_.aggregate, error))
    return fail("Aggregate failed", error);
  summary_.has_aggregate = true;
  summary_.expected_metric_frames =
      expected_metric_frames(samples, config_.metric.subsample);

  if (summary_.frame_mismatch()) {
    LOG_WARN("{} reported {} frames, expected {}", summary_.metric,
             summary_.aggregate.measured_frames,
             summary_.expected_metric_frames);
  }

  LOG_INFO("{} weighted mean: {:.4f}", summary_.metric,
           summary_.aggregate.weighted_mean);
  return RunStatus::Success;
}

} // namespace scene_encode
