/**
 * @file scene_scheduler.cpp
 * @brief Scene scheduler implementation
 */

#include "scene_encode/scene_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <thread>

#include "scene_encode/logging.hpp"
#include "scene_encode/task_queue.hpp"

namespace scene_encode {

SceneScheduler::SceneScheduler(StageContext &ctx, const Fingerprint &probe_fp,
                               int workers)
    : ctx_(ctx), probe_fp_(probe_fp), workers_(std::max(1, workers)) {}

bool SceneScheduler::should_stop() const {
  return ctx_.config.cancelled() || ctx_.store.failed();
}

// **---- Per-scene task ----**

SceneResult SceneScheduler::process(const Scene &scene) {
  SceneResult result;
  result.scene = scene;

  TIMER_START(scene);
  auto start = std::chrono::steady_clock::now();
  StageId current = StageId::Extract;
  std::string error;
  bool ok = false;

  try {
    ok = run_extract(ctx_, probe_fp_, scene, result.clip, error);
    if (ok && ctx_.config.search.enabled()) {
      SearchOutput search;
      current = StageId::Encode;
      ok = run_quality_search(ctx_, scene, result.clip, search, current, error);
      if (ok) {
        result.quality = search.quality;
        result.trials = std::move(search.trials);
        result.encoded = std::move(search.encoded);
        result.metrics = std::move(search.metrics);
      }
    } else if (ok) {
      const EncoderSettings &encoder = ctx_.config.encoder;
      result.quality = encoder.quality;
      current = StageId::Encode;
      ok = run_encode(ctx_, scene, result.clip, encoder, result.encoded, error);
      if (ok) {
        current = StageId::Measure;
        ok = run_measure(ctx_, scene, result.clip, result.encoded,
                         result.metrics, error);
      }
    }
  } catch (const std::exception &e) {
    ok = false;
    error = e.what();
  }

  TIMER_END(scene);
  result.seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  if (ok) {
    bool all_cached =
        result.clip.cached && result.encoded.cached && result.metrics.cached &&
        std::all_of(result.trials.begin(), result.trials.end(),
                    [](const SearchTrial &t) { return t.cached; });
    result.status = all_cached ? SceneStatus::Cached : SceneStatus::Recomputed;
    return result;
  }

  /// A child killed by the interrupt is not a scene failure
  if (ctx_.config.cancelled()) {
    result.status = SceneStatus::Skipped;
    result.error = "interrupted";
    return result;
  }

  result.status = SceneStatus::Failed;
  result.failed_stage = current;
  result.error = std::move(error);
  return result;
}

// **---- Scheduling ----**

std::vector<SceneResult> SceneScheduler::run(const std::vector<Scene> &scenes) {
  if (scenes.empty())
    return {};

  /// Longest scenes first so the tail of the run is not one long encode
  std::vector<Scene> order = scenes;
  std::stable_sort(order.begin(), order.end(),
                   [](const Scene &a, const Scene &b) {
                     return a.length() > b.length();
                   });

  TaskQueue task_queue;
  ResultCollector results;
  results.reserve(scenes.size());

  for (const auto &scene : order) {
    task_queue.push(scene);
  }
  task_queue.finish();

  const size_t total = scenes.size();
  PaddedAtomic<size_t> failures{0};

  std::vector<std::thread> threads;
  threads.reserve(static_cast<size_t>(workers_));

  for (int i = 0; i < workers_; ++i) {
    threads.emplace_back([this, &task_queue, &results, &failures, total]() {
      Scene scene;
      while (!should_stop() && task_queue.pop(scene)) {
        SceneResult result = process(scene);

        std::string tag = scene_tag(result.scene.index);
        SceneStatus status = result.status;
        std::string error = result.error;
        StageId failed_stage = result.failed_stage;
        double seconds = result.seconds;
        double score = result.metrics.scores.mean;
        double quality = result.quality;
        uint64_t frames = result.scene.length();

        size_t done = results.add(std::move(result));

        if (status == SceneStatus::Failed) {
          ++failures;
          LOG_ERROR("{} {} failed: {} [{}/{}]", tag, stage_name(failed_stage),
                    error, done, total);
        } else if (status == SceneStatus::Skipped) {
          LOG_WARN("{} interrupted [{}/{}]", tag, done, total);
        } else {
          LOG_INFO("{} {} ({} frames, quality {}, score {:.4f}) in {:.1f}s "
                   "[{}/{}]",
                   tag, scene_status_name(status), frames, quality, score,
                   seconds, done, total);
        }
      }
    });
  }

  for (auto &t : threads) {
    t.join();
  }

  /// Scenes left in the queue were never started
  for (const auto &scene : task_queue.cancel()) {
    SceneResult skipped;
    skipped.scene = scene;
    skipped.status = SceneStatus::Skipped;
    results.add(std::move(skipped));
  }

  std::vector<SceneResult> out = results.extract();
  if (failures.load() > 0) {
    LOG_WARN("{} of {} scenes failed", failures.load(), total);
  }
  return out;
}

} // namespace scene_encode
