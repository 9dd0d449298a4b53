/**
 * @file scene_scheduler.hpp
 * @brief Bounded-parallel extract/encode/measure over scenes
 *
 * @details One task per scene. A task runs its three sub-stages strictly in
 *          order (extract, encode, measure); tasks of different scenes run
 *          concurrently on a fixed pool of worker threads pulling from a
 *          shared TaskQueue.
 *
 * @attention Every external tool call is a blocking child process wait on the
 *            worker thread, so the worker count is also the cap on concurrent
 *            ffmpeg processes.
 *
 * @note A failing scene never aborts its siblings. Failures are collected and
 *       returned together once every scene has been attempted.
 */

#ifndef SCENE_ENCODE_SCENE_SCHEDULER_HPP
#define SCENE_ENCODE_SCENE_SCHEDULER_HPP

#include <cstddef>
#include <vector>

#include "fingerprint.hpp"
#include "stages.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @class SceneScheduler
 * @brief Runs the per-scene stages for a scene list.
 */
class SceneScheduler {
public:
  /**
   * @param ctx Stage context shared by all workers
   * @param probe_fp Fingerprint of the probe result (upstream of extract)
   * @param workers Thread count, already resolved (>= 1)
   */
  SceneScheduler(StageContext &ctx, const Fingerprint &probe_fp, int workers);

  /**
   * @brief Process every scene.
   *
   * @return One result per scene, ordered by scene index. Scenes never
   *         started because of cancellation (or a failed cache store) are
   *         reported as Skipped.
   */
  std::vector<SceneResult> run(const std::vector<Scene> &scenes);

  int workers() const { return workers_; }

private:
  /// Extract, encode and measure one scene; never throws
  SceneResult process(const Scene &scene);

  /// True once workers must stop taking new scenes
  bool should_stop() const;

  StageContext &ctx_;
  Fingerprint probe_fp_;
  int workers_;
};

} // namespace scene_encode

#endif // SCENE_ENCODE_SCENE_SCHEDULER_HPP
