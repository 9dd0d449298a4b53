/**
 * @file task_queue.hpp
 * @brief Thread-safe scene queue and result collection
 *
 * @details Provides:
 *          - TaskQueue: shared queue of scenes for dynamic load balancing
 *
 *          - ResultCollector: thread-safe aggregator for SceneResult
 */

#ifndef SCENE_ENCODE_TASK_QUEUE_HPP
#define SCENE_ENCODE_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "stages.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @class TaskQueue
 * @brief Thread-safe queue of scenes shared by all workers.
 *
 * @attention DESIGN:
 *
 * - Workers pop scenes from a shared queue
 *
 * - A worker stuck on a long scene does not hold back the others
 *
 * - cancel() drops whatever has not been taken yet
 *
 * @note Scenes are not partitioned statically since encode time varies
 *       wildly with content.
 */
class TaskQueue {
  std::deque<Scene> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a scene to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(Scene task);

  /**
   * @brief Pop a scene from the queue.
   * @note Blocks until a scene is available or the queue is finished.
   * @return true if a scene was retrieved, false if queue is empty and done
   */
  bool pop(Scene &task);

  /**
   * @brief Signal that no more scenes will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();

  /**
   * @brief Finish the queue and return the scenes nobody took.
   */
  std::vector<Scene> cancel();
};

/**
 * @class ResultCollector
 * @brief Thread-safe aggregator for per-scene results.
 */
class ResultCollector {
  std::vector<SceneResult> results;
  std::mutex mutex;

public:
  void reserve(size_t n);

  /**
   * @brief Add a result from a worker thread.
   * @return Number of results collected so far (for progress lines)
   */
  size_t add(SceneResult &&result);

  /**
   * @brief Extract all collected results, sorted by scene index.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<SceneResult> extract();
};

} // namespace scene_encode

#endif // SCENE_ENCODE_TASK_QUEUE_HPP
