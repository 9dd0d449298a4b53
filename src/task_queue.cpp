/**
 * @file task_queue.cpp
 * @brief Thread-safe scene queue and result collection implementation
 */

#include "scene_encode/task_queue.hpp"

#include <algorithm>

namespace scene_encode {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(Scene task) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push_back(std::move(task));
  cv.notify_one();
}

bool TaskQueue::pop(Scene &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = tasks.front();
  tasks.pop_front();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

std::vector<Scene> TaskQueue::cancel() {
  std::vector<Scene> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex);
    dropped.assign(tasks.begin(), tasks.end());
    tasks.clear();
    done.store(true);
  }
  cv.notify_all();
  return dropped;
}

// **----- ResultCollector Implementation -----**

void ResultCollector::reserve(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  results.reserve(n);
}

size_t ResultCollector::add(SceneResult &&result) {
  std::lock_guard<std::mutex> lock(mutex);
  results.push_back(std::move(result));
  return results.size();
}

std::vector<SceneResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<SceneResult> out = std::move(results);
  results.clear();
  std::sort(out.begin(), out.end(),
            [](const SceneResult &a, const SceneResult &b) {
              return a.scene.index < b.scene.index;
            });
  return out;
}

} // namespace scene_encode
