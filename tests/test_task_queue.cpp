// Scene queue and result collection under concurrency.

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "scene_encode/task_queue.hpp"

namespace scene_encode {
namespace {

Scene MakeScene(size_t index) {
  Scene s;
  s.index = index;
  s.start = index * 10;
  s.end = s.start + 10;
  return s;
}

TEST(TaskQueueTest, PopsInPushOrderThenStops) {
  TaskQueue queue;
  queue.push(MakeScene(2));
  queue.push(MakeScene(0));
  queue.finish();

  Scene s;
  ASSERT_TRUE(queue.pop(s));
  EXPECT_EQ(s.index, 2u);
  ASSERT_TRUE(queue.pop(s));
  EXPECT_EQ(s.index, 0u);
  EXPECT_FALSE(queue.pop(s));
}

TEST(TaskQueueTest, CancelReturnsUntakenScenes) {
  TaskQueue queue;
  for (size_t i = 0; i < 5; ++i)
    queue.push(MakeScene(i));

  Scene s;
  ASSERT_TRUE(queue.pop(s));
  auto dropped = queue.cancel();
  ASSERT_EQ(dropped.size(), 4u);
  EXPECT_EQ(dropped.front().index, 1u);
  EXPECT_FALSE(queue.pop(s));
  EXPECT_TRUE(queue.cancel().empty());
}

TEST(TaskQueueTest, FinishWakesBlockedWorkers) {
  TaskQueue queue;
  std::atomic<int> exited{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&]() {
      Scene s;
      while (queue.pop(s)) {
      }
      exited++;
    });
  }
  queue.finish();
  for (auto &w : workers)
    w.join();
  EXPECT_EQ(exited.load(), 4);
}

TEST(TaskQueueTest, EveryTaskIsTakenExactlyOnce) {
  constexpr size_t kScenes = 500;
  TaskQueue queue;
  ResultCollector results;
  results.reserve(kScenes);

  for (size_t i = 0; i < kScenes; ++i)
    queue.push(MakeScene(i));
  queue.finish();

  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&]() {
      Scene s;
      while (queue.pop(s)) {
        SceneResult r;
        r.scene = s;
        r.status = SceneStatus::Recomputed;
        results.add(std::move(r));
      }
    });
  }
  for (auto &w : workers)
    w.join();

  auto collected = results.extract();
  ASSERT_EQ(collected.size(), kScenes);
  for (size_t i = 0; i < kScenes; ++i) {
    EXPECT_EQ(collected[i].scene.index, i);
  }
  EXPECT_TRUE(results.extract().empty());
}

} // namespace
} // namespace scene_encode
