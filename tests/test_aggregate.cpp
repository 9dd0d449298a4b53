// Whole-video statistics.

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "scene_encode/aggregate.hpp"

namespace scene_encode {
namespace {

MetricScores Flat(double score, size_t frames) {
  MetricScores s;
  s.mean = score;
  s.frames.assign(frames, score);
  return s;
}

SceneSample Sample(uint64_t frames, MetricScores scores, double quality = 0.0) {
  SceneSample s;
  s.frames = frames;
  s.quality = quality;
  s.scores = std::move(scores);
  return s;
}

TEST(AggregateTest, WeightsSceneMeansByFrameCount) {
  AggregateResult r;
  std::string error;
  ASSERT_TRUE(aggregate({Sample(40, Flat(30.0, 40), 20.0),
                         Sample(60, Flat(40.0, 60), 30.0)},
                        r, error))
      << error;
  EXPECT_EQ(r.scenes, 2u);
  EXPECT_EQ(r.frames, 100u);
  EXPECT_DOUBLE_EQ(r.weighted_mean, 36.0);
  EXPECT_DOUBLE_EQ(r.frame_scores.min, 30.0);
  EXPECT_DOUBLE_EQ(r.frame_scores.max, 40.0);
  EXPECT_EQ(r.frame_scores.count, 100u);
  EXPECT_DOUBLE_EQ(r.scene_lengths.mean, 50.0);
  EXPECT_EQ(r.measured_frames, 100u);
  EXPECT_DOUBLE_EQ(r.qualities.mean, 25.0);
  EXPECT_FALSE(r.quality_histogram.empty());
}

TEST(AggregateTest, SubsampledScenesKeepFrameWeights) {
  // Scene 1 measured every 4th frame: weight is still its length
  MetricScores sparse;
  sparse.mean = 50.0;
  sparse.frames = {50.0, 50.0};

  AggregateResult r;
  std::string error;
  std::vector<SceneSample> scenes = {Sample(10, Flat(10.0, 10)),
                                     Sample(30, sparse)};
  ASSERT_TRUE(aggregate(scenes, r, error));
  EXPECT_DOUBLE_EQ(r.weighted_mean, (10 * 10.0 + 30 * 50.0) / 40.0);
  EXPECT_EQ(r.frame_scores.count, 12u);
  EXPECT_EQ(r.measured_frames, 12u);
}

TEST(AggregateTest, ExpectedMetricFramesRoundsUpPerScene) {
  std::vector<SceneSample> scenes = {Sample(10, {}), Sample(30, {})};
  EXPECT_EQ(expected_metric_frames(scenes, 1), 40u);
  EXPECT_EQ(expected_metric_frames(scenes, 0), 40u);
  // ceil(10 / 4) + ceil(30 / 4)
  EXPECT_EQ(expected_metric_frames(scenes, 4), 3u + 8u);
}

TEST(AggregateTest, RejectsInputWithoutFrames) {
  AggregateResult r;
  std::string error;
  EXPECT_FALSE(aggregate({}, r, error));
  EXPECT_FALSE(error.empty());
  error.clear();
  EXPECT_FALSE(aggregate({Sample(0, {})}, r, error));
  EXPECT_FALSE(error.empty());
}

TEST(AggregateTest, QuantilesInterpolateLinearly) {
  std::vector<double> v = {1.0, 2.0, 3.0, 4.0, 5.0};
  EXPECT_DOUBLE_EQ(quantile_sorted(v, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(quantile_sorted(v, 1.0), 5.0);
  EXPECT_DOUBLE_EQ(quantile_sorted(v, 0.5), 3.0);
  EXPECT_DOUBLE_EQ(quantile_sorted(v, 0.125), 1.5);
  EXPECT_DOUBLE_EQ(quantile_sorted({7.0}, 0.3), 7.0);
  EXPECT_DOUBLE_EQ(quantile_sorted({}, 0.3), 0.0);
}

TEST(AggregateTest, DescribeComputesMomentsAndSigmaPoints) {
  Distribution d = describe({4.0, 2.0, 5.0, 1.0, 3.0});
  EXPECT_EQ(d.count, 5u);
  EXPECT_DOUBLE_EQ(d.min, 1.0);
  EXPECT_DOUBLE_EQ(d.max, 5.0);
  EXPECT_DOUBLE_EQ(d.mean, 3.0);
  EXPECT_DOUBLE_EQ(d.std_dev, std::sqrt(2.0));
  EXPECT_DOUBLE_EQ(d.median(), 3.0);
  for (size_t i = 1; i < d.sigma.size(); ++i) {
    EXPECT_LE(d.sigma[i - 1], d.sigma[i]);
  }
  EXPECT_NEAR(d.sigma[0], 1.0 + 4 * 0.001349898, 1e-12);
}

TEST(AggregateTest, HistogramCoversEveryValue) {
  std::vector<double> v;
  for (int i = 0; i <= 100; ++i)
    v.push_back(i * 0.5);  // 0 .. 50

  auto buckets = histogram(v);
  ASSERT_FALSE(buckets.empty());
  EXPECT_LE(buckets.size(), HISTOGRAM_BUCKETS + 1);
  EXPECT_LE(buckets.front().lower, 0.0);
  EXPECT_GE(buckets.back().upper, 50.0);

  size_t total = 0;
  for (const auto &b : buckets) {
    EXPECT_DOUBLE_EQ(b.upper - b.lower, buckets.front().upper -
                                            buckets.front().lower);
    total += b.count;
  }
  EXPECT_EQ(total, v.size());
}

TEST(AggregateTest, HistogramSpreadsNarrowSsimRange) {
  std::vector<double> v;
  for (int i = 0; i < 90; ++i)
    v.push_back(0.90 + i * 0.001);  // 0.900 .. 0.989

  auto buckets = histogram(v);
  ASSERT_GT(buckets.size(), 1u);
  EXPECT_LE(buckets.size(), HISTOGRAM_BUCKETS + 1);
  EXPECT_NEAR(buckets.front().lower, 0.90, 1e-9);
  EXPECT_NEAR(buckets.back().upper, 0.99, 1e-9);

  const double width = buckets.front().upper - buckets.front().lower;
  EXPECT_NEAR(width, 0.01, 1e-12);
  size_t total = 0;
  for (const auto &b : buckets) {
    EXPECT_NEAR(b.upper - b.lower, width, 1e-12);
    EXPECT_GT(b.count, 0u);
    total += b.count;
  }
  EXPECT_EQ(total, v.size());
}

TEST(AggregateTest, HistogramOfFewDecibels) {
  std::vector<double> v;
  for (int i = 0; i <= 50; ++i)
    v.push_back(40.0 + i * 0.1);  // 40.0 .. 45.0

  auto buckets = histogram(v);
  ASSERT_EQ(buckets.size(), 10u);
  EXPECT_NEAR(buckets.front().upper - buckets.front().lower, 0.5, 1e-12);

  size_t total = 0;
  for (const auto &b : buckets)
    total += b.count;
  EXPECT_EQ(total, v.size());
}

TEST(AggregateTest, HistogramOfConstantSample) {
  auto buckets = histogram({0.97, 0.97, 0.97});
  ASSERT_EQ(buckets.size(), 1u);
  EXPECT_EQ(buckets[0].count, 3u);
  EXPECT_TRUE(histogram({}).empty());
}

} // namespace
} // namespace scene_encode
