/**
 * @file aggregate.cpp
 * @brief Whole-video statistics implementation
 */

#include "scene_encode/aggregate.hpp"

#include <algorithm>
#include <cmath>

namespace scene_encode {

double quantile_sorted(const std::vector<double> &sorted, double q) {
  if (sorted.empty())
    return 0.0;
  if (sorted.size() == 1)
    return sorted.front();

  q = std::min(1.0, std::max(0.0, q));
  double pos = q * static_cast<double>(sorted.size() - 1);
  auto lo = static_cast<size_t>(std::floor(pos));
  size_t hi = std::min(lo + 1, sorted.size() - 1);
  double frac = pos - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

Distribution describe(std::vector<double> values) {
  Distribution d;
  d.count = values.size();
  if (values.empty())
    return d;

  std::sort(values.begin(), values.end());
  d.min = values.front();
  d.max = values.back();

  double sum = 0.0;
  for (double v : values)
    sum += v;
  d.mean = sum / static_cast<double>(values.size());

  double sq = 0.0;
  for (double v : values)
    sq += (v - d.mean) * (v - d.mean);
  d.std_dev = std::sqrt(sq / static_cast<double>(values.size()));

  for (size_t i = 0; i < SIGMA_QUANTILES.size(); ++i) {
    d.sigma[i] = quantile_sorted(values, SIGMA_QUANTILES[i]);
  }
  return d;
}

namespace {

/// Smallest 1, 2 or 5 times a power of ten that is at least @p raw
double nice_step(double raw) {
  double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
  for (double m : {1.0, 2.0, 5.0, 10.0}) {
    if (m * magnitude >= raw)
      return m * magnitude;
  }
  return 10.0 * magnitude;
}

} // namespace

std::vector<HistogramBucket> histogram(const std::vector<double> &values,
                                       size_t buckets) {
  std::vector<HistogramBucket> out;
  if (values.empty() || buckets == 0)
    return out;

  auto [lo_it, hi_it] = std::minmax_element(values.begin(), values.end());
  const double range = *hi_it - *lo_it;
  const double raw = range / static_cast<double>(buckets);

  double width = 1.0;
  if (raw >= 1.0) {
    width = std::ceil(raw);
  } else if (range > 0.0) {
    width = nice_step(raw);
  }

  // Tolerate quotients like 89.999999 for values already on a boundary
  constexpr double slack = 1e-9;
  double lo = std::floor(*lo_it / width + slack) * width;
  double hi = std::ceil(*hi_it / width - slack) * width;
  auto count = static_cast<size_t>(std::llround((hi - lo) / width));
  count = std::max<size_t>(count, 1);

  out.resize(count);
  for (size_t i = 0; i < count; ++i) {
    out[i].lower = lo + static_cast<double>(i) * width;
    out[i].upper = out[i].lower + width;
  }

  const double last = static_cast<double>(count - 1);
  for (double v : values) {
    double i = std::floor((v - lo) / width);
    i = std::min(last, std::max(0.0, i));
    out[static_cast<size_t>(i)].count++;
  }
  return out;
}

bool aggregate(const std::vector<SceneSample> &scenes, AggregateResult &result,
               std::string &error) {
  result = AggregateResult{};
  result.scenes = scenes.size();

  double weighted = 0.0;
  std::vector<double> frame_values;
  std::vector<double> length_values;
  std::vector<double> quality_values;
  length_values.reserve(scenes.size());
  quality_values.reserve(scenes.size());

  for (const auto &scene : scenes) {
    result.frames += scene.frames;
    result.measured_frames += scene.scores.frames.size();
    weighted += static_cast<double>(scene.frames) * scene.scores.mean;
    length_values.push_back(static_cast<double>(scene.frames));
    quality_values.push_back(scene.quality);

    /// Scenes without per-frame values contribute their mean once per frame
    if (scene.scores.frames.empty()) {
      frame_values.insert(frame_values.end(), scene.frames, scene.scores.mean);
    } else {
      frame_values.insert(frame_values.end(), scene.scores.frames.begin(),
                          scene.scores.frames.end());
    }
  }

  if (result.frames == 0) {
    error = "No frames to aggregate";
    return false;
  }

  result.weighted_mean = weighted / static_cast<double>(result.frames);
  result.frame_scores = describe(frame_values);
  result.scene_lengths = describe(std::move(length_values));
  result.histogram = histogram(frame_values);
  result.quality_histogram = histogram(quality_values);
  result.qualities = describe(std::move(quality_values));
  return true;
}

uint64_t expected_metric_frames(const std::vector<SceneSample> &scenes,
                                int subsample) {
  const uint64_t step = subsample > 1 ? static_cast<uint64_t>(subsample) : 1;
  uint64_t total = 0;
  for (const auto &scene : scenes)
    total += (scene.frames + step - 1) / step;
  return total;
}

} // namespace scene_encode
