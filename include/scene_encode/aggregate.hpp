/**
 * @file aggregate.hpp
 * @brief Whole-video statistics from per-scene metric scores
 *
 * @details Plain numeric reduction, no caching (its inputs are cached):
 *
 *          - frame-count-weighted mean of the scene means
 *
 *          - distribution of per-frame scores: min, max, mean, standard
 *            deviation and the quantiles at -3..+3 sigma of a normal
 *            distribution (linear interpolation between order statistics)
 *
 *          - the same distribution over scene lengths and over the encoder
 *            quality each scene was encoded at
 *
 *          - histograms of per-frame scores and of scene qualities
 */

#ifndef SCENE_ENCODE_AGGREGATE_HPP
#define SCENE_ENCODE_AGGREGATE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace scene_encode {

constexpr size_t HISTOGRAM_BUCKETS = 16;

/// Quantiles at -3, -2, -1, 0, +1, +2, +3 sigma
constexpr std::array<double, 7> SIGMA_QUANTILES = {
    0.001349898, 0.022750132, 0.158655254, 0.5,
    0.841344746, 0.977249868, 0.998650102};

/**
 * @struct Distribution
 * @brief Summary of a sample.
 */
struct Distribution {
  size_t count = 0;
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double std_dev = 0.0; //< Population standard deviation
  std::array<double, 7> sigma{}; //< Values at SIGMA_QUANTILES

  double median() const { return sigma[3]; }
};

struct HistogramBucket {
  double lower = 0.0;
  double upper = 0.0;
  size_t count = 0;
};

/**
 * @struct SceneSample
 * @brief One completed scene as seen by the aggregate.
 */
struct SceneSample {
  uint64_t frames = 0;  //< Scene length
  double quality = 0.0; //< Encoder quality used for the scene
  MetricScores scores;
};

/**
 * @struct AggregateResult
 * @brief Whole-video view of one run.
 */
struct AggregateResult {
  size_t scenes = 0;
  uint64_t frames = 0;
  uint64_t measured_frames = 0; //< Per-frame scores the metric reported
  double weighted_mean = 0.0;   //< sum(len * scene mean) / sum(len)
  Distribution frame_scores;
  Distribution scene_lengths;
  Distribution qualities;
  std::vector<HistogramBucket> histogram;
  std::vector<HistogramBucket> quality_histogram;
};

/**
 * @brief Quantile of an ascending sample with linear interpolation.
 * @note Position q * (n - 1); an empty sample yields 0.
 */
double quantile_sorted(const std::vector<double> &sorted, double q);

/// Summarize @p values (any order)
Distribution describe(std::vector<double> values);

/**
 * @brief Histogram with at most about @p buckets buckets.
 *
 * @details A range of at least @p buckets units gets integer widths,
 *          ceil((max - min) / buckets). A narrower range (SSIM scores, a few
 *          CRF steps) uses the smallest 1, 2 or 5 times a power of ten that
 *          covers it in @p buckets steps. The range is widened outwards to
 *          multiples of the width; the top value lands in the last bucket.
 *          A constant sample gives a single bucket of width 1.
 */
std::vector<HistogramBucket> histogram(const std::vector<double> &values,
                                       size_t buckets = HISTOGRAM_BUCKETS);

/**
 * @brief Reduce per-scene results to whole-video statistics.
 *
 * @param scenes Every scene, in scene order
 * @param result Output
 * @param error Output: cause on failure (no frames)
 */
bool aggregate(const std::vector<SceneSample> &scenes, AggregateResult &result,
               std::string &error);

/// Per-frame scores a metric sampling every @p subsample frames reports
uint64_t expected_metric_frames(const std::vector<SceneSample> &scenes,
                                int subsample);

} // namespace scene_encode

#endif // SCENE_ENCODE_AGGREGATE_HPP
