/**
 * @file quality_search.hpp
 * @brief Per-scene search for the encoder quality that meets a metric goal
 *
 * @details The search bisects an integer quality range. Every trial encodes
 *          the scene at one quality, measures it, and reduces the per-frame
 *          scores to the configured percentile. The rule then decides which
 *          half of the range is still interesting:
 *
 *          - Minimum: keep the cheapest quality whose score reaches the target
 *
 *          - Maximum: keep the most expensive quality whose score stays at or
 *            below the target
 *
 *          - Target: keep the quality whose score is closest to the target
 *
 *          "Cheaper" means a higher CRF/QP, or a lower bitrate.
 *
 * @note The search itself holds no cache state. Trials are plain encode and
 *       measure results, so repeating a search over an unchanged scene only
 *       hits the cache.
 */

#ifndef SCENE_ENCODE_QUALITY_SEARCH_HPP
#define SCENE_ENCODE_QUALITY_SEARCH_HPP

#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @class QualityRange
 * @brief Remaining integer interval of a bisection.
 */
class QualityRange {
public:
  QualityRange(int minimum, int maximum) : lo_(minimum), hi_(maximum) {}

  int minimum() const { return lo_; }
  int maximum() const { return hi_; }

  /// Midpoint of the remaining interval; false once it is empty
  bool current(int &quality) const {
    if (lo_ > hi_)
      return false;
    quality = lo_ + (hi_ - lo_) / 2;
    return true;
  }

  /// Drop the current value and everything below it
  void higher();

  /// Drop the current value and everything above it
  void lower();

private:
  int lo_;
  int hi_;
};

/**
 * @brief Searchable quality interval for an encoder.
 *
 * @details CRF/QP: 0..51 for x264 and x265, 0..63 for aom. Bitrate:
 *          100..20000 kbit/s. SearchSettings::min_quality/max_quality
 *          override either end when not negative.
 */
QualityRange default_quality_range(const EncoderSettings &encoder,
                                   const SearchSettings &search);

/// Score at @p percentile (0..1) of the per-frame values, or the mean
double percentile_score(const MetricScores &scores, double percentile);

struct SearchTrial {
  int quality = 0;
  double score = 0.0;
  bool cached = false; //< Encode and measure were both cache hits
};

/**
 * @class QualitySearch
 * @brief Decision state of one scene's search.
 *
 * @code
 *   QualitySearch search(settings, mode, range);
 *   int q;
 *   while (search.next(q))
 *     search.record(q, measure_at(q), cached);
 *   encode_at(search.best());
 * @endcode
 */
class QualitySearch {
public:
  QualitySearch(const SearchSettings &settings, QualityMode mode,
                QualityRange range);

  /// Quality to try next; false once the range is exhausted
  bool next(int &quality) const { return range_.current(quality); }

  /// Feed back the percentile score of a trial at @p quality
  void record(int quality, double score, bool cached);

  /**
   * @brief Chosen quality.
   * @note If no trial satisfied the rule this is the end of the range that
   *       favours visual quality (Minimum, Target) or size (Maximum).
   */
  int best() const { return best_; }

  /// True once some trial became the best one
  bool has_score() const { return has_score_; }
  double best_score() const { return best_score_; }

  const std::vector<SearchTrial> &trials() const { return trials_; }

private:
  SearchSettings settings_;
  bool bitrate_;
  QualityRange range_;

  int best_;
  double best_score_ = 0.0;
  bool has_score_ = false;
  std::vector<SearchTrial> trials_;
};

} // namespace scene_encode

#endif // SCENE_ENCODE_QUALITY_SEARCH_HPP
