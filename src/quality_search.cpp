/**
 * @file quality_search.cpp
 * @brief Quality search decisions
 */

#include "scene_encode/quality_search.hpp"

#include <algorithm>
#include <cmath>

#include "scene_encode/aggregate.hpp"

namespace scene_encode {

// **---- QualityRange ----**

void QualityRange::higher() {
  int q;
  if (current(q))
    lo_ = q + 1;
}

void QualityRange::lower() {
  int q;
  if (current(q))
    hi_ = q - 1;
}

QualityRange default_quality_range(const EncoderSettings &encoder,
                                   const SearchSettings &search) {
  int lo = 0;
  int hi = 51;
  if (encoder.mode == QualityMode::Bitrate) {
    lo = 100;
    hi = 20000;
  } else if (encoder.kind == EncoderKind::Aom) {
    hi = 63;
  }

  if (search.min_quality >= 0)
    lo = search.min_quality;
  if (search.max_quality >= 0)
    hi = search.max_quality;
  return QualityRange(lo, hi);
}

double percentile_score(const MetricScores &scores, double percentile) {
  if (scores.frames.empty())
    return scores.mean;
  std::vector<double> sorted = scores.frames;
  std::sort(sorted.begin(), sorted.end());
  return quantile_sorted(sorted, percentile);
}

// **---- QualitySearch ----**

QualitySearch::QualitySearch(const SearchSettings &settings, QualityMode mode,
                             QualityRange range)
    : settings_(settings), bitrate_(mode == QualityMode::Bitrate),
      range_(range) {
  /// Start from the end that is safe for the rule
  bool cheap_end = settings_.rule == QualityRule::Maximum;
  if (bitrate_)
    best_ = cheap_end ? range_.minimum() : range_.maximum();
  else
    best_ = cheap_end ? range_.maximum() : range_.minimum();
}

void QualitySearch::record(int quality, double score, bool cached) {
  trials_.push_back({quality, score, cached});
  const double target = settings_.target;

  auto take = [&]() {
    best_ = quality;
    best_score_ = score;
    has_score_ = true;
  };

  switch (settings_.rule) {
  case QualityRule::Fixed:
    range_ = QualityRange(1, 0);
    return;

  case QualityRule::Maximum:
    if (score <= target) {
      /// Allowed; spend more (bitrate up, CRF down) while it stays allowed
      if (!has_score_ || (bitrate_ ? quality > best_ : quality < best_))
        take();
      if (bitrate_)
        range_.higher();
      else
        range_.lower();
    } else {
      if (bitrate_)
        range_.lower();
      else
        range_.higher();
    }
    return;

  case QualityRule::Minimum:
    if (score >= target) {
      /// Good enough; try something cheaper
      if (!has_score_ || (bitrate_ ? quality < best_ : quality > best_))
        take();
      if (bitrate_)
        range_.lower();
      else
        range_.higher();
    } else {
      if (bitrate_)
        range_.higher();
      else
        range_.lower();
    }
    return;

  case QualityRule::Target:
    if (!has_score_ ||
        std::fabs(target - score) < std::fabs(target - best_score_))
      take();
    if (bitrate_ ? score <= target : score >= target)
      range_.higher();
    else
      range_.lower();
    return;
  }
}

} // namespace scene_encode
