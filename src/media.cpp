/**
 * @file media.cpp
 * @brief Backend-independent scene cut placement
 */

#include "scene_encode/media.hpp"

namespace scene_encode {

std::vector<uint64_t> place_scene_cuts(const std::vector<double> &diffs,
                                       uint64_t total,
                                       const SceneDetectSettings &params) {
  std::vector<uint64_t> cuts{0};
  if (total == 0)
    return cuts;

  const uint64_t min_len =
      params.min_scene_frames > 0 ? static_cast<uint64_t>(params.min_scene_frames)
                                  : 1;
  const uint64_t max_len =
      params.max_scene_frames > 0 ? static_cast<uint64_t>(params.max_scene_frames)
                                  : 0;

  uint64_t last = 0;
  for (uint64_t i = 1; i < total; ++i) {
    const uint64_t len = i - last;
    bool cut = false;
    if (max_len > 0 && len >= max_len) {
      cut = true;
    } else if (i < diffs.size() && diffs[i] > params.threshold &&
               len >= min_len) {
      cut = true;
    }
    if (cut) {
      cuts.push_back(i);
      last = i;
    }
  }

  cuts.push_back(total);
  return cuts;
}

} // namespace scene_encode
