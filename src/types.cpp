/**
 * @file types.cpp
 * @brief Name tables for stage and status enumerations
 */

#include "scene_encode/types.hpp"

#include <fmt/core.h>

namespace scene_encode {

const char *stage_name(StageId stage) {
  switch (stage) {
  case StageId::Source:
    return "source";
  case StageId::Probe:
    return "probe";
  case StageId::Detect:
    return "detect";
  case StageId::Extract:
    return "extract";
  case StageId::Encode:
    return "encode";
  case StageId::Measure:
    return "measure";
  case StageId::Merge:
    return "merge";
  }
  return "unknown";
}

bool parse_stage(const std::string &name, StageId &stage) {
  static const StageId all[] = {StageId::Source,  StageId::Probe,
                                StageId::Detect,  StageId::Extract,
                                StageId::Encode,  StageId::Measure,
                                StageId::Merge};
  for (StageId s : all) {
    if (name == stage_name(s)) {
      stage = s;
      return true;
    }
  }
  return false;
}

const char *scene_status_name(SceneStatus status) {
  switch (status) {
  case SceneStatus::Cached:
    return "cached";
  case SceneStatus::Recomputed:
    return "recomputed";
  case SceneStatus::Failed:
    return "failed";
  case SceneStatus::Skipped:
    return "skipped";
  }
  return "unknown";
}

std::string CropRect::filter() const {
  return fmt::format("crop={}:{}:{}:{}", width, height, x, y);
}

} // namespace scene_encode
