/**
 * @file stages.hpp
 * @brief Cache-aware stage functions
 *
 * @details Each stage computes its fingerprint from upstream fingerprints and
 *          the canonical form of its own settings, consults the CacheStore,
 *          and only calls into the MediaBackend on a miss (or when the stage
 *          is listed in FORCE_STAGES). Results are committed back before the
 *          stage returns.
 *
 *          Fingerprint chain:
 *
 *          - probe   = H(probe,   [source identity],        crop settings)
 *
 *          - detect  = H(detect,  [probe],                  detect settings)
 *
 *          - extract = H(extract, [probe],                  start, end, crop)
 *
 *          - encode  = H(encode,  [extract],                encoder settings)
 *            (a quality search produces one encode per trial quality)
 *
 *          - measure = H(measure, [encode, extract],        metric settings)
 *
 *          - merge   = H(merge,   [encode of every scene],  container)
 *
 * @note Extract does not depend on detect, so scenes whose bounds survive a
 *       change of detection parameters are still cache hits.
 */

#ifndef SCENE_ENCODE_STAGES_HPP
#define SCENE_ENCODE_STAGES_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "cache_store.hpp"
#include "config.hpp"
#include "fingerprint.hpp"
#include "layout.hpp"
#include "media.hpp"
#include "quality_search.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @class StageCounters
 * @brief Per-stage cache hit/miss counters, updated from worker threads.
 */
class StageCounters {
  std::array<PaddedAtomic<uint64_t>, STAGE_COUNT> hits_;
  std::array<PaddedAtomic<uint64_t>, STAGE_COUNT> misses_;

public:
  void reset() {
    for (size_t i = 0; i < STAGE_COUNT; ++i) {
      hits_[i].store(0);
      misses_[i].store(0);
    }
  }

  void record(StageId stage, bool hit) {
    auto i = static_cast<size_t>(stage);
    if (hit)
      hits_[i]++;
    else
      misses_[i]++;
  }

  uint64_t hits(StageId stage) const {
    return hits_[static_cast<size_t>(stage)].load();
  }
  uint64_t misses(StageId stage) const {
    return misses_[static_cast<size_t>(stage)].load();
  }
};

/**
 * @struct StageContext
 * @brief Everything a stage needs, passed explicitly.
 */
struct StageContext {
  CacheStore &store;
  MediaBackend &media;
  const PipelineConfig &config;
  OutputLayout layout;
  StageCounters &counters;
};

struct ProbeOutput {
  Fingerprint fp;
  ProbeInfo info;
  bool cached = false;
};

struct DetectOutput {
  Fingerprint fp;
  std::vector<uint64_t> boundaries;
  std::vector<Scene> scenes;
  bool cached = false;
};

/**
 * @struct ArtifactOutput
 * @brief Result of a file-producing stage (extract, encode, merge).
 */
struct ArtifactOutput {
  Fingerprint fp;
  std::filesystem::path path;
  uint64_t size = 0;
  bool cached = false;
};

struct MeasureOutput {
  Fingerprint fp;
  MetricScores scores;
  bool cached = false;
};

/**
 * @struct SearchOutput
 * @brief Result of a per-scene quality search.
 */
struct SearchOutput {
  int quality = 0;                 //< Chosen quality
  std::vector<SearchTrial> trials; //< In the order they ran
  ArtifactOutput encoded;          //< Encode at the chosen quality
  MeasureOutput metrics;
};

/**
 * @struct SceneResult
 * @brief Outcome of extract, encode and measure for one scene.
 */
struct SceneResult {
  Scene scene;
  SceneStatus status = SceneStatus::Skipped;
  StageId failed_stage = StageId::Extract; //< Valid when status == Failed
  std::string error;
  ArtifactOutput clip;
  ArtifactOutput encoded;
  MeasureOutput metrics;
  double quality = 0.0;            //< Quality the scene was encoded at
  std::vector<SearchTrial> trials; //< Empty without a quality search
  double seconds = 0.0;            //< Wall time spent on this scene
};

// **---- Helpers ----**

/**
 * @brief Build Scene records from detector boundaries.
 *
 * @details Requires at least two boundaries, the first 0, the last
 *          @p total, strictly increasing. A violation means the detector is
 *          broken and is reported as an error (fatal for the run).
 */
bool build_scenes(const std::vector<uint64_t> &boundaries, uint64_t total,
                  const CropRect &crop, std::vector<Scene> &scenes,
                  std::string &error);

/// Key frame interval in frames for @p keyint_sec at the probed frame rate
int derive_keyint(const ProbeInfo &info, double keyint_sec);

/// Canonical extract configuration: bounds and crop
std::string extract_canonical(const Scene &scene);

// **---- Stages ----**

bool run_probe(StageContext &ctx, const Fingerprint &source_id,
               ProbeOutput &out, std::string &error);

bool run_detect(StageContext &ctx, const ProbeOutput &probe, DetectOutput &out,
                std::string &error);

bool run_extract(StageContext &ctx, const Fingerprint &probe_fp,
                 const Scene &scene, ArtifactOutput &out, std::string &error);

/// @note @p encoder must already carry the derived keyint
bool run_encode(StageContext &ctx, const Scene &scene,
                const ArtifactOutput &clip, const EncoderSettings &encoder,
                ArtifactOutput &out, std::string &error);

bool run_measure(StageContext &ctx, const Scene &scene,
                 const ArtifactOutput &clip, const ArtifactOutput &encoded,
                 MeasureOutput &out, std::string &error);

/**
 * @brief Find the quality meeting ctx.config.search, then encode and
 *        measure the scene at it.
 *
 * @details Trials run through run_encode/run_measure with the trial quality,
 *          so each one is cached on its own. The final encode and measure at
 *          the chosen quality are normally hits on one of the trials.
 *
 * @param stage Output: the stage that was running when an error occurred
 */
bool run_quality_search(StageContext &ctx, const Scene &scene,
                        const ArtifactOutput &clip, SearchOutput &out,
                        StageId &stage, std::string &error);

/**
 * @brief Concatenate encoded scenes in index order.
 * @param encoded One entry per scene, ordered by scene index
 */
bool run_merge(StageContext &ctx, const std::vector<ArtifactOutput> &encoded,
               ArtifactOutput &out, std::string &error);

} // namespace scene_encode

#endif // SCENE_ENCODE_STAGES_HPP
