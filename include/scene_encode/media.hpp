/**
 * @file media.hpp
 * @brief Boundary to the multimedia library and external tools
 *
 * @details MediaBackend is the only place that touches video data. The
 *          pipeline treats every call as a fallible, potentially slow,
 *          externally versioned function and only looks at its declared
 *          inputs and outputs.
 *
 *          FFmpegBackend (ffmpeg_backend.hpp) is the production
 *          implementation. Tests substitute a deterministic fake.
 *
 * @attention THREAD MODEL:
 *            probe() and detect_scenes() are called once from the
 *            orchestrator thread. extract(), encode() and measure() are
 *            called concurrently from scene workers and must not share
 *            mutable state.
 */

#ifndef SCENE_ENCODE_MEDIA_HPP
#define SCENE_ENCODE_MEDIA_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @struct JobContext
 * @brief Per-call execution context for long-running media operations.
 */
struct JobContext {
  std::filesystem::path log_path;           //< stderr of any child process
  const std::atomic<bool> *cancel = nullptr;
  int threads = 0;                          //< Encoder/metric threads (0 = tool default)
};

class MediaBackend {
public:
  virtual ~MediaBackend() = default;

  /**
   * @brief Frame count, frame rate and crop rectangle of the source.
   * @return false if the file cannot be opened or has no usable video stream
   */
  virtual bool probe(const std::filesystem::path &source,
                     const CropDetectSettings &crop, ProbeInfo &info,
                     std::string &error) = 0;

  /**
   * @brief Scene boundaries of the source.
   * @param boundaries Output: ascending frame indices, first 0, last
   *                   info.frame_count
   */
  virtual bool detect_scenes(const std::filesystem::path &source,
                             const ProbeInfo &info,
                             const SceneDetectSettings &params,
                             std::vector<uint64_t> &boundaries,
                             std::string &error) = 0;

  /**
   * @brief Write frames [scene.start, scene.end) with scene.crop applied to
   *        a lossless clip at @p output.
   */
  virtual bool extract(const std::filesystem::path &source, const Scene &scene,
                       const std::filesystem::path &output,
                       const JobContext &job, std::string &error) = 0;

  /**
   * @brief Encode @p clip with @p encoder into @p output.
   */
  virtual bool encode(const std::filesystem::path &clip,
                      const EncoderSettings &encoder,
                      const std::filesystem::path &output,
                      const JobContext &job, std::string &error) = 0;

  /**
   * @brief Score @p distorted against @p reference.
   * @param scores Output: per-frame scores and their mean
   */
  virtual bool measure(const std::filesystem::path &reference,
                       const std::filesystem::path &distorted,
                       const MetricSettings &metric, const JobContext &job,
                       MetricScores &scores, std::string &error) = 0;

  /**
   * @brief Concatenate @p parts, in order, into @p output without
   *        re-encoding.
   */
  virtual bool merge(const std::vector<std::filesystem::path> &parts,
                     const std::filesystem::path &output,
                     const JobContext &job, std::string &error) = 0;
};

/**
 * @brief Turn per-frame luma differences into scene boundaries.
 *
 * @details diffs[i] is the normalized (0..1) difference between frame i and
 *          frame i-1; diffs[0] is ignored. A cut is placed at frame i when
 *          diffs[i] exceeds the threshold and the current scene already has
 *          min_scene_frames frames, or unconditionally when it reaches
 *          max_scene_frames (if non-zero).
 *
 * @param diffs Per-frame differences (may be shorter or longer than total)
 * @param total Total frame count; always the last boundary
 * @param params Detection sensitivity
 * @return Boundaries starting at 0 and ending at @p total (just {0} when
 *         total is 0)
 */
std::vector<uint64_t> place_scene_cuts(const std::vector<double> &diffs,
                                       uint64_t total,
                                       const SceneDetectSettings &params);

} // namespace scene_encode

#endif // SCENE_ENCODE_MEDIA_HPP
