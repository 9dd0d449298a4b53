/**
 * @file ffmpeg_backend.hpp
 * @brief MediaBackend over libavformat/libavcodec/libavfilter and ffmpeg
 *
 * @details
 *          - probe: in-process demux (frame count by packet counting) and
 *            key frame decode through a cropdetect filter graph
 *
 *          - detect_scenes: in-process full decode, mean absolute luma
 *            difference between consecutive frames, place_scene_cuts()
 *
 *          - extract / encode / measure / merge: ffmpeg child processes
 *            through run_process(), one at a time per calling thread
 *
 * @attention Each call creates its own decoder state. FFmpeg contexts are
 *            never shared between threads.
 */

#ifndef SCENE_ENCODE_FFMPEG_BACKEND_HPP
#define SCENE_ENCODE_FFMPEG_BACKEND_HPP

#include <string>
#include <vector>

#include "media.hpp"

namespace scene_encode {

class FFmpegBackend : public MediaBackend {
public:
  /// @param ffmpeg ffmpeg binary name or path (FFMPEG_BIN)
  explicit FFmpegBackend(std::string ffmpeg = "ffmpeg");

  bool probe(const std::filesystem::path &source,
             const CropDetectSettings &crop, ProbeInfo &info,
             std::string &error) override;

  bool detect_scenes(const std::filesystem::path &source,
                     const ProbeInfo &info, const SceneDetectSettings &params,
                     std::vector<uint64_t> &boundaries,
                     std::string &error) override;

  bool extract(const std::filesystem::path &source, const Scene &scene,
               const std::filesystem::path &output, const JobContext &job,
               std::string &error) override;

  bool encode(const std::filesystem::path &clip,
              const EncoderSettings &encoder,
              const std::filesystem::path &output, const JobContext &job,
              std::string &error) override;

  bool measure(const std::filesystem::path &reference,
               const std::filesystem::path &distorted,
               const MetricSettings &metric, const JobContext &job,
               MetricScores &scores, std::string &error) override;

  bool merge(const std::vector<std::filesystem::path> &parts,
             const std::filesystem::path &output, const JobContext &job,
             std::string &error) override;

  /**
   * @brief ffmpeg arguments for encoding @p clip (exposed for tests).
   *
   * @param pass 0 for a single pass, else 1 or 2 of a two-pass encode
   * @param passlog Stats file prefix shared by both passes
   * @note Pass 1 writes only the stats; its video goes to the null muxer.
   */
  std::vector<std::string>
  encode_command(const std::filesystem::path &clip,
                 const EncoderSettings &encoder,
                 const std::filesystem::path &output, int threads, int pass = 0,
                 const std::filesystem::path &passlog = {}) const;

private:
  std::vector<std::string> base_command() const;

  std::string ffmpeg_;
};

// **---- Metric log parsers ----**

/**
 * @brief Parse an ffmpeg psnr/ssim stats file.
 * @param key Field holding the per-frame score ("psnr_y" or "Y")
 * @note Infinite PSNR (identical frames) is clamped to 100 dB.
 */
bool parse_stats_file(const std::filesystem::path &path, const std::string &key,
                      MetricScores &scores, std::string &error);

/**
 * @brief Parse a libvmaf JSON log ("frames"[].metrics.vmaf).
 */
bool parse_vmaf_log(const std::filesystem::path &path, MetricScores &scores,
                    std::string &error);

/// Single-quote a filter option value so ':' ',' and '=' survive parsing
std::string quote_filter_value(const std::string &value);

} // namespace scene_encode

#endif // SCENE_ENCODE_FFMPEG_BACKEND_HPP
