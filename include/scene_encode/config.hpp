/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          parameters loaded from environment variables, and the
 *          PipelineConfig value that snapshots them for one run.
 *
 *          Stage settings (encoder, metric, crop and scene detection) expose
 *          canonical() which serializes exactly the parameters that affect
 *          the stage's output. Fingerprints are computed over that string.
 *
 */

#ifndef SCENE_ENCODE_CONFIG_HPP
#define SCENE_ENCODE_CONFIG_HPP

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "types.hpp"

namespace scene_encode {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- ENCODER ----**

/// Encoder family: x264, x265 or aom
inline const std::string &encoder() {
  static std::string val = get_env_string("ENCODER", "x264");
  return val;
}

/**
 * @brief Encoder speed preset
 * @note x264/x265 take preset names; aom takes a cpu-used number.
 *       Empty selects the per-encoder default.
 */
inline const std::string &encoder_preset() {
  static std::string val = get_env_string("ENCODER_PRESET", "");
  return val;
}

/// Rate control mode: crf, qp or bitrate (kbit/s)
inline const std::string &quality_mode() {
  static std::string val = get_env_string("QUALITY_MODE", "crf");
  return val;
}

/// CRF, QP or bitrate passed to the encoder when no search is configured
inline double quality() {
  static double val = get_env_double("QUALITY", 23.0);
  return val;
}

/// Encoder passes: 1, or 2 for two-pass rate control
inline int encoder_passes() {
  static int val = get_env_int("ENCODER_PASSES", 1);
  return val;
}

// **---- QUALITY SEARCH ----**

/**
 * @brief Per-scene quality search rule: none, maximum, minimum or target
 * @note none encodes every scene at QUALITY.
 */
inline const std::string &search_rule() {
  static std::string val = get_env_string("SEARCH_RULE", "none");
  return val;
}

/// Metric value the search rule compares against
inline double search_target() {
  static double val = get_env_double("SEARCH_TARGET", 0.0);
  return val;
}

/// Percentile of the per-frame scores compared with SEARCH_TARGET (0..1)
inline double search_percentile() {
  static double val = get_env_double("SEARCH_PERCENTILE", 0.5);
  return val;
}

/// Lower end of the searched quality range (-1 = encoder default)
inline int quality_min() {
  static int val = get_env_int("QUALITY_MIN", -1);
  return val;
}

/// Upper end of the searched quality range (-1 = encoder default)
inline int quality_max() {
  static int val = get_env_int("QUALITY_MAX", -1);
  return val;
}

/// Key frame interval in seconds (converted to frames using the source rate)
inline double keyint_sec() {
  static double val = get_env_double("KEYINT_SEC", 5.0);
  return val;
}

// **---- METRIC ----**

/// Quality metric: psnr, ssim or vmaf
inline const std::string &metric() {
  static std::string val = get_env_string("METRIC", "ssim");
  return val;
}

/// libvmaf model selector (only used when METRIC=vmaf)
inline const std::string &vmaf_model() {
  static std::string val = get_env_string("VMAF_MODEL", "version=vmaf_v0.6.1");
  return val;
}

/// Measure every Nth frame (1 = all frames)
inline int metric_subsample() {
  static int val = get_env_int("METRIC_SUBSAMPLE", 1);
  return val;
}

// **---- CROP / SCENE DETECTION ----**

/// Enable automatic black border detection
inline bool crop_detect() {
  static bool val = (get_env_int("CROP_DETECT", 1) != 0);
  return val;
}

/// cropdetect luma limit (0-255)
inline int crop_limit() {
  static int val = get_env_int("CROP_LIMIT", 24);
  return val;
}

/// cropdetect dimension rounding
inline int crop_round() {
  static int val = get_env_int("CROP_ROUND", 4);
  return val;
}

/**
 * @brief Scene cut threshold on mean absolute luma difference
 * @note Normalized to 0..1 (difference / 255). Lower values cut more often.
 */
inline double scene_threshold() {
  static double val = get_env_double("SCENE_THRESHOLD", 0.12);
  return val;
}

/// Minimum scene length in frames
inline int min_scene_frames() {
  static int val = get_env_int("MIN_SCENE_FRAMES", 24);
  return val;
}

/// Maximum scene length in frames (0 = unlimited)
inline int max_scene_frames() {
  static int val = get_env_int("MAX_SCENE_FRAMES", 0);
  return val;
}

/// Luma sampling stride for scene detection (pixels)
inline int scene_sample_step() {
  static int val = get_env_int("SCENE_SAMPLE_STEP", 4);
  return val;
}

// **---- EXECUTION ----**

/**
 * @brief Number of concurrent scene workers
 * @note 0 = auto-detect from cgroup CPU limits.
 *       Each worker runs at most one external process at a time, so this
 *       also caps concurrent encoder/decoder processes.
 */
inline int workers() {
  static int val = get_env_int("WORKERS", 0);
  return val;
}

/// Comma separated stages whose cache entries are ignored and overwritten
inline const std::string &force_stages() {
  static std::string val = get_env_string("FORCE_STAGES", "");
  return val;
}

/// FFmpeg binary used for child processes
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

} // namespace Config

// **---- STAGE SETTINGS ----**

enum class EncoderKind { X264, X265, Aom };
enum class QualityMode { CRF, QP, Bitrate };
enum class MetricKind { PSNR, SSIM, VMAF };

/**
 * @brief How the per-scene quality search judges a trial encode.
 *
 * @details Fixed: no search. Maximum: the metric must not exceed the target.
 *          Minimum: the metric must reach the target. Target: the trial
 *          closest to the target wins.
 */
enum class QualityRule { Fixed, Maximum, Minimum, Target };

const char *encoder_kind_name(EncoderKind kind);
bool parse_encoder_kind(const std::string &name, EncoderKind &kind);
const char *quality_mode_name(QualityMode mode);
bool parse_quality_mode(const std::string &name, QualityMode &mode);
const char *metric_kind_name(MetricKind kind);
bool parse_metric_kind(const std::string &name, MetricKind &kind);
const char *quality_rule_name(QualityRule rule);
bool parse_quality_rule(const std::string &name, QualityRule &rule);

/**
 * @struct EncoderSettings
 * @brief Encoder choice and its output-affecting parameters.
 */
struct EncoderSettings {
  EncoderKind kind = EncoderKind::X264;
  std::string preset;                   //< Empty = per-encoder default
  QualityMode mode = QualityMode::CRF;
  double quality = 23.0;                //< CRF, QP or kbit/s depending on mode
  int keyint = 0;                       //< Frames between key frames (0 = encoder default)
  int passes = 1;                       //< 1 or 2

  /// FFmpeg encoder name (libx264, libx265, libaom-av1)
  const char *codec() const;

  /// Container extension of encoded scenes
  const char *extension() const { return "mkv"; }

  std::string effective_preset() const;

  /// Short human-readable id, e.g. "x264-medium-crf23.00"
  std::string identifier() const;

  std::string canonical() const;
};

/**
 * @struct MetricSettings
 * @brief Metric choice and its parameters.
 * @note threads only affects speed and is excluded from canonical().
 */
struct MetricSettings {
  MetricKind kind = MetricKind::SSIM;
  std::string vmaf_model = "version=vmaf_v0.6.1";
  int subsample = 1;
  int threads = 0;

  std::string canonical() const;
};

/**
 * @struct SearchSettings
 * @brief Per-scene quality search.
 *
 * @note Not part of any fingerprint: every trial is an ordinary encode and
 *       measure keyed by its own quality, so a rerun replays the search from
 *       the cache.
 */
struct SearchSettings {
  QualityRule rule = QualityRule::Fixed;
  double target = 0.0;
  double percentile = 0.5;
  int min_quality = -1; //< -1 = encoder default
  int max_quality = -1; //< -1 = encoder default

  bool enabled() const { return rule != QualityRule::Fixed; }
};

/**
 * @struct CropDetectSettings
 * @brief Black border detection parameters used by the probe stage.
 */
struct CropDetectSettings {
  bool enabled = true;
  int limit = 24;
  int round = 4;

  std::string canonical() const;
};

/**
 * @struct SceneDetectSettings
 * @brief Sensitivity parameters for the scene detector.
 */
struct SceneDetectSettings {
  double threshold = 0.12;
  int min_scene_frames = 24;
  int max_scene_frames = 0;
  int sample_step = 4;

  std::string canonical() const;
};

/**
 * @struct PipelineConfig
 * @brief Everything one run needs, passed explicitly to the pipeline.
 */
struct PipelineConfig {
  std::filesystem::path source;
  std::filesystem::path output_dir;

  EncoderSettings encoder;
  double keyint_sec = 5.0;
  MetricSettings metric;
  SearchSettings search;
  CropDetectSettings crop;
  SceneDetectSettings scenes;

  int workers = 0;           //< 0 = detect_cpu_limit()
  int encode_threads = 0;    //< Per encoder process (0 = CPUs / workers)
  uint32_t force_mask = 0;   //< Bit per StageId
  std::string ffmpeg = "ffmpeg";

  /// Set by signal handlers; polled by workers and child process waits
  const std::atomic<bool> *cancel = nullptr;

  bool forced(StageId stage) const {
    return (force_mask & (1u << static_cast<unsigned>(stage))) != 0;
  }
  void force(StageId stage) {
    force_mask |= (1u << static_cast<unsigned>(stage));
  }
  bool cancelled() const { return cancel && cancel->load(); }

  /**
   * @brief Name of the merged output, e.g. "x264-medium-crf23.00" or
   *        "x264-medium-crf-ssim-minimum0.9800" when searching.
   */
  std::string output_identifier() const;
};

/**
 * @brief Build a PipelineConfig from the environment.
 *
 * @param source Source video path
 * @param output_dir Output directory path
 * @param config Output: populated configuration
 * @param error Output: cause if a variable holds an unknown value
 * @return true on success
 */
bool load_pipeline_config(const std::string &source,
                          const std::string &output_dir, PipelineConfig &config,
                          std::string &error);

} // namespace scene_encode

#endif // SCENE_ENCODE_CONFIG_HPP
