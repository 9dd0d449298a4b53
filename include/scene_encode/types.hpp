/**
 * @file types.hpp
 * @brief Core data types and constants for scene_encode
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Cache alignment constants
 *
 *          - Stage identifiers and run status codes
 *
 *          - CropRect, ProbeInfo and Scene for the source video model
 */

#ifndef SCENE_ENCODE_TYPES_HPP
#define SCENE_ENCODE_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scene_encode {

// **----- CONSTANTS -----**

/**
 * @brief CPU cache line size for alignment.
 * @note Most modern CPUs use 64-byte cache lines.
 *       Aligning hot counters to cache lines prevents false sharing in
 *       multi-threaded code.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

/// Version written to and required from the cache record file
constexpr int CACHE_RECORD_VERSION = 1;

// **----- ENUMERATIONS -----**

/**
 * @brief Pipeline stages, in dependency order.
 * @note Source is not a stage proper; it identifies the input file.
 */
enum class StageId { Source, Probe, Detect, Extract, Encode, Measure, Merge };

/// Number of StageId values (for per-stage counter arrays)
constexpr size_t STAGE_COUNT = 7;

const char *stage_name(StageId stage);
bool parse_stage(const std::string &name, StageId &stage);

/**
 * @brief Final state of one scene after scheduling.
 */
enum class SceneStatus {
  Cached,     //< Every sub-stage was a cache hit
  Recomputed, //< At least one sub-stage ran
  Failed,     //< A sub-stage failed; see SceneResult::error
  Skipped     //< Never started because the run was cancelled
};

const char *scene_status_name(SceneStatus status);

/**
 * @brief Run outcome, doubling as the process exit code.
 */
enum class RunStatus {
  Success = 0,
  Fatal = 1,
  ScenesFailed = 2,
  Interrupted = 130
};

// **----- DATA STRUCTURES -----**

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 * @note When multiple atomics are updated by different threads, they
 *       should each be on separate cache lines to avoid invalidation.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
  T operator++() { return ++value; }
  T operator++(int) { return value++; }
  PaddedAtomic &operator+=(T v) {
    value += v;
    return *this;
  }
};

/**
 * @struct CropRect
 * @brief Crop rectangle in source pixels. A zero width means "no crop".
 */
struct CropRect {
  int width = 0;
  int height = 0;
  int x = 0;
  int y = 0;

  bool empty() const { return width <= 0 || height <= 0; }

  /// FFmpeg filter form, "crop=w:h:x:y"
  std::string filter() const;

  bool operator==(const CropRect &o) const {
    return width == o.width && height == o.height && x == o.x && y == o.y;
  }
  bool operator!=(const CropRect &o) const { return !(*this == o); }
};

/**
 * @struct Rational
 * @brief Frame rate as a fraction, as FFmpeg reports it.
 */
struct Rational {
  int num = 0;
  int den = 1;

  double value() const { return den != 0 ? static_cast<double>(num) / den : 0.0; }
};

/**
 * @struct ProbeInfo
 * @brief Attributes of the source video computed by the probe stage.
 */
struct ProbeInfo {
  uint64_t frame_count = 0; //< Video packets in the best stream
  Rational frame_rate;      //< Average frame rate
  double duration = 0.0;    //< Container duration in seconds
  int width = 0;            //< Coded width
  int height = 0;           //< Coded height
  CropRect crop;            //< Detected crop (empty = none)
};

/**
 * @struct Scene
 * @brief A half-open frame range [start, end) encoded independently.
 */
struct Scene {
  size_t index = 0;
  uint64_t start = 0;
  uint64_t end = 0;
  CropRect crop; //< Inherited from the source video

  uint64_t length() const { return end - start; }
};

/**
 * @struct MetricScores
 * @brief Quality scores for one scene.
 */
struct MetricScores {
  double mean = 0.0;          //< Mean over measured frames
  std::vector<double> frames; //< Per-frame scores
};

} // namespace scene_encode

#endif // SCENE_ENCODE_TYPES_HPP
