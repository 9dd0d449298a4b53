/**
 * @file layout.hpp
 * @brief Output directory layout
 *
 * @details Every persisted path is derived here:
 *
 *          <out>/cache.json                          cache record file
 *
 *          <out>/source/scene-NNNNN-<fp12>.mkv       lossless scene clips
 *
 *          <out>/encode/scene-NNNNN-<fp12>.mkv       encoded scenes
 *
 *          <out>/metrics/scene-NNNNN-<fp12>.*        tool and metric logs
 *
 *          <out>/output/<encoder-id>-<fp12>.mkv      merged output
 *
 *          <out>/report.json                         run report
 *
 * @note Artifact names carry a fingerprint prefix, so artifacts from
 *       different configurations coexist in the same directory.
 */

#ifndef SCENE_ENCODE_LAYOUT_HPP
#define SCENE_ENCODE_LAYOUT_HPP

#include <filesystem>
#include <string>

#include "fingerprint.hpp"

namespace scene_encode {

namespace fs = std::filesystem;

class OutputLayout {
public:
  OutputLayout() = default;
  explicit OutputLayout(fs::path root) : root_(std::move(root)) {}

  const fs::path &root() const { return root_; }

  fs::path record_file() const { return root_ / "cache.json"; }
  fs::path report_file() const { return root_ / "report.json"; }

  fs::path source_dir() const { return root_ / "source"; }
  fs::path encode_dir() const { return root_ / "encode"; }
  fs::path metrics_dir() const { return root_ / "metrics"; }
  fs::path output_dir() const { return root_ / "output"; }

  fs::path scene_clip(size_t index, const Fingerprint &fp) const;
  fs::path encoded_scene(size_t index, const Fingerprint &fp,
                         const std::string &ext) const;
  fs::path scene_log(size_t index, const Fingerprint &fp,
                     const std::string &ext) const;
  fs::path merged_output(const std::string &encoder_id,
                         const Fingerprint &fp) const;

  /// Path relative to root() (as stored in the cache record)
  std::string relative(const fs::path &path) const;

  /// Absolute path for a record-relative path
  fs::path resolve(const std::string &relative) const {
    return root_ / relative;
  }

  /// Create all subdirectories
  bool create(std::string &error) const;

private:
  fs::path root_;
};

/**
 * @brief Temporary sibling of an artifact path.
 * @details "a/scene-00001-abc.mkv" becomes "a/scene-00001-abc.tmp.mkv", so the
 *          container format is still inferred from the extension.
 */
fs::path temp_path(const fs::path &final_path);

} // namespace scene_encode

#endif // SCENE_ENCODE_LAYOUT_HPP
