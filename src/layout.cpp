/**
 * @file layout.cpp
 * @brief Output directory layout implementation
 */

#include "scene_encode/layout.hpp"

#include <fmt/core.h>

namespace scene_encode {

fs::path OutputLayout::scene_clip(size_t index, const Fingerprint &fp) const {
  return source_dir() /
         fmt::format("scene-{:05}-{}.mkv", index, fp.short_hex());
}

fs::path OutputLayout::encoded_scene(size_t index, const Fingerprint &fp,
                                     const std::string &ext) const {
  return encode_dir() /
         fmt::format("scene-{:05}-{}.{}", index, fp.short_hex(), ext);
}

fs::path OutputLayout::scene_log(size_t index, const Fingerprint &fp,
                                 const std::string &ext) const {
  return metrics_dir() /
         fmt::format("scene-{:05}-{}.{}", index, fp.short_hex(), ext);
}

fs::path OutputLayout::merged_output(const std::string &encoder_id,
                                     const Fingerprint &fp) const {
  return output_dir() / fmt::format("{}-{}.mkv", encoder_id, fp.short_hex());
}

std::string OutputLayout::relative(const fs::path &path) const {
  return path.lexically_relative(root_).generic_string();
}

bool OutputLayout::create(std::string &error) const {
  for (const auto &dir : {source_dir(), encode_dir(), metrics_dir(),
                          output_dir()}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      error = fmt::format("Cannot create {}: {}", dir.string(), ec.message());
      return false;
    }
  }
  return true;
}

fs::path temp_path(const fs::path &final_path) {
  fs::path tmp = final_path;
  tmp.replace_filename(final_path.stem().string() + ".tmp" +
                       final_path.extension().string());
  return tmp;
}

} // namespace scene_encode
