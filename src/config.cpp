/**
 * @file config.cpp
 * @brief Stage settings serialization and environment snapshot
 *
 * @details canonical() forms are JSON objects dumped by nlohmann::json, whose
 *          object keys are ordered, so equal settings always produce equal
 *          bytes. Numbers that are configured as doubles are formatted to a
 *          fixed precision first so 23 and 23.0 fingerprint identically.
 */

#include "scene_encode/config.hpp"

#include <sstream>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace scene_encode {

namespace {

std::string fixed(double value) { return fmt::format("{:.4f}", value); }

/// Split "a,b , c" into trimmed, non-empty items
std::vector<std::string> split_list(const std::string &list) {
  std::vector<std::string> items;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    size_t b = item.find_first_not_of(" \t");
    size_t e = item.find_last_not_of(" \t");
    if (b == std::string::npos)
      continue;
    items.push_back(item.substr(b, e - b + 1));
  }
  return items;
}

} // anonymous namespace

// **---- Name tables ----**

const char *encoder_kind_name(EncoderKind kind) {
  switch (kind) {
  case EncoderKind::X264:
    return "x264";
  case EncoderKind::X265:
    return "x265";
  case EncoderKind::Aom:
    return "aom";
  }
  return "unknown";
}

bool parse_encoder_kind(const std::string &name, EncoderKind &kind) {
  if (name == "x264") {
    kind = EncoderKind::X264;
  } else if (name == "x265") {
    kind = EncoderKind::X265;
  } else if (name == "aom" || name == "av1") {
    kind = EncoderKind::Aom;
  } else {
    return false;
  }
  return true;
}

const char *quality_mode_name(QualityMode mode) {
  switch (mode) {
  case QualityMode::CRF:
    return "crf";
  case QualityMode::QP:
    return "qp";
  case QualityMode::Bitrate:
    return "bitrate";
  }
  return "unknown";
}

bool parse_quality_mode(const std::string &name, QualityMode &mode) {
  if (name == "crf") {
    mode = QualityMode::CRF;
  } else if (name == "qp") {
    mode = QualityMode::QP;
  } else if (name == "bitrate") {
    mode = QualityMode::Bitrate;
  } else {
    return false;
  }
  return true;
}

const char *metric_kind_name(MetricKind kind) {
  switch (kind) {
  case MetricKind::PSNR:
    return "psnr";
  case MetricKind::SSIM:
    return "ssim";
  case MetricKind::VMAF:
    return "vmaf";
  }
  return "unknown";
}

bool parse_metric_kind(const std::string &name, MetricKind &kind) {
  if (name == "psnr") {
    kind = MetricKind::PSNR;
  } else if (name == "ssim") {
    kind = MetricKind::SSIM;
  } else if (name == "vmaf") {
    kind = MetricKind::VMAF;
  } else {
    return false;
  }
  return true;
}

const char *quality_rule_name(QualityRule rule) {
  switch (rule) {
  case QualityRule::Fixed:
    return "none";
  case QualityRule::Maximum:
    return "maximum";
  case QualityRule::Minimum:
    return "minimum";
  case QualityRule::Target:
    return "target";
  }
  return "unknown";
}

bool parse_quality_rule(const std::string &name, QualityRule &rule) {
  if (name == "none") {
    rule = QualityRule::Fixed;
  } else if (name == "maximum") {
    rule = QualityRule::Maximum;
  } else if (name == "minimum") {
    rule = QualityRule::Minimum;
  } else if (name == "target") {
    rule = QualityRule::Target;
  } else {
    return false;
  }
  return true;
}

// **---- EncoderSettings ----**

const char *EncoderSettings::codec() const {
  switch (kind) {
  case EncoderKind::X264:
    return "libx264";
  case EncoderKind::X265:
    return "libx265";
  case EncoderKind::Aom:
    return "libaom-av1";
  }
  return "libx264";
}

std::string EncoderSettings::effective_preset() const {
  if (!preset.empty())
    return preset;
  return kind == EncoderKind::Aom ? "6" : "medium";
}

std::string EncoderSettings::identifier() const {
  return fmt::format("{}-{}-{}{:.2f}", encoder_kind_name(kind),
                     effective_preset(), quality_mode_name(mode), quality);
}

std::string EncoderSettings::canonical() const {
  json j;
  j["encoder"] = encoder_kind_name(kind);
  j["preset"] = effective_preset();
  j["mode"] = quality_mode_name(mode);
  j["quality"] = fixed(quality);
  j["keyint"] = keyint;
  j["passes"] = passes;
  return j.dump();
}

// **---- Other settings ----**

std::string MetricSettings::canonical() const {
  json j;
  j["metric"] = metric_kind_name(kind);
  j["subsample"] = subsample;
  if (kind == MetricKind::VMAF) {
    j["model"] = vmaf_model;
  }
  return j.dump();
}

std::string CropDetectSettings::canonical() const {
  json j;
  j["enabled"] = enabled;
  if (enabled) {
    j["limit"] = limit;
    j["round"] = round;
  }
  return j.dump();
}

std::string SceneDetectSettings::canonical() const {
  json j;
  j["threshold"] = fixed(threshold);
  j["min_scene_frames"] = min_scene_frames;
  j["max_scene_frames"] = max_scene_frames;
  j["sample_step"] = sample_step;
  return j.dump();
}

std::string PipelineConfig::output_identifier() const {
  if (!search.enabled())
    return encoder.identifier();
  return fmt::format("{}-{}-{}-{}-{}{:.4f}", encoder_kind_name(encoder.kind),
                     encoder.effective_preset(), quality_mode_name(encoder.mode),
                     metric_kind_name(metric.kind),
                     quality_rule_name(search.rule), search.target);
}

// **---- Environment snapshot ----**

bool load_pipeline_config(const std::string &source,
                          const std::string &output_dir, PipelineConfig &config,
                          std::string &error) {
  PipelineConfig cfg;
  cfg.source = source;
  cfg.output_dir = output_dir;

  try {
    if (!parse_encoder_kind(Config::encoder(), cfg.encoder.kind)) {
      error = fmt::format("Unknown ENCODER '{}' (x264, x265, aom)",
                          Config::encoder());
      return false;
    }
    if (!parse_quality_mode(Config::quality_mode(), cfg.encoder.mode)) {
      error = fmt::format("Unknown QUALITY_MODE '{}' (crf, qp, bitrate)",
                          Config::quality_mode());
      return false;
    }
    cfg.encoder.preset = Config::encoder_preset();
    cfg.encoder.quality = Config::quality();
    cfg.encoder.passes = Config::encoder_passes();
    cfg.keyint_sec = Config::keyint_sec();

    if (!parse_quality_rule(Config::search_rule(), cfg.search.rule)) {
      error = fmt::format(
          "Unknown SEARCH_RULE '{}' (none, maximum, minimum, target)",
          Config::search_rule());
      return false;
    }
    cfg.search.target = Config::search_target();
    cfg.search.percentile = Config::search_percentile();
    cfg.search.min_quality = Config::quality_min();
    cfg.search.max_quality = Config::quality_max();

    if (!parse_metric_kind(Config::metric(), cfg.metric.kind)) {
      error = fmt::format("Unknown METRIC '{}' (psnr, ssim, vmaf)",
                          Config::metric());
      return false;
    }
    cfg.metric.vmaf_model = Config::vmaf_model();
    cfg.metric.subsample = Config::metric_subsample();

    cfg.crop.enabled = Config::crop_detect();
    cfg.crop.limit = Config::crop_limit();
    cfg.crop.round = Config::crop_round();

    cfg.scenes.threshold = Config::scene_threshold();
    cfg.scenes.min_scene_frames = Config::min_scene_frames();
    cfg.scenes.max_scene_frames = Config::max_scene_frames();
    cfg.scenes.sample_step = Config::scene_sample_step();

    cfg.workers = Config::workers();
    cfg.ffmpeg = Config::ffmpeg_bin();
  } catch (const std::exception &e) {
    ///\note std::stoi/std::stod throw on non-numeric values
    error = fmt::format("Invalid numeric environment value: {}", e.what());
    return false;
  }

  if (cfg.metric.subsample < 1) {
    error = "METRIC_SUBSAMPLE must be at least 1";
    return false;
  }
  if (cfg.scenes.sample_step < 1) {
    error = "SCENE_SAMPLE_STEP must be at least 1";
    return false;
  }
  if (cfg.workers < 0) {
    error = "WORKERS must not be negative";
    return false;
  }
  if (cfg.keyint_sec <= 0.0) {
    error = "KEYINT_SEC must be positive";
    return false;
  }
  if (cfg.encoder.passes != 1 && cfg.encoder.passes != 2) {
    error = "ENCODER_PASSES must be 1 or 2";
    return false;
  }
  if (cfg.search.percentile < 0.0 || cfg.search.percentile > 1.0) {
    error = "SEARCH_PERCENTILE must be within 0..1";
    return false;
  }
  if (cfg.search.min_quality >= 0 && cfg.search.max_quality >= 0 &&
      cfg.search.min_quality > cfg.search.max_quality) {
    error = "QUALITY_MIN must not exceed QUALITY_MAX";
    return false;
  }

  for (const auto &name : split_list(Config::force_stages())) {
    StageId stage;
    if (!parse_stage(name, stage) || stage == StageId::Source) {
      error = fmt::format("Unknown stage '{}' in FORCE_STAGES", name);
      return false;
    }
    cfg.force(stage);
  }

  config = cfg;
  return true;
}

} // namespace scene_encode
