/**
 * @file stages.cpp
 * @brief Cache-aware stage functions implementation
 */

#include "scene_encode/stages.hpp"

#include <cmath>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "scene_encode/logging.hpp"

using json = nlohmann::json;

namespace scene_encode {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

void remove_quietly(const fs::path &path) {
  std::error_code ec;
  fs::remove(path, ec);
}

/**
 * @brief Lookup-or-produce for stages whose result is a file.
 *
 * @param produce bool(const fs::path &tmp, std::string &error); writes the
 *                artifact to tmp
 */
template <typename Produce>
bool produce_artifact(StageContext &ctx, StageId stage, const Fingerprint &fp,
                      const fs::path &final_path, const json &value,
                      Produce &&produce, ArtifactOutput &out,
                      std::string &error) {
  const bool forced = ctx.config.forced(stage);

  CachedResult cached;
  if (!forced && ctx.store.lookup(fp, cached)) {
    ctx.counters.record(stage, true);
    out.fp = fp;
    out.path = ctx.store.artifact_path(cached);
    out.size = cached.artifact.size;
    out.cached = true;
    return true;
  }
  ctx.counters.record(stage, false);

  /// Leftover from an interrupted run
  const fs::path tmp = temp_path(final_path);
  remove_quietly(tmp);

  if (!produce(tmp, error)) {
    remove_quietly(tmp);
    return false;
  }

  CachedResult committed;
  if (!ctx.store.commit_artifact(fp, stage, value, tmp, final_path, forced,
                                 committed, error)) {
    remove_quietly(tmp);
    return false;
  }

  out.fp = fp;
  out.path = final_path;
  out.size = committed.artifact.size;
  out.cached = false;
  return true;
}

/**
 * @brief Lookup-or-compute for stages whose result is an inline value.
 *
 * @param decode bool(const json &value, std::string &error); loads a cached
 *               value into the caller's output
 * @param compute bool(json &value, std::string &error); does the work and
 *                fills the value to store
 */
template <typename Decode, typename Compute>
bool produce_value(StageContext &ctx, StageId stage, const Fingerprint &fp,
                   Decode &&decode, Compute &&compute, bool &was_cached,
                   std::string &error) {
  const bool forced = ctx.config.forced(stage);

  CachedResult cached;
  if (!forced && ctx.store.lookup(fp, cached)) {
    std::string cause;
    if (decode(cached.value, cause)) {
      ctx.counters.record(stage, true);
      was_cached = true;
      return true;
    }
    LOG_WARN("Cache entry {} ({}) has an unreadable value ({}); recomputing",
             fp.short_hex(), stage_name(stage), cause);
    ctx.store.invalidate(fp);
  }
  ctx.counters.record(stage, false);

  json value;
  if (!compute(value, error))
    return false;

  CachedResult result;
  result.stage = stage;
  result.value = std::move(value);
  if (!ctx.store.store(fp, result, forced, error))
    return false;

  was_cached = false;
  return true;
}

json probe_to_json(const ProbeInfo &info) {
  json j;
  j["frame_count"] = info.frame_count;
  j["frame_rate"] = {{"num", info.frame_rate.num}, {"den", info.frame_rate.den}};
  j["duration"] = info.duration;
  j["width"] = info.width;
  j["height"] = info.height;
  if (info.crop.empty()) {
    j["crop"] = nullptr;
  } else {
    j["crop"] = {{"w", info.crop.width},
                 {"h", info.crop.height},
                 {"x", info.crop.x},
                 {"y", info.crop.y}};
  }
  return j;
}

bool probe_from_json(const json &j, ProbeInfo &info, std::string &error) {
  try {
    ProbeInfo out;
    out.frame_count = j.at("frame_count").get<uint64_t>();
    out.frame_rate.num = j.at("frame_rate").at("num").get<int>();
    out.frame_rate.den = j.at("frame_rate").at("den").get<int>();
    out.duration = j.at("duration").get<double>();
    out.width = j.at("width").get<int>();
    out.height = j.at("height").get<int>();
    const json &crop = j.at("crop");
    if (!crop.is_null()) {
      out.crop.width = crop.at("w").get<int>();
      out.crop.height = crop.at("h").get<int>();
      out.crop.x = crop.at("x").get<int>();
      out.crop.y = crop.at("y").get<int>();
    }
    info = out;
    return true;
  } catch (const json::exception &e) {
    error = e.what();
    return false;
  }
}

json scores_to_json(const MetricScores &scores) {
  return json{{"mean", scores.mean}, {"frames", scores.frames}};
}

bool scores_from_json(const json &j, MetricScores &scores,
                      std::string &error) {
  try {
    MetricScores out;
    out.mean = j.at("mean").get<double>();
    out.frames = j.at("frames").get<std::vector<double>>();
    scores = std::move(out);
    return true;
  } catch (const json::exception &e) {
    error = e.what();
    return false;
  }
}

JobContext scene_job(const StageContext &ctx, const Scene &scene,
                     const Fingerprint &fp, const char *what) {
  JobContext job;
  job.log_path = ctx.layout.scene_log(scene.index, fp,
                                      fmt::format("{}.log", what));
  job.cancel = ctx.config.cancel;
  return job;
}

} // anonymous namespace

// **---- Helpers ----**

bool build_scenes(const std::vector<uint64_t> &boundaries, uint64_t total,
                  const CropRect &crop, std::vector<Scene> &scenes,
                  std::string &error) {
  if (boundaries.size() < 2) {
    error = fmt::format("Scene detector returned {} boundaries; at least 2 "
                        "are required",
                        boundaries.size());
    return false;
  }
  if (boundaries.front() != 0) {
    error = fmt::format("First scene boundary is {}, expected 0",
                        boundaries.front());
    return false;
  }
  if (boundaries.back() != total) {
    error = fmt::format("Last scene boundary is {}, expected frame count {}",
                        boundaries.back(), total);
    return false;
  }

  std::vector<Scene> out;
  out.reserve(boundaries.size() - 1);
  for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
    if (boundaries[i + 1] <= boundaries[i]) {
      error = fmt::format("Scene boundaries not strictly increasing at index "
                          "{} ({} -> {})",
                          i, boundaries[i], boundaries[i + 1]);
      return false;
    }
    Scene s;
    s.index = i;
    s.start = boundaries[i];
    s.end = boundaries[i + 1];
    s.crop = crop;
    out.push_back(s);
  }

  scenes = std::move(out);
  return true;
}

int derive_keyint(const ProbeInfo &info, double keyint_sec) {
  double fps = info.frame_rate.value();
  if (fps <= 0.0 && info.duration > 0.0) {
    fps = static_cast<double>(info.frame_count) / info.duration;
  }
  if (fps <= 0.0 || keyint_sec <= 0.0)
    return 0;
  long frames = std::lround(fps * keyint_sec);
  return frames < 1 ? 1 : static_cast<int>(frames);
}

std::string extract_canonical(const Scene &scene) {
  json j;
  j["start"] = scene.start;
  j["end"] = scene.end;
  j["crop"] = scene.crop.empty() ? std::string("none") : scene.crop.filter();
  return j.dump();
}

// **---- Stages ----**

bool run_probe(StageContext &ctx, const Fingerprint &source_id,
               ProbeOutput &out, std::string &error) {
  out.fp = fingerprint(StageId::Probe, {source_id}, ctx.config.crop.canonical());

  return produce_value(
      ctx, StageId::Probe, out.fp,
      [&](const json &value, std::string &cause) {
        return probe_from_json(value, out.info, cause);
      },
      [&](json &value, std::string &err) {
        ProbeInfo info;
        if (!ctx.media.probe(ctx.config.source, ctx.config.crop, info, err))
          return false;
        out.info = info;
        value = probe_to_json(info);
        return true;
      },
      out.cached, error);
}

bool run_detect(StageContext &ctx, const ProbeOutput &probe, DetectOutput &out,
                std::string &error) {
  out.fp =
      fingerprint(StageId::Detect, {probe.fp}, ctx.config.scenes.canonical());

  bool ok = produce_value(
      ctx, StageId::Detect, out.fp,
      [&](const json &value, std::string &cause) {
        try {
          out.boundaries = value.at("boundaries").get<std::vector<uint64_t>>();
          return true;
        } catch (const json::exception &e) {
          cause = e.what();
          return false;
        }
      },
      [&](json &value, std::string &err) {
        std::vector<uint64_t> boundaries;
        if (!ctx.media.detect_scenes(ctx.config.source, probe.info,
                                     ctx.config.scenes, boundaries, err))
          return false;

        ///\note Validate before committing so a broken detector never
        /// poisons the cache
        std::vector<Scene> check;
        if (!build_scenes(boundaries, probe.info.frame_count, probe.info.crop,
                          check, err)) {
          err = "Scene detector violated the partition invariant: " + err;
          return false;
        }
        out.boundaries = boundaries;
        value = json{{"boundaries", boundaries}};
        return true;
      },
      out.cached, error);
  if (!ok)
    return false;

  return build_scenes(out.boundaries, probe.info.frame_count, probe.info.crop,
                      out.scenes, error);
}

bool run_extract(StageContext &ctx, const Fingerprint &probe_fp,
                 const Scene &scene, ArtifactOutput &out, std::string &error) {
  const Fingerprint fp =
      fingerprint(StageId::Extract, {probe_fp}, extract_canonical(scene));
  const fs::path final_path = ctx.layout.scene_clip(scene.index, fp);
  const JobContext job = scene_job(ctx, scene, fp, "extract");

  bool ok = produce_artifact(
      ctx, StageId::Extract, fp, final_path,
      json{{"start", scene.start}, {"end", scene.end}},
      [&](const fs::path &tmp, std::string &err) {
        return ctx.media.extract(ctx.config.source, scene, tmp, job, err);
      },
      out, error);
  if (ok)
    remove_quietly(job.log_path);
  return ok;
}

bool run_encode(StageContext &ctx, const Scene &scene,
                const ArtifactOutput &clip, const EncoderSettings &encoder,
                ArtifactOutput &out, std::string &error) {
  const Fingerprint fp =
      fingerprint(StageId::Encode, {clip.fp}, encoder.canonical());
  const fs::path final_path =
      ctx.layout.encoded_scene(scene.index, fp, encoder.extension());
  JobContext job = scene_job(ctx, scene, fp, "encode");
  job.threads = ctx.config.encode_threads;

  bool ok = produce_artifact(
      ctx, StageId::Encode, fp, final_path,
      json{{"encoder", encoder.identifier()}},
      [&](const fs::path &tmp, std::string &err) {
        return ctx.media.encode(clip.path, encoder, tmp, job, err);
      },
      out, error);
  if (ok)
    remove_quietly(job.log_path);
  return ok;
}

bool run_measure(StageContext &ctx, const Scene &scene,
                 const ArtifactOutput &clip, const ArtifactOutput &encoded,
                 MeasureOutput &out, std::string &error) {
  out.fp = fingerprint(StageId::Measure, {encoded.fp, clip.fp},
                       ctx.config.metric.canonical());
  JobContext job = scene_job(ctx, scene, out.fp, "measure");
  job.threads = ctx.config.metric.threads;

  bool ok = produce_value(
      ctx, StageId::Measure, out.fp,
      [&](const json &value, std::string &cause) {
        return scores_from_json(value, out.scores, cause);
      },
      [&](json &value, std::string &err) {
        MetricScores scores;
        if (!ctx.media.measure(clip.path, encoded.path, ctx.config.metric, job,
                               scores, err))
          return false;
        out.scores = scores;
        value = scores_to_json(scores);
        return true;
      },
      out.cached, error);
  if (ok)
    remove_quietly(job.log_path);
  return ok;
}

bool run_quality_search(StageContext &ctx, const Scene &scene,
                        const ArtifactOutput &clip, SearchOutput &out,
                        StageId &stage, std::string &error) {
  const SearchSettings &settings = ctx.config.search;
  QualitySearch search(settings, ctx.config.encoder.mode,
                       default_quality_range(ctx.config.encoder, settings));
  const std::string tag = scene_tag(scene.index);

  EncoderSettings trial = ctx.config.encoder;
  int quality = 0;
  while (search.next(quality)) {
    ArtifactOutput encoded;
    MeasureOutput metrics;
    trial.quality = quality;

    stage = StageId::Encode;
    if (!run_encode(ctx, scene, clip, trial, encoded, error))
      return false;
    stage = StageId::Measure;
    if (!run_measure(ctx, scene, clip, encoded, metrics, error))
      return false;

    double score = percentile_score(metrics.scores, settings.percentile);
    search.record(quality, score, encoded.cached && metrics.cached);
    if (!encoded.cached || !metrics.cached) {
      LOG_INFO("{} {} {} -> {:.4f} (best {})", tag,
               quality_mode_name(trial.mode), quality, score, search.best());
    }
  }

  out.quality = search.best();
  out.trials = search.trials();
  trial.quality = out.quality;

  stage = StageId::Encode;
  if (!run_encode(ctx, scene, clip, trial, out.encoded, error))
    return false;
  stage = StageId::Measure;
  return run_measure(ctx, scene, clip, out.encoded, out.metrics, error);
}

bool run_merge(StageContext &ctx, const std::vector<ArtifactOutput> &encoded,
               ArtifactOutput &out, std::string &error) {
  std::vector<Fingerprint> upstream;
  std::vector<fs::path> parts;
  upstream.reserve(encoded.size());
  parts.reserve(encoded.size());
  for (const auto &e : encoded) {
    upstream.push_back(e.fp);
    parts.push_back(e.path);
  }

  const Fingerprint fp =
      fingerprint(StageId::Merge, upstream, R"({"container":"mkv"})");
  const fs::path final_path =
      ctx.layout.merged_output(ctx.config.output_identifier(), fp);

  JobContext job;
  job.log_path =
      ctx.layout.metrics_dir() / fmt::format("merge-{}.log", fp.short_hex());
  job.cancel = ctx.config.cancel;

  bool ok = produce_artifact(
      ctx, StageId::Merge, fp, final_path,
      json{{"scenes", encoded.size()}},
      [&](const fs::path &tmp, std::string &err) {
        return ctx.media.merge(parts, tmp, job, err);
      },
      out, error);
  if (ok)
    remove_quietly(job.log_path);
  return ok;
}

} // namespace scene_encode
