/**
 * @file report.cpp
 * @brief Report writing and console output
 */

#include "scene_encode/report.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <mutex>

#include <fmt/color.h>
#include <fmt/core.h>

#include "scene_encode/logging.hpp"
#include "scene_encode/system.hpp"

namespace scene_encode {

using json = nlohmann::json;

size_t RunSummary::count(SceneStatus s) const {
  return static_cast<size_t>(
      std::count_if(scenes.begin(), scenes.end(),
                    [s](const SceneResult &r) { return r.status == s; }));
}

std::vector<size_t> RunSummary::failed_scenes() const {
  std::vector<size_t> out;
  for (const auto &r : scenes) {
    if (r.status == SceneStatus::Failed)
      out.push_back(r.scene.index);
  }
  return out;
}

// **---- JSON ----**

namespace {

json distribution_json(const Distribution &d) {
  json sigma = json::array();
  for (double v : d.sigma)
    sigma.push_back(v);
  return {{"count", d.count},   {"min", d.min},         {"max", d.max},
          {"mean", d.mean},     {"std_dev", d.std_dev}, {"median", d.median()},
          {"sigma", sigma}};
}

json histogram_json(const std::vector<HistogramBucket> &buckets) {
  json out = json::array();
  for (const auto &b : buckets) {
    out.push_back({{"lower", b.lower}, {"upper", b.upper}, {"count", b.count}});
  }
  return out;
}

const char *run_status_name(RunStatus status) {
  switch (status) {
  case RunStatus::Success:
    return "success";
  case RunStatus::Fatal:
    return "fatal";
  case RunStatus::ScenesFailed:
    return "scenes_failed";
  case RunStatus::Interrupted:
    return "interrupted";
  }
  return "unknown";
}

} // namespace

json report_json(const RunSummary &summary, const OutputLayout &layout) {
  json scenes = json::array();
  for (const auto &r : summary.scenes) {
    json s = {{"index", r.scene.index},
              {"start", r.scene.start},
              {"end", r.scene.end},
              {"frames", r.scene.length()},
              {"status", scene_status_name(r.status)},
              {"cached",
               {{"extract", r.clip.cached},
                {"encode", r.encoded.cached},
                {"measure", r.metrics.cached}}},
              {"seconds", r.seconds}};
    if (r.status == SceneStatus::Cached ||
        r.status == SceneStatus::Recomputed) {
      s["encoded_bytes"] = r.encoded.size;
      s["encoded"] = layout.relative(r.encoded.path);
      s["score"] = r.metrics.scores.mean;
      s["quality"] = r.quality;
    }
    if (!r.trials.empty()) {
      json trials = json::array();
      for (const auto &t : r.trials) {
        trials.push_back({{"quality", t.quality},
                          {"score", t.score},
                          {"cached", t.cached}});
      }
      s["trials"] = std::move(trials);
    }
    if (r.status == SceneStatus::Failed) {
      s["failed_stage"] = stage_name(r.failed_stage);
    }
    if (!r.error.empty()) {
      s["error"] = r.error;
    }
    scenes.push_back(std::move(s));
  }

  json stages = json::object();
  for (size_t i = 1; i < STAGE_COUNT; ++i) {
    stages[stage_name(static_cast<StageId>(i))] = {
        {"hits", summary.hits[i]}, {"misses", summary.misses[i]}};
  }

  json doc;
  doc["status"] = run_status_name(summary.status);
  doc["source"] = summary.source;
  doc["encoder"] = summary.encoder;
  doc["metric"] = summary.metric;
  doc["workers"] = summary.workers;
  doc["searched"] = summary.searched;
  doc["seconds"] = summary.seconds;
  doc["probe"] = {{"frames", summary.probe.frame_count},
                  {"frame_rate", summary.probe.frame_rate.value()},
                  {"width", summary.probe.width},
                  {"height", summary.probe.height},
                  {"crop", summary.probe.crop.empty()
                               ? json(nullptr)
                               : json(summary.probe.crop.filter())}};
  doc["scenes"] = std::move(scenes);
  doc["failed_scenes"] = summary.failed_scenes();
  doc["stages"] = std::move(stages);
  doc["cache"] = {{"hits", summary.cache.hits},
                  {"misses", summary.cache.misses},
                  {"heals", summary.cache.heals},
                  {"conflicts", summary.cache.conflicts},
                  {"writes", summary.cache.writes}};

  if (summary.merged) {
    doc["output"] = {{"path", layout.relative(summary.output.path)},
                     {"bytes", summary.output.size},
                     {"bitrate", summary.bitrate},
                     {"fingerprint", summary.output.fp.hex()}};
  }

  if (summary.has_aggregate) {
    const auto &a = summary.aggregate;
    doc["aggregate"] = {
        {"scenes", a.scenes},
        {"frames", a.frames},
        {"measured_frames",
         {{"measured", a.measured_frames},
          {"expected", summary.expected_metric_frames},
          {"mismatch", summary.frame_mismatch()}}},
        {"weighted_mean", a.weighted_mean},
        {"frame_scores", distribution_json(a.frame_scores)},
        {"scene_lengths", distribution_json(a.scene_lengths)},
        {"qualities", distribution_json(a.qualities)},
        {"histogram", histogram_json(a.histogram)},
        {"quality_histogram", histogram_json(a.quality_histogram)}};
  }
  return doc;
}

bool write_report(const RunSummary &summary, const OutputLayout &layout,
                  std::string &error) {
  const auto path = layout.report_file();
  const auto tmp = temp_path(path);
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      error = fmt::format("Cannot open {}", tmp.string());
      return false;
    }
    out << report_json(summary, layout).dump(2) << "\n";
    out.flush();
    if (!out) {
      error = fmt::format("Failed to write {}", tmp.string());
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    error = fmt::format("Failed to replace {}: {}", path.string(),
                        ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

// **---- Console ----**

namespace {

void print_histogram(const std::vector<HistogramBucket> &buckets,
                     size_t samples) {
  if (buckets.empty() || samples == 0)
    return;

  const size_t max_length = std::min<size_t>(70, samples);
  for (const auto &b : buckets) {
    std::string bar(max_length * b.count / samples, '*');
    fmt::print("{:>8.2f} - {:>8.2f} {:>7} {}\n", b.lower, b.upper, b.count,
               bar);
  }
}

void print_distribution_row(const std::string &name, const Distribution &d) {
  fmt::print("{:<14}{:>9.3f}", name, d.min);
  for (double v : d.sigma)
    fmt::print("{:>9.3f}", v);
  fmt::print("{:>9.3f}{:>9.3f}{:>9.3f}\n", d.max, d.mean, d.std_dev);
}

} // namespace

void print_report(const RunSummary &summary) {
  std::lock_guard<std::mutex> lock(log_mutex);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "======================== SCENES ========================\n");
  fmt::print("{:<7} {:>9} {:>9} {:<11} {:>5} {:>12} {:>10} {:>9}\n", "Scene",
             "Start", "End", "Status", "Hits", "Size", "Score", "Quality");
  fmt::print("{:-<7} {:->9} {:->9} {:-<11} {:->5} {:->12} {:->10} {:->9}\n",
             "", "", "", "", "", "", "", "");

  for (const auto &r : summary.scenes) {
    int hits = static_cast<int>(r.clip.cached) +
               static_cast<int>(r.encoded.cached) +
               static_cast<int>(r.metrics.cached);
    bool done = r.status == SceneStatus::Cached ||
                r.status == SceneStatus::Recomputed;
    std::string quality = "-";
    if (done) {
      quality = r.trials.empty()
                    ? fmt::format("{:g}", r.quality)
                    : fmt::format("{:g} ({})", r.quality, r.trials.size());
    }
    auto line = fmt::format(
        "{:05}   {:>9} {:>9} {:<11} {:>3}/3 {:>12} {:>10} {:>9}\n",
        r.scene.index, r.scene.start, r.scene.end,
        scene_status_name(r.status), hits,
        done ? format_bytes(r.encoded.size) : std::string("-"),
        done ? fmt::format("{:.4f}", r.metrics.scores.mean)
             : std::string("-"),
        quality);
    if (r.status == SceneStatus::Failed) {
      fmt::print(fg(fmt::color::red), "{}", line);
      fmt::print(fg(fmt::color::red), "        {}: {}\n",
                 stage_name(r.failed_stage), r.error);
    } else if (r.status == SceneStatus::Skipped) {
      fmt::print(fg(fmt::color::yellow), "{}", line);
    } else {
      fmt::print("{}", line);
    }
  }

  fmt::print("\n{:<10}", "Stage");
  for (size_t i = 1; i < STAGE_COUNT; ++i)
    fmt::print("{:>10}", stage_name(static_cast<StageId>(i)));
  fmt::print("\n{:<10}", "Hits");
  for (size_t i = 1; i < STAGE_COUNT; ++i)
    fmt::print("{:>10}", summary.hits[i]);
  fmt::print("\n{:<10}", "Misses");
  for (size_t i = 1; i < STAGE_COUNT; ++i)
    fmt::print("{:>10}", summary.misses[i]);
  fmt::print("\n");

  fmt::print("{:<25} {:>25}\n", "Cache heals:", summary.cache.heals);
  fmt::print("{:<25} {:>25}\n", "Cache conflicts:", summary.cache.conflicts);

  if (summary.has_aggregate) {
    const auto &a = summary.aggregate;
    fmt::print(fg(fmt::color::cyan),
               "\n==================== {} STATISTICS ====================\n",
               summary.metric);
    print_histogram(a.histogram, a.frame_scores.count);
    fmt::print("\n{:<14}{:>9}{:>9}{:>9}{:>9}{:>9}{:>9}{:>9}{:>9}{:>9}{:>9}"
               "{:>9}\n",
               "", "Minimum", "-3s", "-2s", "-1s", "Median", "1s", "2s", "3s",
               "Maximum", "Mean", "Std Dev");
    print_distribution_row("Scene Length", a.scene_lengths);
    if (summary.searched)
      print_distribution_row("Quality", a.qualities);
    print_distribution_row(summary.metric, a.frame_scores);
    fmt::print("{:<25} {:>25.4f}\n", "Weighted mean:", a.weighted_mean);

    if (summary.frame_mismatch()) {
      fmt::print(fg(fmt::color::yellow), "{:<25} {:>25}\n", "Frames:",
                 fmt::format("{} (expected {})", a.measured_frames,
                             summary.expected_metric_frames));
    } else {
      fmt::print("{:<25} {:>25}\n", "Frames:", a.measured_frames);
    }

    if (summary.searched) {
      fmt::print(fg(fmt::color::cyan),
                 "\n==================== QUALITY ====================\n");
      print_histogram(a.quality_histogram, a.qualities.count);
    }
  }

  if (summary.merged) {
    fmt::print("{:<25} {:>25}\n", "Output size:",
               format_bytes(summary.output.size));
    fmt::print("{:<25} {:>20.0f} kbps\n", "Bitrate:",
               summary.bitrate / 1000.0);
    fmt::print("Output: {}\n", summary.output.path.string());
  }

  fmt::print("{:<25} {:>24.1f}s\n", "Wall-clock time:", summary.seconds);
  fmt::print(fg(fmt::color::cyan),
             "========================================================\n");
  std::fflush(stdout);
}

} // namespace scene_encode
