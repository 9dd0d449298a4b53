/**
 * @file ffmpeg_backend.cpp
 * @brief MediaBackend implementation over FFmpeg
 *
 * @details In-process work (probe, scene detection) uses libavformat,
 *          libavcodec and libavfilter directly. Per-scene work runs the
 *          ffmpeg command line tool so that a cancelled scene can be killed
 *          without corrupting process-wide library state.
 *
 * @attention MANAGEMENT:
 *
 *            - VideoDecoder and CropDetectGraph free every FFmpeg resource
 *              in their destructors, including after partial initialization
 *
 *            - Child process output always goes to a temporary path chosen
 *              by the caller; nothing here renames into place
 */

#include "scene_encode/ffmpeg_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <sys/syscall.h>
#include <unistd.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/pixdesc.h>
}

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "scene_encode/logging.hpp"
#include "scene_encode/process.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace scene_encode {

namespace fs = std::filesystem;

/// Score assigned to frames with infinite PSNR (identical to the reference)
constexpr double PSNR_CEILING = 100.0;

// **---- Internal Helpers ----**

namespace {

std::string av_error(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

enum class DecodeMode { None, KeyFrames, All };

/**
 * @class VideoDecoder
 * @brief Owns the demuxer and decoder for the best video stream of a file.
 */
class VideoDecoder {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;

  /// Send one packet (nullptr = flush) and hand every frame to on_frame
  template <typename FrameFn>
  bool decode(const AVPacket *packet, FrameFn &on_frame, std::string &error) {
    int ret = avcodec_send_packet(dec_ctx, packet);
    if (ret < 0 && ret != AVERROR_EOF) {
      ///\note A damaged packet is skipped; the demuxer keeps going
      return true;
    }
    while (true) {
      ret = avcodec_receive_frame(dec_ctx, frame);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return true;
      if (ret < 0) {
        error = fmt::format("Decoding failed: {}", av_error(ret));
        return false;
      }
      bool ok = on_frame(frame, error);
      av_frame_unref(frame);
      if (!ok)
        return false;
    }
  }

public:
  VideoDecoder() {
    frame = av_frame_alloc();
    pkt = av_packet_alloc();
  }

  ~VideoDecoder() {
    if (dec_ctx)
      avcodec_free_context(&dec_ctx);
    if (fmt_ctx)
      avformat_close_input(&fmt_ctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
  }

  /// Disable copy (FFmpeg contexts are not copyable)
  VideoDecoder(const VideoDecoder &) = delete;
  VideoDecoder &operator=(const VideoDecoder &) = delete;

  bool open(const fs::path &path, DecodeMode mode, std::string &error) {
    if (!frame || !pkt) {
      error = "Failed to allocate AVFrame/AVPacket";
      return false;
    }

    int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
      error = fmt::format("Cannot open {}: {}", path.string(), av_error(ret));
      return false;
    }

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0) {
      error = fmt::format("Cannot read stream info of {}: {}", path.string(),
                          av_error(ret));
      return false;
    }

    video_stream_idx =
        av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_stream_idx < 0) {
      error = fmt::format("No video stream in {}", path.string());
      return false;
    }

    /// Discard non-video streams to save processing time
    for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
      if (i != static_cast<unsigned int>(video_stream_idx)) {
        fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
      }
    }

    if (mode == DecodeMode::None)
      return true;

    AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
    const AVCodec *codec = avcodec_find_decoder(param->codec_id);
    if (!codec) {
      error = fmt::format("No decoder for codec {} in {}",
                          avcodec_get_name(param->codec_id), path.string());
      return false;
    }

    dec_ctx = avcodec_alloc_context3(codec);
    if (!dec_ctx) {
      error = "Failed to allocate decoder context";
      return false;
    }
    ret = avcodec_parameters_to_context(dec_ctx, param);
    if (ret < 0) {
      error = fmt::format("Cannot configure decoder: {}", av_error(ret));
      return false;
    }
    dec_ctx->pkt_timebase = fmt_ctx->streams[video_stream_idx]->time_base;

    /// Only key frames are needed for crop detection
    if (mode == DecodeMode::KeyFrames) {
      dec_ctx->skip_frame = AVDISCARD_NONKEY;
    }

    /// Single sequential pass over the file; let the decoder use all cores
    dec_ctx->thread_count = 0;

    ret = avcodec_open2(dec_ctx, codec, nullptr);
    if (ret < 0) {
      error = fmt::format("avcodec_open2 failed: {}", av_error(ret));
      return false;
    }
    return true;
  }

  AVStream *stream() const { return fmt_ctx->streams[video_stream_idx]; }

  double duration() const {
    return (fmt_ctx->duration != AV_NOPTS_VALUE)
               ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
               : 0.0;
  }

  /**
   * @brief Demux the whole file.
   * @param on_packet Called for every video packet
   * @param on_frame Called for every decoded frame; returning false aborts
   */
  template <typename PacketFn, typename FrameFn>
  bool run(PacketFn &&on_packet, FrameFn &&on_frame, std::string &error) {
    int ret;
    while ((ret = av_read_frame(fmt_ctx, pkt)) >= 0) {
      if (pkt->stream_index == video_stream_idx) {
        on_packet(pkt);
        if (dec_ctx && !decode(pkt, on_frame, error)) {
          av_packet_unref(pkt);
          return false;
        }
      }
      av_packet_unref(pkt);
    }
    if (ret != AVERROR_EOF) {
      error = fmt::format("Read error: {}", av_error(ret));
      return false;
    }
    if (dec_ctx)
      return decode(nullptr, on_frame, error);
    return true;
  }
};

/**
 * @class CropDetectGraph
 * @brief buffer -> cropdetect -> buffersink, configured from the first frame.
 * @note cropdetect with reset=0 reports the bounding box of all non-black
 *       content seen so far, so the last reported rectangle wins.
 */
class CropDetectGraph {
  AVFilterGraph *graph = nullptr;
  AVFilterContext *src_ctx = nullptr;
  AVFilterContext *sink_ctx = nullptr;
  AVFrame *filtered = nullptr;
  CropRect last;
  bool found = false;

  static int dict_int(const AVDictionary *dict, const char *key, bool &ok) {
    const AVDictionaryEntry *e = av_dict_get(dict, key, nullptr, 0);
    if (!e) {
      ok = false;
      return 0;
    }
    return std::atoi(e->value);
  }

  bool drain(std::string &error) {
    while (true) {
      int ret = av_buffersink_get_frame(sink_ctx, filtered);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return true;
      if (ret < 0) {
        error = fmt::format("cropdetect failed: {}", av_error(ret));
        return false;
      }
      bool ok = true;
      CropRect r;
      r.width = dict_int(filtered->metadata, "lavfi.cropdetect.w", ok);
      r.height = dict_int(filtered->metadata, "lavfi.cropdetect.h", ok);
      r.x = dict_int(filtered->metadata, "lavfi.cropdetect.x", ok);
      r.y = dict_int(filtered->metadata, "lavfi.cropdetect.y", ok);
      if (ok) {
        last = r;
        found = true;
      }
      av_frame_unref(filtered);
    }
  }

public:
  CropDetectGraph() = default;
  ~CropDetectGraph() {
    avfilter_graph_free(&graph);
    av_frame_free(&filtered);
  }

  /// Disable copy
  CropDetectGraph(const CropDetectGraph &) = delete;
  CropDetectGraph &operator=(const CropDetectGraph &) = delete;

  bool initialized() const { return graph != nullptr; }

  bool init(const AVFrame *first, AVRational time_base,
            const CropDetectSettings &settings, std::string &error) {
    graph = avfilter_graph_alloc();
    filtered = av_frame_alloc();
    if (!graph || !filtered) {
      error = "Failed to allocate filter graph";
      return false;
    }

    const AVFilter *buffersrc = avfilter_get_by_name("buffer");
    const AVFilter *buffersink = avfilter_get_by_name("buffersink");
    const AVFilter *cropdetect = avfilter_get_by_name("cropdetect");
    if (!buffersrc || !buffersink || !cropdetect) {
      error = "libavfilter lacks buffer, buffersink or cropdetect";
      return false;
    }

    AVRational sar = first->sample_aspect_ratio;
    std::string src_args = fmt::format(
        "video_size={}x{}:pix_fmt={}:time_base={}/{}:pixel_aspect={}/{}",
        first->width, first->height, first->format, time_base.num,
        time_base.den, sar.num, sar.den > 0 ? sar.den : 1);
    std::string crop_args = fmt::format("limit={}:round={}:reset=0",
                                        settings.limit, settings.round);

    AVFilterContext *crop_ctx = nullptr;
    int ret = avfilter_graph_create_filter(&src_ctx, buffersrc, "in",
                                           src_args.c_str(), nullptr, graph);
    if (ret >= 0) {
      ret = avfilter_graph_create_filter(&crop_ctx, cropdetect, "cropdetect",
                                         crop_args.c_str(), nullptr, graph);
    }
    if (ret >= 0) {
      ret = avfilter_graph_create_filter(&sink_ctx, buffersink, "out",
                                         nullptr, nullptr, graph);
    }
    if (ret >= 0)
      ret = avfilter_link(src_ctx, 0, crop_ctx, 0);
    if (ret >= 0)
      ret = avfilter_link(crop_ctx, 0, sink_ctx, 0);
    if (ret >= 0)
      ret = avfilter_graph_config(graph, nullptr);
    if (ret < 0) {
      error = fmt::format("Cannot build cropdetect graph: {}", av_error(ret));
      return false;
    }
    return true;
  }

  bool push(AVFrame *f, std::string &error) {
    int ret = av_buffersrc_add_frame_flags(src_ctx, f,
                                           AV_BUFFERSRC_FLAG_KEEP_REF);
    if (ret < 0) {
      error = fmt::format("cropdetect input failed: {}", av_error(ret));
      return false;
    }
    return drain(error);
  }

  bool finish(std::string &error) {
    int ret = av_buffersrc_add_frame_flags(src_ctx, nullptr, 0);
    if (ret < 0) {
      error = fmt::format("cropdetect flush failed: {}", av_error(ret));
      return false;
    }
    return drain(error);
  }

  /// Detected rectangle; empty if nothing was reported
  CropRect result() const { return found ? last : CropRect{}; }
};

/**
 * @class LumaSampler
 * @brief Mean absolute luma difference between consecutive frames.
 * @note Samples every @p step pixels in both directions inside the crop
 *       area. Handles 8 to 16 bit planar and packed YUV/gray formats.
 */
class LumaSampler {
  std::vector<uint16_t> prev;
  std::vector<uint16_t> cur;
  CropRect area;
  int step;
  bool has_prev = false;

public:
  LumaSampler(CropRect crop, int sample_step)
      : area(crop), step(std::max(1, sample_step)) {}

  /// Normalized (0..1) difference to the previous frame; 0 for the first
  bool sample(const AVFrame *f, double &diff, std::string &error) {
    const AVPixFmtDescriptor *desc =
        av_pix_fmt_desc_get(static_cast<AVPixelFormat>(f->format));
    if (!desc || (desc->flags & (AV_PIX_FMT_FLAG_RGB | AV_PIX_FMT_FLAG_PAL |
                                 AV_PIX_FMT_FLAG_HWACCEL))) {
      error = fmt::format("Unsupported pixel format {} for scene detection",
                          desc ? desc->name : "unknown");
      return false;
    }

    CropRect r = area;
    if (r.empty() || r.x + r.width > f->width || r.y + r.height > f->height) {
      r = CropRect{f->width, f->height, 0, 0};
    }

    const AVComponentDescriptor &luma = desc->comp[0];
    const bool wide = luma.depth > 8;
    const double max_value = static_cast<double>((1 << luma.depth) - 1);
    const uint8_t *plane = f->data[luma.plane];
    const int linesize = f->linesize[luma.plane];

    cur.clear();
    for (int y = r.y; y < r.y + r.height; y += step) {
      const uint8_t *row = plane + static_cast<ptrdiff_t>(y) * linesize;
      for (int x = r.x; x < r.x + r.width; x += step) {
        const uint8_t *p = row + x * luma.step + luma.offset;
        uint16_t v;
        if (wide) {
          std::memcpy(&v, p, sizeof(v));
        } else {
          v = *p;
        }
        cur.push_back(static_cast<uint16_t>(v >> luma.shift));
      }
    }

    diff = 0.0;
    if (has_prev && prev.size() == cur.size() && !cur.empty()) {
      uint64_t total = 0;
      for (size_t i = 0; i < cur.size(); ++i) {
        total += static_cast<uint64_t>(std::abs(static_cast<int>(cur[i]) -
                                                static_cast<int>(prev[i])));
      }
      diff = (static_cast<double>(total) / cur.size()) / max_value;
    }
    prev.swap(cur);
    has_prev = true;
    return true;
  }
};

} // anonymous namespace

std::string quote_filter_value(const std::string &value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

// **---- FFmpegBackend ----**

FFmpegBackend::FFmpegBackend(std::string ffmpeg) : ffmpeg_(std::move(ffmpeg)) {}

std::vector<std::string> FFmpegBackend::base_command() const {
  return {ffmpeg_, "-nostdin", "-hide_banner", "-loglevel", "error", "-y"};
}

bool FFmpegBackend::probe(const fs::path &source,
                          const CropDetectSettings &crop, ProbeInfo &info,
                          std::string &error) {
  VideoDecoder decoder;
  if (!decoder.open(source, crop.enabled ? DecodeMode::KeyFrames
                                         : DecodeMode::None,
                    error)) {
    return false;
  }

  AVStream *st = decoder.stream();
  ProbeInfo out;
  AVRational rate = st->avg_frame_rate.num > 0 ? st->avg_frame_rate
                                               : st->r_frame_rate;
  out.frame_rate = Rational{rate.num, rate.den};
  out.duration = decoder.duration();
  out.width = st->codecpar->width;
  out.height = st->codecpar->height;

  CropDetectGraph graph;
  uint64_t packets = 0;
  const AVRational time_base = st->time_base;

  bool ok = decoder.run(
      [&packets](const AVPacket *) { ++packets; },
      [&](AVFrame *f, std::string &err) {
        if (!graph.initialized() && !graph.init(f, time_base, crop, err))
          return false;
        return graph.push(f, err);
      },
      error);
  if (!ok)
    return false;

  if (packets == 0) {
    error = fmt::format("No video frames in {}", source.string());
    return false;
  }
  out.frame_count = packets;

  if (crop.enabled && graph.initialized()) {
    if (!graph.finish(error))
      return false;
    CropRect r = graph.result();
    ///\note A full-frame rectangle means there is nothing to crop
    if (!r.empty() && (r.width != out.width || r.height != out.height)) {
      out.crop = r;
    }
  }

  info = out;
  return true;
}

bool FFmpegBackend::detect_scenes(const fs::path &source, const ProbeInfo &info,
                                  const SceneDetectSettings &params,
                                  std::vector<uint64_t> &boundaries,
                                  std::string &error) {
  VideoDecoder decoder;
  if (!decoder.open(source, DecodeMode::All, error))
    return false;

  LumaSampler sampler(info.crop, params.sample_step);
  std::vector<double> diffs;
  diffs.reserve(info.frame_count);

  bool ok = decoder.run([](const AVPacket *) {},
                        [&](AVFrame *f, std::string &err) {
                          double d = 0.0;
                          if (!sampler.sample(f, d, err))
                            return false;
                          diffs.push_back(d);
                          return true;
                        },
                        error);
  if (!ok)
    return false;

  if (diffs.size() != info.frame_count) {
    LOG_WARN("Scene detection decoded {} frames, probe counted {}; using the "
             "probed count",
             diffs.size(), info.frame_count);
  }

  boundaries = place_scene_cuts(diffs, info.frame_count, params);
  return true;
}

bool FFmpegBackend::extract(const fs::path &source, const Scene &scene,
                            const fs::path &output, const JobContext &job,
                            std::string &error) {
  std::string filter = fmt::format(
      "select={},setpts=N/FRAME_RATE/TB",
      quote_filter_value(
          fmt::format("between(n,{},{})", scene.start, scene.end - 1)));
  if (!scene.crop.empty()) {
    filter += "," + scene.crop.filter();
  }
  filter += ",format=yuv420p10le";

  auto cmd = base_command();
  cmd.insert(cmd.end(), {"-i", source.string(), "-map", "0:v:0", "-vf", filter,
                         "-vsync", "passthrough", "-c:v", "ffv1", "-level",
                         "3", "-an", "-sn", "-dn", output.string()});

  ProcessResult result;
  if (!run_process(cmd, job.log_path, job.cancel, result, error))
    return false;
  return true;
}

std::vector<std::string>
FFmpegBackend::encode_command(const fs::path &clip,
                              const EncoderSettings &encoder,
                              const fs::path &output, int threads, int pass,
                              const fs::path &passlog) const {
  auto cmd = base_command();
  cmd.insert(cmd.end(), {"-i", clip.string(), "-map", "0:v:0", "-c:v",
                         encoder.codec()});

  const std::string quality = fmt::format("{}", encoder.quality);
  const std::string bitrate =
      fmt::format("{}k", std::llround(encoder.quality));

  /// x265 takes its rate and pass options through one -x265-params list
  std::vector<std::string> x265_params;
  if (encoder.kind == EncoderKind::X265 && pass > 0) {
    x265_params.push_back(fmt::format("pass={}", pass));
    x265_params.push_back("stats=" + passlog.string());
  }

  switch (encoder.kind) {
  case EncoderKind::X264:
  case EncoderKind::X265:
    cmd.insert(cmd.end(), {"-preset", encoder.effective_preset()});
    if (encoder.mode == QualityMode::CRF) {
      cmd.insert(cmd.end(), {"-crf", quality});
    } else if (encoder.mode == QualityMode::Bitrate) {
      cmd.insert(cmd.end(), {"-b:v", bitrate});
    } else if (encoder.kind == EncoderKind::X264) {
      cmd.insert(cmd.end(), {"-qp", quality});
    } else {
      x265_params.insert(x265_params.begin(), "qp=" + quality);
    }
    break;
  case EncoderKind::Aom:
    cmd.insert(cmd.end(), {"-cpu-used", encoder.effective_preset()});
    if (encoder.mode == QualityMode::CRF) {
      cmd.insert(cmd.end(), {"-crf", quality, "-b:v", "0"});
    } else if (encoder.mode == QualityMode::Bitrate) {
      cmd.insert(cmd.end(), {"-b:v", bitrate});
    } else {
      cmd.insert(cmd.end(), {"-aom-params", "end-usage=q:cq-level=" + quality});
    }
    break;
  }

  if (!x265_params.empty()) {
    std::string joined;
    for (size_t i = 0; i < x265_params.size(); ++i)
      joined += (i ? ":" : "") + x265_params[i];
    cmd.insert(cmd.end(), {"-x265-params", joined});
  } else if (pass > 0) {
    cmd.insert(cmd.end(), {"-pass", std::to_string(pass), "-passlogfile",
                           passlog.string()});
  }

  if (encoder.keyint > 0) {
    cmd.insert(cmd.end(), {"-g", std::to_string(encoder.keyint)});
  }
  if (threads > 0) {
    cmd.insert(cmd.end(), {"-threads", std::to_string(threads)});
  }
  cmd.insert(cmd.end(), {"-an", "-sn", "-dn"});
  if (pass == 1) {
    cmd.insert(cmd.end(), {"-f", "null", "/dev/null"});
  } else {
    cmd.push_back(output.string());
  }
  return cmd;
}

namespace {

/// Encoders append their own suffixes to the stats prefix
void remove_pass_logs(const fs::path &passlog) {
  const std::string prefix = passlog.filename().string();
  std::error_code ec;
  for (fs::directory_iterator it(passlog.parent_path(), ec), end;
       !ec && it != end; it.increment(ec)) {
    if (it->path().filename().string().rfind(prefix, 0) == 0) {
      std::error_code rm;
      fs::remove(it->path(), rm);
    }
  }
}

} // namespace

bool FFmpegBackend::encode(const fs::path &clip, const EncoderSettings &encoder,
                           const fs::path &output, const JobContext &job,
                           std::string &error) {
  ProcessResult result;
  if (encoder.passes < 2) {
    return run_process(encode_command(clip, encoder, output, job.threads),
                       job.log_path, job.cancel, result, error);
  }

  const fs::path passlog =
      output.parent_path() / (output.filename().string() + ".pass");
  bool ok = true;
  for (int pass = 1; ok && pass <= 2; ++pass) {
    ok = run_process(
        encode_command(clip, encoder, output, job.threads, pass, passlog),
        job.log_path, job.cancel, result, error);
    if (!ok)
      error = fmt::format("pass {}: {}", pass, error);
  }
  remove_pass_logs(passlog);
  return ok;
}

bool FFmpegBackend::measure(const fs::path &reference,
                            const fs::path &distorted,
                            const MetricSettings &metric, const JobContext &job,
                            MetricScores &scores, std::string &error) {
  /// Both inputs normalized to the same timeline and pixel format
  std::string prep = "setpts=PTS-STARTPTS,format=yuv420p10le";
  if (metric.subsample > 1 && metric.kind != MetricKind::VMAF) {
    prep += ",select=" +
            quote_filter_value(fmt::format("not(mod(n,{}))", metric.subsample));
  }

  fs::path stats = job.log_path;
  std::string compare;
  switch (metric.kind) {
  case MetricKind::PSNR:
    stats.replace_extension(".psnr.log");
    compare = "psnr=stats_file=" + quote_filter_value(stats.string());
    break;
  case MetricKind::SSIM:
    stats.replace_extension(".ssim.log");
    compare = "ssim=stats_file=" + quote_filter_value(stats.string());
    break;
  case MetricKind::VMAF:
    stats.replace_extension(".vmaf.json");
    compare = fmt::format("libvmaf=log_fmt=json:log_path={}:model={}",
                          quote_filter_value(stats.string()),
                          quote_filter_value(metric.vmaf_model));
    if (metric.subsample > 1)
      compare += fmt::format(":n_subsample={}", metric.subsample);
    if (metric.threads > 0)
      compare += fmt::format(":n_threads={}", metric.threads);
    break;
  }

  std::string graph = fmt::format(
      "[0:v]{0}[dist];[1:v]{0}[ref];[dist][ref]{1}", prep, compare);

  auto cmd = base_command();
  cmd.insert(cmd.end(), {"-i", distorted.string(), "-i", reference.string(),
                         "-lavfi", graph, "-f", "null", "-"});

  std::error_code ec;
  fs::remove(stats, ec);

  ProcessResult result;
  if (!run_process(cmd, job.log_path, job.cancel, result, error))
    return false;

  bool ok = false;
  switch (metric.kind) {
  case MetricKind::PSNR:
    ok = parse_stats_file(stats, "psnr_y", scores, error);
    break;
  case MetricKind::SSIM:
    ok = parse_stats_file(stats, "Y", scores, error);
    break;
  case MetricKind::VMAF:
    ok = parse_vmaf_log(stats, scores, error);
    break;
  }
  fs::remove(stats, ec);
  return ok;
}

bool FFmpegBackend::merge(const std::vector<fs::path> &parts,
                          const fs::path &output, const JobContext &job,
                          std::string &error) {
  if (parts.empty()) {
    error = "Nothing to merge";
    return false;
  }

  /// Build concat list
  std::string list_content;
  list_content.reserve(parts.size() * 128);
  for (const auto &part : parts) {
    std::string abs_path = fs::absolute(part).string();
    std::string escaped;
    for (char c : abs_path) {
      if (c == '\'')
        escaped += "'\\''";
      else
        escaped += c;
    }
    list_content += fmt::format("file '{}'\n", escaped);
  }

  /// Create memory file for concat list
  int fd = static_cast<int>(syscall(SYS_memfd_create, "concat_list_mem",
                                    MFD_CLOEXEC));
  if (fd == -1) {
    error = fmt::format("Failed to create memory file: {}",
                        std::strerror(errno));
    return false;
  }

  const char *p = list_content.data();
  size_t left = list_content.size();
  while (left > 0) {
    ssize_t n = write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = fmt::format("Failed to write memory file: {}",
                          std::strerror(errno));
      close(fd);
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }

  std::string mem_file_path = fmt::format("/proc/{}/fd/{}", getpid(), fd);

  auto cmd = base_command();
  cmd.insert(cmd.end(),
             {"-f", "concat", "-safe", "0", "-protocol_whitelist",
              "file,pipe,fd", "-i", mem_file_path, "-map", "0", "-c", "copy",
              "-fflags", "+genpts", "-avoid_negative_ts", "make_zero",
              output.string()});

  ProcessResult result;
  bool ok = run_process(cmd, job.log_path, job.cancel, result, error);
  close(fd);
  return ok;
}

// **---- Metric log parsers ----**

bool parse_stats_file(const fs::path &path, const std::string &key,
                      MetricScores &scores, std::string &error) {
  std::ifstream in(path);
  if (!in) {
    error = fmt::format("Metric log {} not written", path.string());
    return false;
  }

  MetricScores out;
  const std::string prefix = key + ":";
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream tokens(line);
    std::string token;
    while (tokens >> token) {
      if (token.compare(0, prefix.size(), prefix) != 0)
        continue;
      const char *value = token.c_str() + prefix.size();
      char *end = nullptr;
      double v = std::strtod(value, &end);
      if (end == value) {
        error = fmt::format("Malformed {} value '{}' in {}", key, token,
                            path.string());
        return false;
      }
      if (std::isinf(v))
        v = PSNR_CEILING;
      out.frames.push_back(v);
      break;
    }
  }

  if (out.frames.empty()) {
    error = fmt::format("No {} scores in {}", key, path.string());
    return false;
  }

  double sum = 0.0;
  for (double v : out.frames)
    sum += v;
  out.mean = sum / out.frames.size();
  scores = std::move(out);
  return true;
}

bool parse_vmaf_log(const fs::path &path, MetricScores &scores,
                    std::string &error) {
  std::ifstream in(path);
  if (!in) {
    error = fmt::format("VMAF log {} not written", path.string());
    return false;
  }

  MetricScores out;
  try {
    nlohmann::json doc;
    in >> doc;
    for (const auto &frame : doc.at("frames")) {
      out.frames.push_back(frame.at("metrics").at("vmaf").get<double>());
    }
  } catch (const nlohmann::json::exception &e) {
    error = fmt::format("Malformed VMAF log {}: {}", path.string(), e.what());
    return false;
  }

  if (out.frames.empty()) {
    error = fmt::format("No VMAF scores in {}", path.string());
    return false;
  }

  double sum = 0.0;
  for (double v : out.frames)
    sum += v;
  out.mean = sum / out.frames.size();
  scores = std::move(out);
  return true;
}

} // namespace scene_encode
