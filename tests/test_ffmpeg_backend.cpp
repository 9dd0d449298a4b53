// FFmpeg command construction and metric log parsing (no ffmpeg needed).

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "fixtures/temp_dir.hpp"
#include "scene_encode/ffmpeg_backend.hpp"

namespace scene_encode {
namespace {

using test_support::TempDir;
using test_support::write_file;

bool HasPair(const std::vector<std::string> &cmd, const std::string &flag,
             const std::string &value) {
  auto it = std::find(cmd.begin(), cmd.end(), flag);
  return it != cmd.end() && it + 1 != cmd.end() && *(it + 1) == value;
}

TEST(FFmpegBackendTest, X264CrfCommand) {
  FFmpegBackend backend("ffmpeg");
  EncoderSettings enc;
  enc.keyint = 120;

  auto cmd = backend.encode_command("clip.mkv", enc, "out.mkv", 4);
  EXPECT_EQ(cmd.front(), "ffmpeg");
  EXPECT_EQ(cmd.back(), "out.mkv");
  EXPECT_TRUE(HasPair(cmd, "-i", "clip.mkv"));
  EXPECT_TRUE(HasPair(cmd, "-c:v", "libx264"));
  EXPECT_TRUE(HasPair(cmd, "-preset", "medium"));
  EXPECT_TRUE(HasPair(cmd, "-crf", "23"));
  EXPECT_TRUE(HasPair(cmd, "-g", "120"));
  EXPECT_TRUE(HasPair(cmd, "-threads", "4"));
}

TEST(FFmpegBackendTest, QpAndAomVariants) {
  FFmpegBackend backend("/opt/ffmpeg/bin/ffmpeg");

  EncoderSettings x265;
  x265.kind = EncoderKind::X265;
  x265.mode = QualityMode::QP;
  x265.quality = 28;
  auto cmd = backend.encode_command("c.mkv", x265, "o.mkv", 0);
  EXPECT_EQ(cmd.front(), "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_TRUE(HasPair(cmd, "-x265-params", "qp=28"));
  EXPECT_EQ(std::find(cmd.begin(), cmd.end(), "-threads"), cmd.end());
  EXPECT_EQ(std::find(cmd.begin(), cmd.end(), "-g"), cmd.end());

  EncoderSettings aom;
  aom.kind = EncoderKind::Aom;
  aom.quality = 32;
  cmd = backend.encode_command("c.mkv", aom, "o.mkv", 0);
  EXPECT_TRUE(HasPair(cmd, "-c:v", "libaom-av1"));
  EXPECT_TRUE(HasPair(cmd, "-cpu-used", "6"));
  EXPECT_TRUE(HasPair(cmd, "-crf", "32"));
  EXPECT_TRUE(HasPair(cmd, "-b:v", "0"));
}

TEST(FFmpegBackendTest, BitrateMode) {
  FFmpegBackend backend("ffmpeg");
  EncoderSettings enc;
  enc.mode = QualityMode::Bitrate;
  enc.quality = 2500;

  auto cmd = backend.encode_command("c.mkv", enc, "o.mkv", 0);
  EXPECT_TRUE(HasPair(cmd, "-b:v", "2500k"));
  EXPECT_EQ(std::find(cmd.begin(), cmd.end(), "-crf"), cmd.end());

  enc.kind = EncoderKind::Aom;
  cmd = backend.encode_command("c.mkv", enc, "o.mkv", 0);
  EXPECT_TRUE(HasPair(cmd, "-b:v", "2500k"));
}

TEST(FFmpegBackendTest, TwoPassCommands) {
  FFmpegBackend backend("ffmpeg");
  EncoderSettings enc;
  enc.passes = 2;

  auto first = backend.encode_command("c.mkv", enc, "o.mkv", 0, 1, "o.pass");
  EXPECT_TRUE(HasPair(first, "-pass", "1"));
  EXPECT_TRUE(HasPair(first, "-passlogfile", "o.pass"));
  EXPECT_TRUE(HasPair(first, "-f", "null"));
  EXPECT_EQ(std::find(first.begin(), first.end(), "o.mkv"), first.end());

  auto second = backend.encode_command("c.mkv", enc, "o.mkv", 0, 2, "o.pass");
  EXPECT_TRUE(HasPair(second, "-pass", "2"));
  EXPECT_EQ(second.back(), "o.mkv");

  EncoderSettings x265;
  x265.kind = EncoderKind::X265;
  x265.mode = QualityMode::QP;
  x265.quality = 28;
  auto cmd = backend.encode_command("c.mkv", x265, "o.mkv", 0, 2, "o.pass");
  EXPECT_TRUE(HasPair(cmd, "-x265-params", "qp=28:pass=2:stats=o.pass"));
  EXPECT_EQ(std::find(cmd.begin(), cmd.end(), "-pass"), cmd.end());
}

TEST(FFmpegBackendTest, ParsesPsnrStats) {
  TempDir dir("stats");
  write_file(dir / "a.psnr.log",
             "n:1 mse_avg:0.50 mse_y:0.40 psnr_avg:51.14 psnr_y:52.11 "
             "psnr_u:55.0 psnr_v:55.1\n"
             "n:2 mse_avg:0.00 mse_y:0.00 psnr_avg:inf psnr_y:inf "
             "psnr_u:inf psnr_v:inf\n");

  MetricScores scores;
  std::string error;
  ASSERT_TRUE(parse_stats_file(dir / "a.psnr.log", "psnr_y", scores, error))
      << error;
  ASSERT_EQ(scores.frames.size(), 2u);
  EXPECT_DOUBLE_EQ(scores.frames[0], 52.11);
  EXPECT_DOUBLE_EQ(scores.frames[1], 100.0);
  EXPECT_DOUBLE_EQ(scores.mean, (52.11 + 100.0) / 2);
}

TEST(FFmpegBackendTest, ParsesSsimStats) {
  TempDir dir("stats");
  write_file(dir / "a.ssim.log",
             "n:1 Y:0.990000 U:0.995000 V:0.994000 All:0.991000 (20.45)\n"
             "n:2 Y:0.970000 U:0.985000 V:0.984000 All:0.975000 (16.02)\n");

  MetricScores scores;
  std::string error;
  ASSERT_TRUE(parse_stats_file(dir / "a.ssim.log", "Y", scores, error))
      << error;
  ASSERT_EQ(scores.frames.size(), 2u);
  EXPECT_DOUBLE_EQ(scores.mean, 0.98);
}

TEST(FFmpegBackendTest, RejectsEmptyOrMissingStats) {
  TempDir dir("stats");
  write_file(dir / "empty.log", "");
  MetricScores scores;
  std::string error;
  EXPECT_FALSE(parse_stats_file(dir / "empty.log", "Y", scores, error));
  EXPECT_FALSE(parse_stats_file(dir / "missing.log", "Y", scores, error));
  write_file(dir / "bad.log", "n:1 Y:abc\n");
  EXPECT_FALSE(parse_stats_file(dir / "bad.log", "Y", scores, error));
}

TEST(FFmpegBackendTest, ParsesVmafLog) {
  TempDir dir("stats");
  write_file(dir / "a.vmaf.json", R"({
    "version": "2.3.1",
    "frames": [
      {"frameNum": 0, "metrics": {"vmaf": 94.5, "adm2": 0.98}},
      {"frameNum": 1, "metrics": {"vmaf": 95.5, "adm2": 0.99}}
    ],
    "pooled_metrics": {"vmaf": {"mean": 95.0}}
  })");

  MetricScores scores;
  std::string error;
  ASSERT_TRUE(parse_vmaf_log(dir / "a.vmaf.json", scores, error)) << error;
  EXPECT_EQ(scores.frames.size(), 2u);
  EXPECT_DOUBLE_EQ(scores.mean, 95.0);

  write_file(dir / "b.vmaf.json", R"({"frames": [{"metrics": {}}]})");
  EXPECT_FALSE(parse_vmaf_log(dir / "b.vmaf.json", scores, error));
}

TEST(FFmpegBackendTest, QuotesFilterValues) {
  EXPECT_EQ(quote_filter_value("between(n,0,39)"), "'between(n,0,39)'");
  EXPECT_EQ(quote_filter_value("it's"), "'it'\\''s'");
}

} // namespace
} // namespace scene_encode
