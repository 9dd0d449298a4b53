// Stage settings: canonical forms feed fingerprints, so they must change
// exactly when the output would.

#include <gtest/gtest.h>

#include <string>

#include "scene_encode/config.hpp"

namespace scene_encode {
namespace {

TEST(ConfigTest, EncoderCanonicalTracksOutputAffectingFields) {
  EncoderSettings base;
  const std::string c = base.canonical();

  EncoderSettings other = base;
  other.quality = 24.0;
  EXPECT_NE(other.canonical(), c);

  other = base;
  other.kind = EncoderKind::X265;
  EXPECT_NE(other.canonical(), c);

  other = base;
  other.mode = QualityMode::QP;
  EXPECT_NE(other.canonical(), c);

  other = base;
  other.keyint = 120;
  EXPECT_NE(other.canonical(), c);

  other = base;
  other.passes = 2;
  EXPECT_NE(other.canonical(), c);

  other = base;
  other.mode = QualityMode::Bitrate;
  EXPECT_NE(other.canonical(), c);

  // Default preset spelled out is the same configuration
  other = base;
  other.preset = "medium";
  EXPECT_EQ(other.canonical(), c);

  // Sub-precision noise does not change the identity
  other = base;
  other.quality = 23.0 + 1e-9;
  EXPECT_EQ(other.canonical(), c);
}

TEST(ConfigTest, EncoderIdentifierAndCodec) {
  EncoderSettings s;
  EXPECT_EQ(s.identifier(), "x264-medium-crf23.00");
  EXPECT_STREQ(s.codec(), "libx264");

  s.kind = EncoderKind::Aom;
  s.mode = QualityMode::QP;
  s.quality = 30;
  EXPECT_EQ(s.identifier(), "aom-6-qp30.00");
  EXPECT_STREQ(s.codec(), "libaom-av1");
}

TEST(ConfigTest, MetricThreadsDoNotAffectIdentity) {
  MetricSettings m;
  MetricSettings threaded = m;
  threaded.threads = 16;
  EXPECT_EQ(m.canonical(), threaded.canonical());

  // The VMAF model only matters for VMAF
  MetricSettings other_model = m;
  other_model.vmaf_model = "version=vmaf_4k_v0.6.1";
  EXPECT_EQ(m.canonical(), other_model.canonical());

  m.kind = MetricKind::VMAF;
  other_model.kind = MetricKind::VMAF;
  EXPECT_NE(m.canonical(), other_model.canonical());
}

TEST(ConfigTest, DisabledCropIgnoresItsParameters) {
  CropDetectSettings a;
  a.enabled = false;
  CropDetectSettings b = a;
  b.limit = 99;
  EXPECT_EQ(a.canonical(), b.canonical());

  a.enabled = b.enabled = true;
  EXPECT_NE(a.canonical(), b.canonical());
}

TEST(ConfigTest, NameTablesParseTheirOwnOutput) {
  for (auto kind : {EncoderKind::X264, EncoderKind::X265, EncoderKind::Aom}) {
    EncoderKind parsed;
    ASSERT_TRUE(parse_encoder_kind(encoder_kind_name(kind), parsed));
    EXPECT_EQ(parsed, kind);
  }
  EncoderKind av1;
  ASSERT_TRUE(parse_encoder_kind("av1", av1));
  EXPECT_EQ(av1, EncoderKind::Aom);

  MetricKind metric;
  EXPECT_TRUE(parse_metric_kind("vmaf", metric));
  EXPECT_FALSE(parse_metric_kind("butteraugli", metric));

  StageId stage;
  EXPECT_TRUE(parse_stage("measure", stage));
  EXPECT_EQ(stage, StageId::Measure);
  EXPECT_FALSE(parse_stage("aggregate", stage));
}

TEST(ConfigTest, OutputIdentifierNamesTheSearch) {
  PipelineConfig config;
  EXPECT_EQ(config.output_identifier(), "x264-medium-crf23.00");

  config.search.rule = QualityRule::Minimum;
  config.search.target = 0.98;
  EXPECT_EQ(config.output_identifier(), "x264-medium-crf-ssim-minimum0.9800");

  for (auto rule : {QualityRule::Fixed, QualityRule::Maximum,
                    QualityRule::Minimum, QualityRule::Target}) {
    QualityRule parsed;
    ASSERT_TRUE(parse_quality_rule(quality_rule_name(rule), parsed));
    EXPECT_EQ(parsed, rule);
  }
  QualityMode mode;
  ASSERT_TRUE(parse_quality_mode("bitrate", mode));
  EXPECT_EQ(mode, QualityMode::Bitrate);
}

TEST(ConfigTest, ForceMaskIsPerStage) {
  PipelineConfig config;
  EXPECT_FALSE(config.forced(StageId::Encode));
  config.force(StageId::Encode);
  EXPECT_TRUE(config.forced(StageId::Encode));
  EXPECT_FALSE(config.forced(StageId::Measure));
  EXPECT_FALSE(config.cancelled());
}

TEST(ConfigTest, LoadsFromEnvironment) {
  PipelineConfig config;
  std::string error;
  ASSERT_TRUE(load_pipeline_config("in.mkv", "out", config, error)) << error;
  EXPECT_EQ(config.source.string(), "in.mkv");
  EXPECT_EQ(config.output_dir.string(), "out");
  EXPECT_GE(config.metric.subsample, 1);
  EXPECT_GT(config.keyint_sec, 0.0);
  EXPECT_EQ(config.cancel, nullptr);
  EXPECT_EQ(config.encoder.passes, 1);
  EXPECT_FALSE(config.search.enabled());
}

} // namespace
} // namespace scene_encode
