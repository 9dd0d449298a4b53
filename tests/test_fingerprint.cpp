// Fingerprint composition and file identity.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fixtures/temp_dir.hpp"
#include "scene_encode/fingerprint.hpp"

namespace scene_encode {
namespace {

using test_support::TempDir;
using test_support::write_file;

Fingerprint Leaf(const std::string &name) {
  return fingerprint(StageId::Source, {}, name);
}

TEST(FingerprintTest, Sha256MatchesKnownVector) {
  Sha256 sha;
  sha.update(std::string("abc"));
  EXPECT_EQ(sha.finish().hex(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(FingerprintTest, IsDeterministic) {
  auto a = Leaf("a");
  EXPECT_EQ(fingerprint(StageId::Encode, {a}, "{\"crf\":23}"),
            fingerprint(StageId::Encode, {a}, "{\"crf\":23}"));
}

TEST(FingerprintTest, DependsOnEveryInput) {
  auto a = Leaf("a");
  auto b = Leaf("b");
  auto base = fingerprint(StageId::Encode, {a, b}, "cfg");

  EXPECT_NE(base, fingerprint(StageId::Measure, {a, b}, "cfg"));
  EXPECT_NE(base, fingerprint(StageId::Encode, {b, a}, "cfg"));
  EXPECT_NE(base, fingerprint(StageId::Encode, {a}, "cfg"));
  EXPECT_NE(base, fingerprint(StageId::Encode, {a, b}, "cfg2"));
}

TEST(FingerprintTest, FieldBoundariesAreUnambiguous) {
  auto x = Leaf("x");
  std::string raw(x.bytes.begin(), x.bytes.end());

  // An upstream digest is not the same input as its bytes in the config
  EXPECT_NE(fingerprint(StageId::Probe, {x}, ""),
            fingerprint(StageId::Probe, {}, raw));
  EXPECT_NE(fingerprint(StageId::Probe, {x}, ""),
            fingerprint(StageId::Probe, {}, x.hex()));
  EXPECT_NE(fingerprint(StageId::Probe, {}, ""),
            fingerprint(StageId::Probe, {Fingerprint{}}, ""));
}

TEST(FingerprintTest, HexRoundTrip) {
  auto fp = Leaf("round");
  Fingerprint parsed;
  ASSERT_TRUE(Fingerprint::from_hex(fp.hex(), parsed));
  EXPECT_EQ(parsed, fp);
  EXPECT_EQ(fp.short_hex().size(), 12u);
  EXPECT_EQ(fp.hex().substr(0, 12), fp.short_hex());

  EXPECT_FALSE(Fingerprint::from_hex("abc", parsed));
  EXPECT_FALSE(Fingerprint::from_hex(std::string(64, 'g'), parsed));
  EXPECT_NE(fp, Fingerprint{});
}

TEST(FingerprintTest, HashFileReportsSizeAndContent) {
  TempDir dir("fingerprint");
  write_file(dir / "a.bin", "abc");

  Fingerprint digest;
  uint64_t size = 0;
  std::string error;
  ASSERT_TRUE(hash_file(dir / "a.bin", digest, size, error)) << error;
  EXPECT_EQ(size, 3u);
  EXPECT_EQ(digest.hex(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  EXPECT_FALSE(hash_file(dir / "missing.bin", digest, size, error));
  EXPECT_FALSE(error.empty());
}

TEST(FingerprintTest, SourceIdentityFollowsContent) {
  TempDir dir("identity");
  write_file(dir / "src.mkv", "frame data");

  Fingerprint first, again, changed;
  std::string error;
  ASSERT_TRUE(source_identity(dir / "src.mkv", first, error)) << error;
  ASSERT_TRUE(source_identity(dir / "src.mkv", again, error)) << error;
  EXPECT_EQ(first, again);

  write_file(dir / "src.mkv", "frame data, edited");
  ASSERT_TRUE(source_identity(dir / "src.mkv", changed, error)) << error;
  EXPECT_NE(first, changed);

  EXPECT_FALSE(source_identity(dir / "none.mkv", changed, error));
}

} // namespace
} // namespace scene_encode
