// Cache store: persistence, verification on lookup, conflicts, concurrency.

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fixtures/temp_dir.hpp"
#include "scene_encode/cache_store.hpp"

namespace scene_encode {
namespace {

using nlohmann::json;
using test_support::read_file;
using test_support::TempDir;
using test_support::write_file;

Fingerprint Fp(const std::string &name) {
  return fingerprint(StageId::Source, {}, name);
}

CachedResult Value(StageId stage, json value) {
  CachedResult r;
  r.stage = stage;
  r.value = std::move(value);
  return r;
}

class CacheStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string error;
    ASSERT_TRUE(layout_.create(error)) << error;
  }

  // Write and commit an artifact under encode/
  CachedResult Commit(CacheStore &store, const Fingerprint &fp,
                      const std::string &name, const std::string &data) {
    auto final_path = layout_.encode_dir() / name;
    auto tmp = temp_path(final_path);
    write_file(tmp, data);
    CachedResult committed;
    std::string error;
    EXPECT_TRUE(store.commit_artifact(fp, StageId::Encode,
                                      json{{"encoder", "x264"}}, tmp,
                                      final_path, false, committed, error))
        << error;
    return committed;
  }

  TempDir dir_{"cache"};
  OutputLayout layout_{dir_.path()};
};

TEST_F(CacheStoreTest, MissingRecordIsEmpty) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error)) << error;
  EXPECT_EQ(store.size(), 0u);

  CachedResult r;
  EXPECT_FALSE(store.lookup(Fp("a"), r));
  EXPECT_EQ(store.counters().misses, 1u);
}

TEST_F(CacheStoreTest, EntriesSurviveReload) {
  std::string error;
  {
    CacheStore store(layout_);
    ASSERT_TRUE(store.load(error));
    ASSERT_TRUE(store.store(Fp("probe"),
                            Value(StageId::Probe, json{{"frame_count", 100}}),
                            false, error))
        << error;
    Commit(store, Fp("enc"), "scene-00000.mkv", "encoded bytes");
  }

  EXPECT_FALSE(std::filesystem::exists(temp_path(layout_.record_file())));
  auto doc = json::parse(read_file(layout_.record_file()));
  EXPECT_EQ(doc.at("version"), CACHE_RECORD_VERSION);
  EXPECT_EQ(doc.at("entries").size(), 2u);

  CacheStore reloaded(layout_);
  ASSERT_TRUE(reloaded.load(error)) << error;
  EXPECT_EQ(reloaded.size(), 2u);

  CachedResult r;
  ASSERT_TRUE(reloaded.lookup(Fp("probe"), r));
  EXPECT_EQ(r.stage, StageId::Probe);
  EXPECT_EQ(r.value.at("frame_count"), 100);
  EXPECT_FALSE(r.has_artifact);

  ASSERT_TRUE(reloaded.lookup(Fp("enc"), r));
  ASSERT_TRUE(r.has_artifact);
  EXPECT_EQ(r.artifact.path, "encode/scene-00000.mkv");
  EXPECT_EQ(r.artifact.size, 13u);
  EXPECT_EQ(read_file(reloaded.artifact_path(r)), "encoded bytes");
}

TEST_F(CacheStoreTest, CommitMovesTemporaryIntoPlace) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));

  auto committed = Commit(store, Fp("enc"), "a.mkv", "data");
  EXPECT_TRUE(std::filesystem::exists(layout_.encode_dir() / "a.mkv"));
  EXPECT_FALSE(std::filesystem::exists(layout_.encode_dir() / "a.tmp.mkv"));
  EXPECT_EQ(committed.artifact.size, 4u);
}

TEST_F(CacheStoreTest, EmptyOrMissingArtifactIsNotCommitted) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));

  auto final_path = layout_.encode_dir() / "b.mkv";
  CachedResult committed;
  EXPECT_FALSE(store.commit_artifact(Fp("b"), StageId::Encode, json::object(),
                                     temp_path(final_path), final_path, false,
                                     committed, error));

  write_file(temp_path(final_path), "");
  EXPECT_FALSE(store.commit_artifact(Fp("b"), StageId::Encode, json::object(),
                                     temp_path(final_path), final_path, false,
                                     committed, error));
  EXPECT_EQ(store.size(), 0u);
  EXPECT_FALSE(std::filesystem::exists(final_path));
}

TEST_F(CacheStoreTest, DeletedArtifactIsAMiss) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));
  Commit(store, Fp("enc"), "c.mkv", "payload");

  std::filesystem::remove(layout_.encode_dir() / "c.mkv");

  CachedResult r;
  EXPECT_FALSE(store.lookup(Fp("enc"), r));
  EXPECT_EQ(store.counters().heals, 1u);

  // Recommitting the same fingerprint heals the entry without a conflict
  Commit(store, Fp("enc"), "c.mkv", "payload");
  EXPECT_TRUE(store.lookup(Fp("enc"), r));
  EXPECT_EQ(store.counters().conflicts, 0u);
}

TEST_F(CacheStoreTest, ModifiedArtifactIsAMiss) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));
  Commit(store, Fp("enc"), "d.mkv", "original");

  CachedResult r;
  write_file(layout_.encode_dir() / "d.mkv", "tampered");  // same size
  EXPECT_FALSE(store.lookup(Fp("enc"), r));

  write_file(layout_.encode_dir() / "d.mkv", "short");
  EXPECT_FALSE(store.lookup(Fp("enc"), r));
  EXPECT_EQ(store.counters().heals, 2u);

  write_file(layout_.encode_dir() / "d.mkv", "original");
  EXPECT_TRUE(store.lookup(Fp("enc"), r));
}

TEST_F(CacheStoreTest, EqualStoreIsANoOp) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));

  auto v = Value(StageId::Measure, json{{"mean", 0.95}});
  ASSERT_TRUE(store.store(Fp("m"), v, false, error));
  auto writes = store.counters().writes;
  ASSERT_TRUE(store.store(Fp("m"), v, false, error));
  EXPECT_EQ(store.counters().writes, writes);
  EXPECT_EQ(store.counters().conflicts, 0u);
}

TEST_F(CacheStoreTest, DifferentContentIsAConflictAndNewValueWins) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));

  ASSERT_TRUE(store.store(Fp("m"), Value(StageId::Measure, json{{"mean", 1}}),
                          false, error));
  ASSERT_TRUE(store.store(Fp("m"), Value(StageId::Measure, json{{"mean", 2}}),
                          false, error));
  EXPECT_EQ(store.counters().conflicts, 1u);

  CachedResult r;
  ASSERT_TRUE(store.lookup(Fp("m"), r));
  EXPECT_EQ(r.value.at("mean"), 2);

  // A forced overwrite is expected and not a conflict
  ASSERT_TRUE(store.store(Fp("m"), Value(StageId::Measure, json{{"mean", 3}}),
                          true, error));
  EXPECT_EQ(store.counters().conflicts, 1u);
}

TEST_F(CacheStoreTest, InvalidatedValueIsReplacedAsAHeal) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));

  ASSERT_TRUE(store.store(Fp("p"), Value(StageId::Probe, json{{"old", 1}}),
                          false, error));
  CachedResult r;
  ASSERT_TRUE(store.lookup(Fp("p"), r));
  EXPECT_EQ(store.counters().hits, 1u);

  store.invalidate(Fp("p"));
  auto c = store.counters();
  EXPECT_EQ(c.hits, 0u);
  EXPECT_EQ(c.misses, 1u);
  EXPECT_EQ(c.heals, 1u);

  ASSERT_TRUE(store.store(Fp("p"),
                          Value(StageId::Probe, json{{"frame_count", 100}}),
                          false, error));
  EXPECT_EQ(store.counters().conflicts, 0u);
  ASSERT_TRUE(store.lookup(Fp("p"), r));
  EXPECT_EQ(r.value.at("frame_count"), 100);
}

TEST_F(CacheStoreTest, CountersRestartOnLoad) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));
  ASSERT_TRUE(store.store(Fp("a"), Value(StageId::Probe, json{{"x", 1}}),
                          false, error));
  CachedResult r;
  ASSERT_TRUE(store.lookup(Fp("a"), r));
  EXPECT_FALSE(store.lookup(Fp("b"), r));

  ASSERT_TRUE(store.load(error));
  auto c = store.counters();
  EXPECT_EQ(c.hits, 0u);
  EXPECT_EQ(c.misses, 0u);
  EXPECT_EQ(c.writes, 0u);
  EXPECT_TRUE(store.lookup(Fp("a"), r));
}

TEST_F(CacheStoreTest, CorruptRecordIsFatal) {
  std::string error;
  write_file(layout_.record_file(), "{ not json");
  CacheStore store(layout_);
  EXPECT_FALSE(store.load(error));
  EXPECT_NE(error.find("Corrupt"), std::string::npos);

  write_file(layout_.record_file(), R"({"version": 99, "entries": {}})");
  EXPECT_FALSE(store.load(error));

  write_file(layout_.record_file(),
             R"({"version": 1, "entries": {"xyz": {"stage": "probe"}}})");
  EXPECT_FALSE(store.load(error));
}

TEST_F(CacheStoreTest, ConcurrentLookupsAndStores) {
  CacheStore store(layout_);
  std::string error;
  ASSERT_TRUE(store.load(error));

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        std::string err;
        auto fp = Fp(std::to_string(t) + ":" + std::to_string(i));
        CachedResult r;
        if (store.lookup(fp, r))
          failures++;
        if (!store.store(fp, Value(StageId::Measure, json{{"i", i}}), false,
                         err))
          failures++;
        if (!store.lookup(fp, r) || r.value.at("i") != i)
          failures++;
      }
    });
  }
  for (auto &th : threads)
    th.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kPerThread));

  CacheStore reloaded(layout_);
  ASSERT_TRUE(reloaded.load(error)) << error;
  EXPECT_EQ(reloaded.size(), static_cast<size_t>(kThreads * kPerThread));
}

} // namespace
} // namespace scene_encode
