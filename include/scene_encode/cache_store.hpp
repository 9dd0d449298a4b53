/**
 * @file cache_store.hpp
 * @brief Content-addressed result cache persisted in the output directory
 *
 * @details The CacheStore maps a stage Fingerprint to a CachedResult: an
 *          inline JSON value (frame count, scene boundaries, scores) and
 *          optionally a reference to an artifact file together with that
 *          file's SHA-256 and size.
 *
 *          The record file (cache.json) is the single source of truth for
 *          "is this done". It is rewritten atomically (temp file, fsync,
 *          rename) on every committed change.
 *
 * @attention CONCURRENCY:
 *
 * - lookup() is safe from any number of threads (shared lock while the
 *   entry is copied, artifact verification outside the lock)
 *
 * - store() and commit_artifact() serialize on an exclusive lock, so the
 *   record file is never written by two threads at once
 *
 * - commit_artifact() verifies the fully written temp file, renames it into
 *   place and only then records it. A crash at any point leaves either no
 *   entry or an entry whose artifact is complete.
 */

#ifndef SCENE_ENCODE_CACHE_STORE_HPP
#define SCENE_ENCODE_CACHE_STORE_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "fingerprint.hpp"
#include "layout.hpp"
#include "types.hpp"

namespace scene_encode {

/**
 * @struct ArtifactRef
 * @brief A file referenced by a cache entry.
 */
struct ArtifactRef {
  std::string path;  //< Relative to the output directory
  Fingerprint sha256;
  uint64_t size = 0;

  bool operator==(const ArtifactRef &o) const {
    return path == o.path && sha256 == o.sha256 && size == o.size;
  }
  bool operator!=(const ArtifactRef &o) const { return !(*this == o); }
};

/**
 * @struct CachedResult
 * @brief A stored stage result.
 */
struct CachedResult {
  StageId stage = StageId::Probe;
  nlohmann::json value;
  bool has_artifact = false;
  ArtifactRef artifact;

  bool same_content(const CachedResult &o) const {
    return stage == o.stage && value == o.value &&
           has_artifact == o.has_artifact &&
           (!has_artifact || artifact == o.artifact);
  }
};

/**
 * @struct CacheCounters
 * @brief Snapshot of store activity for reporting and tests.
 */
struct CacheCounters {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t heals = 0;      //< Lookups demoted to a miss by verification
  uint64_t conflicts = 0;  //< Stores that replaced a valid, different entry
  uint64_t writes = 0;     //< Record file rewrites
};

class CacheStore {
public:
  explicit CacheStore(OutputLayout layout);

  /// Disable copy
  CacheStore(const CacheStore &) = delete;
  CacheStore &operator=(const CacheStore &) = delete;

  /**
   * @brief Read the record file. A missing file is an empty store.
   * @note Counters restart from zero on every load.
   *
   * @return false (fatal) if the file is unreadable, malformed or of an
   *         unsupported version
   */
  bool load(std::string &error);

  /**
   * @brief Look up a fingerprint.
   *
   * @details For artifact-backed entries the file must exist with the stored
   *          size and SHA-256. Otherwise the entry is treated as a miss and
   *          the fingerprint is remembered as invalidated, so the following
   *          store() is logged as a heal rather than a conflict.
   *
   * @param fp Fingerprint to find
   * @param result Output: stored result on hit
   * @return true on a verified hit
   */
  bool lookup(const Fingerprint &fp, CachedResult &result);

  /**
   * @brief Demote a hit whose value the caller could not use.
   *
   * @details Counted like a failed verification: the lookup becomes a miss,
   *          and the next store() over @p fp is a heal, not a conflict.
   */
  void invalidate(const Fingerprint &fp);

  /**
   * @brief Store an inline result.
   *
   * @details Equal content is a no-op. Different content replaces the entry
   *          and is logged: as a heal after an invalidated lookup, as a
   *          forced overwrite when @p forced, otherwise as a conflict.
   *
   * @return false if the record file could not be persisted (fatal)
   */
  bool store(const Fingerprint &fp, const CachedResult &result, bool forced,
             std::string &error);

  /**
   * @brief Verify @p tmp_path, move it to @p final_path and record it.
   *
   * @param fp Entry fingerprint
   * @param stage Producing stage
   * @param value Inline value stored alongside the artifact
   * @param tmp_path Fully written artifact under its temporary name
   * @param final_path Destination inside the output directory
   * @param forced Overwrite is expected (FORCE_STAGES)
   * @param committed Output: the recorded result
   * @param error Output: cause on failure
   * @return false if the artifact is missing or empty, the rename fails or
   *         the record cannot be persisted
   */
  bool commit_artifact(const Fingerprint &fp, StageId stage,
                       const nlohmann::json &value,
                       const std::filesystem::path &tmp_path,
                       const std::filesystem::path &final_path, bool forced,
                       CachedResult &committed, std::string &error);

  /// Absolute path of an entry's artifact
  std::filesystem::path artifact_path(const CachedResult &result) const {
    return layout_.resolve(result.artifact.path);
  }

  const OutputLayout &layout() const { return layout_; }

  size_t size() const;
  CacheCounters counters() const;

  /// True once a record write has failed; the run must stop
  bool failed() const { return failed_.load(); }

private:
  bool verify_artifact(const Fingerprint &fp, const CachedResult &entry);
  bool put_locked(const Fingerprint &fp, const CachedResult &result,
                  bool forced, std::string &error);
  bool persist_locked(std::string &error);

  OutputLayout layout_;

  mutable std::shared_mutex entries_mutex_;
  std::map<Fingerprint, CachedResult> entries_;

  /// Fingerprints demoted by a failed verification during this run
  std::mutex invalidated_mutex_;
  std::set<Fingerprint> invalidated_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> heals_{0};
  std::atomic<uint64_t> conflicts_{0};
  std::atomic<uint64_t> writes_{0};
  std::atomic<bool> failed_{false};
};

} // namespace scene_encode

#endif // SCENE_ENCODE_CACHE_STORE_HPP
