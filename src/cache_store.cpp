/**
 * @file cache_store.cpp
 * @brief Content-addressed result cache implementation
 *
 * @details Record format (cache.json, keys sorted, two-space indent):
 *
 *          {
 *            "entries": {
 *              "<64 hex>": {
 *                "artifact": {"path": "...", "sha256": "...", "size": N},
 *                "stage": "encode",
 *                "value": ...
 *              }
 *            },
 *            "version": 1
 *          }
 *
 *          "artifact" is omitted for inline results.
 */

#include "scene_encode/cache_store.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include "scene_encode/logging.hpp"

using json = nlohmann::json;

namespace scene_encode {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Write @p data to @p path and fsync it before returning
bool write_file_synced(const fs::path &path, const std::string &data,
                       std::string &error) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd == -1) {
    error = fmt::format("Failed to open {}: {}", path.string(),
                        std::strerror(errno));
    return false;
  }

  const char *p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = fmt::format("Failed to write {}: {}", path.string(),
                          std::strerror(errno));
      close(fd);
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    error = fmt::format("Failed to sync {}: {}", path.string(),
                        std::strerror(errno));
    close(fd);
    return false;
  }
  if (close(fd) != 0) {
    error = fmt::format("Failed to close {}: {}", path.string(),
                        std::strerror(errno));
    return false;
  }
  return true;
}

/// fsync an existing file (artifact written by another process)
bool sync_existing(const fs::path &path, std::string &error) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    error = fmt::format("Failed to open {}: {}", path.string(),
                        std::strerror(errno));
    return false;
  }
  int rc = fsync(fd);
  int saved = errno;
  close(fd);
  if (rc != 0) {
    error = fmt::format("Failed to sync {}: {}", path.string(),
                        std::strerror(saved));
    return false;
  }
  return true;
}

/// fsync a directory so a rename inside it is durable
void sync_directory(const fs::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd == -1)
    return;
  if (fsync(fd) != 0) {
    LOG_WARN("fsync({}) failed: {}", dir.string(), std::strerror(errno));
  }
  close(fd);
}

json entry_to_json(const CachedResult &r) {
  json j;
  j["stage"] = stage_name(r.stage);
  j["value"] = r.value;
  if (r.has_artifact) {
    j["artifact"] = {{"path", r.artifact.path},
                     {"sha256", r.artifact.sha256.hex()},
                     {"size", r.artifact.size}};
  }
  return j;
}

bool entry_from_json(const json &j, CachedResult &r, std::string &error) {
  if (!j.is_object() || !j.contains("stage") || !j.contains("value")) {
    error = "entry lacks stage or value";
    return false;
  }
  if (!parse_stage(j.at("stage").get<std::string>(), r.stage)) {
    error = fmt::format("unknown stage '{}'", j.at("stage").get<std::string>());
    return false;
  }
  r.value = j.at("value");
  r.has_artifact = j.contains("artifact");
  if (r.has_artifact) {
    const json &a = j.at("artifact");
    r.artifact.path = a.at("path").get<std::string>();
    r.artifact.size = a.at("size").get<uint64_t>();
    if (!Fingerprint::from_hex(a.at("sha256").get<std::string>(),
                               r.artifact.sha256)) {
      error = "artifact sha256 is not a 64 character hex digest";
      return false;
    }
  }
  return true;
}

std::string short_value(const CachedResult &r) {
  if (r.has_artifact) {
    return fmt::format("{} ({} bytes, sha256 {})", r.artifact.path,
                       r.artifact.size, r.artifact.sha256.short_hex());
  }
  std::string dumped = r.value.dump();
  if (dumped.size() > 80) {
    dumped = dumped.substr(0, 77) + "...";
  }
  return dumped;
}

} // anonymous namespace

// **---- CacheStore ----**

CacheStore::CacheStore(OutputLayout layout) : layout_(std::move(layout)) {}

bool CacheStore::load(std::string &error) {
  const fs::path record = layout_.record_file();
  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  entries_.clear();
  {
    std::lock_guard<std::mutex> guard(invalidated_mutex_);
    invalidated_.clear();
  }
  hits_ = 0;
  misses_ = 0;
  heals_ = 0;
  conflicts_ = 0;
  writes_ = 0;
  failed_ = false;

  std::error_code ec;
  if (!fs::exists(record, ec)) {
    return true;
  }

  std::ifstream in(record);
  if (!in) {
    error = fmt::format("Cannot read cache record {}: {}", record.string(),
                        std::strerror(errno));
    return false;
  }

  json doc;
  try {
    in >> doc;
  } catch (const json::exception &e) {
    error = fmt::format("Corrupt cache record {}: {}", record.string(),
                        e.what());
    return false;
  }

  try {
    if (!doc.is_object() || !doc.contains("version")) {
      error = fmt::format("Corrupt cache record {}: missing version",
                          record.string());
      return false;
    }
    int version = doc.at("version").get<int>();
    if (version != CACHE_RECORD_VERSION) {
      error = fmt::format("Cache record {} has version {}, expected {}",
                          record.string(), version, CACHE_RECORD_VERSION);
      return false;
    }

    const json &entries = doc.value("entries", json::object());
    for (auto it = entries.begin(); it != entries.end(); ++it) {
      Fingerprint fp;
      if (!Fingerprint::from_hex(it.key(), fp)) {
        error = fmt::format("Corrupt cache record {}: bad key '{}'",
                            record.string(), it.key());
        return false;
      }
      CachedResult result;
      std::string cause;
      if (!entry_from_json(it.value(), result, cause)) {
        error = fmt::format("Corrupt cache record {}: entry {}: {}",
                            record.string(), fp.short_hex(), cause);
        return false;
      }
      entries_.emplace(fp, std::move(result));
    }
  } catch (const json::exception &e) {
    error = fmt::format("Corrupt cache record {}: {}", record.string(),
                        e.what());
    return false;
  }

  return true;
}

bool CacheStore::verify_artifact(const Fingerprint &fp,
                                 const CachedResult &entry) {
  const fs::path path = artifact_path(entry);
  std::string reason;

  std::error_code ec;
  uint64_t size = fs::file_size(path, ec);
  if (ec) {
    reason = "missing";
  } else if (size != entry.artifact.size) {
    reason = fmt::format("size {} != recorded {}", size, entry.artifact.size);
  } else {
    Fingerprint digest;
    uint64_t hashed_size = 0;
    std::string error;
    if (!hash_file(path, digest, hashed_size, error)) {
      reason = error;
    } else if (digest != entry.artifact.sha256) {
      reason = "content hash mismatch";
    }
  }

  if (reason.empty())
    return true;

  LOG_WARN("Cache entry {} ({}): artifact {} {}; treating as a miss",
           fp.short_hex(), stage_name(entry.stage), entry.artifact.path,
           reason);
  {
    std::lock_guard<std::mutex> lock(invalidated_mutex_);
    invalidated_.insert(fp);
  }
  heals_++;
  return false;
}

bool CacheStore::lookup(const Fingerprint &fp, CachedResult &result) {
  CachedResult entry;
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(fp);
    if (it == entries_.end()) {
      misses_++;
      return false;
    }
    entry = it->second;
  }

  if (entry.has_artifact && !verify_artifact(fp, entry)) {
    misses_++;
    return false;
  }

  hits_++;
  result = std::move(entry);
  return true;
}

void CacheStore::invalidate(const Fingerprint &fp) {
  {
    std::lock_guard<std::mutex> lock(invalidated_mutex_);
    if (!invalidated_.insert(fp).second)
      return;
  }
  heals_++;
  hits_--;
  misses_++;
}

bool CacheStore::put_locked(const Fingerprint &fp, const CachedResult &result,
                            bool forced, std::string &error) {
  auto it = entries_.find(fp);
  if (it != entries_.end()) {
    if (it->second.same_content(result)) {
      return true;
    }

    bool healed = false;
    {
      std::lock_guard<std::mutex> lock(invalidated_mutex_);
      healed = invalidated_.erase(fp) > 0;
    }

    if (healed) {
      LOG_INFO("Cache entry {} ({}) healed", fp.short_hex(),
               stage_name(result.stage));
    } else if (forced) {
      LOG_INFO("Cache entry {} ({}) overwritten (forced)", fp.short_hex(),
               stage_name(result.stage));
    } else {
      conflicts_++;
      LOG_WARN("Cache conflict on {} ({}): stored {} but new result is {}; "
               "keeping the new result",
               fp.short_hex(), stage_name(result.stage),
               short_value(it->second), short_value(result));
    }
    it->second = result;
  } else {
    entries_.emplace(fp, result);
  }

  if (!persist_locked(error)) {
    failed_.store(true);
    return false;
  }
  return true;
}

bool CacheStore::persist_locked(std::string &error) {
  json entries = json::object();
  for (const auto &kv : entries_) {
    entries[kv.first.hex()] = entry_to_json(kv.second);
  }
  json doc;
  doc["version"] = CACHE_RECORD_VERSION;
  doc["entries"] = std::move(entries);

  const fs::path record = layout_.record_file();
  const fs::path tmp = temp_path(record);
  if (!write_file_synced(tmp, doc.dump(2) + "\n", error)) {
    std::error_code ec;
    fs::remove(tmp, ec);
    return false;
  }

  std::error_code ec;
  fs::rename(tmp, record, ec);
  if (ec) {
    error = fmt::format("Failed to replace {}: {}", record.string(),
                        ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  sync_directory(record.parent_path());
  writes_++;
  return true;
}

bool CacheStore::store(const Fingerprint &fp, const CachedResult &result,
                       bool forced, std::string &error) {
  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  return put_locked(fp, result, forced, error);
}

bool CacheStore::commit_artifact(const Fingerprint &fp, StageId stage,
                                 const json &value, const fs::path &tmp_path,
                                 const fs::path &final_path, bool forced,
                                 CachedResult &committed,
                                 std::string &error) {
  /// 1. Verify: the producer must have left a complete, non-empty file
  Fingerprint digest;
  uint64_t size = 0;
  if (!hash_file(tmp_path, digest, size, error)) {
    error = fmt::format("Artifact not produced: {}", error);
    return false;
  }
  if (size == 0) {
    error = fmt::format("Artifact {} is empty", tmp_path.string());
    return false;
  }
  if (!sync_existing(tmp_path, error))
    return false;

  /// 2. Move into place
  std::error_code ec;
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    error = fmt::format("Failed to move {} to {}: {}", tmp_path.string(),
                        final_path.string(), ec.message());
    return false;
  }
  sync_directory(final_path.parent_path());

  /// 3. Record
  CachedResult result;
  result.stage = stage;
  result.value = value;
  result.has_artifact = true;
  result.artifact.path = layout_.relative(final_path);
  result.artifact.sha256 = digest;
  result.artifact.size = size;

  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  if (!put_locked(fp, result, forced, error))
    return false;
  committed = std::move(result);
  return true;
}

size_t CacheStore::size() const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  return entries_.size();
}

CacheCounters CacheStore::counters() const {
  CacheCounters c;
  c.hits = hits_.load();
  c.misses = misses_.load();
  c.heals = heals_.load();
  c.conflicts = conflicts_.load();
  c.writes = writes_.load();
  return c;
}

} // namespace scene_encode
