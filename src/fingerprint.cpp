/**
 * @file fingerprint.cpp
 * @brief SHA-256 fingerprints over OpenSSL EVP
 */

#include "scene_encode/fingerprint.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>

#include <openssl/evp.h>

#include <fmt/core.h>

#include "scene_encode/memory_io.hpp"

namespace scene_encode {

namespace {

/// Digest large mappings in slices so a single update never exceeds 64MB
constexpr size_t HASH_SLICE = 64 * 1024 * 1024;

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // anonymous namespace

// **---- Fingerprint ----**

std::string Fingerprint::hex() const {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(FINGERPRINT_SIZE * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

std::string Fingerprint::short_hex(size_t n) const { return hex().substr(0, n); }

bool Fingerprint::from_hex(const std::string &hex, Fingerprint &out) {
  if (hex.size() != FINGERPRINT_SIZE * 2)
    return false;
  Fingerprint parsed;
  for (size_t i = 0; i < FINGERPRINT_SIZE; ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    parsed.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  out = parsed;
  return true;
}

// **---- Sha256 ----**

Sha256::Sha256() {
  const EVP_MD *md = EVP_sha256();
  if (!md) {
    throw std::runtime_error("EVP_sha256 unavailable");
  }
  ctx_ = EVP_MD_CTX_new();
  if (!ctx_) {
    throw std::runtime_error("Failed to allocate EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Sha256::~Sha256() {
  if (ctx_)
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void *data, size_t size) {
  if (size == 0)
    return;
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

void Sha256::update_u64(uint64_t value) {
  uint8_t le[8];
  for (int i = 0; i < 8; ++i) {
    le[i] = static_cast<uint8_t>(value >> (8 * i));
  }
  update(le, sizeof(le));
}

Fingerprint Sha256::finish() {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_length = 0;
  if (EVP_DigestFinal_ex(ctx_, hash, &hash_length) != 1 ||
      hash_length != FINGERPRINT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  Fingerprint fp;
  std::memcpy(fp.bytes.data(), hash, FINGERPRINT_SIZE);
  return fp;
}

// **---- Stage fingerprints ----**

Fingerprint fingerprint(StageId stage, const std::vector<Fingerprint> &upstream,
                        const std::string &config) {
  Sha256 sha;
  std::string name = stage_name(stage);
  sha.update_u64(name.size());
  sha.update(name);

  sha.update_u64(upstream.size());
  for (const auto &fp : upstream) {
    sha.update(fp.bytes.data(), fp.bytes.size());
  }

  sha.update_u64(config.size());
  sha.update(config);
  return sha.finish();
}

// **---- File hashing ----**

bool hash_file(const std::filesystem::path &path, Fingerprint &digest,
               uint64_t &size, std::string &error) {
  MappedFile file;
  if (!MemoryLoader::load_file(path.string(), file, error))
    return false;

  Sha256 sha;
  const uint8_t *p = file.data();
  size_t left = file.size();
  while (left > 0) {
    size_t n = std::min(left, HASH_SLICE);
    sha.update(p, n);
    p += n;
    left -= n;
  }
  digest = sha.finish();
  size = file.size();
  return true;
}

bool source_identity(const std::filesystem::path &path, Fingerprint &identity,
                     std::string &error) {
  struct stat sb;
  if (stat(path.c_str(), &sb) == -1) {
    error = fmt::format("Failed to stat {}: {}", path.string(),
                        std::strerror(errno));
    return false;
  }

  Fingerprint content;
  uint64_t size = 0;
  if (!hash_file(path, content, size, error))
    return false;

  int64_t mtime_ns = static_cast<int64_t>(sb.st_mtim.tv_sec) * 1000000000LL +
                     sb.st_mtim.tv_nsec;
  identity = fingerprint(StageId::Source, {content},
                         fmt::format("size={};mtime_ns={}", size, mtime_ns));
  return true;
}

} // namespace scene_encode
