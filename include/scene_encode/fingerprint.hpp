/**
 * @file fingerprint.hpp
 * @brief Content-addressed stage identities
 *
 * @details Provides:
 *          - Fingerprint: fixed-width SHA-256 digest with hex conversion
 *
 *          - Sha256: RAII wrapper over an OpenSSL EVP digest context
 *
 *          - fingerprint(): stage identity over upstream fingerprints and
 *            canonical configuration bytes
 *
 *          - hash_file() / source_identity(): identities of files on disk
 *
 * @attention Fingerprints compose. A downstream stage hashes the upstream
 *            stage's fingerprint, never the upstream artifact itself.
 */

#ifndef SCENE_ENCODE_FINGERPRINT_HPP
#define SCENE_ENCODE_FINGERPRINT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "types.hpp"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace scene_encode {

/// SHA-256 digest width in bytes
constexpr size_t FINGERPRINT_SIZE = 32;

/**
 * @struct Fingerprint
 * @brief Opaque digest identifying a stage's effective inputs and config.
 */
struct Fingerprint {
  std::array<uint8_t, FINGERPRINT_SIZE> bytes{};

  /// 64 lowercase hex characters
  std::string hex() const;

  /// First @p n hex characters, used in artifact file names
  std::string short_hex(size_t n = 12) const;

  /**
   * @brief Parse a 64 character hex string.
   * @return false if the string has the wrong length or a non-hex character
   */
  static bool from_hex(const std::string &hex, Fingerprint &out);

  bool operator==(const Fingerprint &other) const {
    return bytes == other.bytes;
  }
  bool operator!=(const Fingerprint &other) const {
    return bytes != other.bytes;
  }
  bool operator<(const Fingerprint &other) const {
    return bytes < other.bytes;
  }
};

/**
 * @class Sha256
 * @brief Incremental SHA-256 over an OpenSSL EVP context.
 * @note Throws std::runtime_error if OpenSSL cannot provide the digest.
 */
class Sha256 {
public:
  Sha256();
  ~Sha256();

  /// Disable copy
  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  void update(const void *data, size_t size);
  void update(const std::string &data) { update(data.data(), data.size()); }

  /// Append a 64-bit little-endian length or counter
  void update_u64(uint64_t value);

  /// Finalize the digest; the object must not be updated afterwards
  Fingerprint finish();

private:
  EVP_MD_CTX *ctx_ = nullptr;
};

/**
 * @brief Compute a stage fingerprint.
 *
 * @details The digest input is the length-prefixed stage name, the number of
 *          upstream fingerprints followed by each digest in order, and the
 *          length-prefixed canonical configuration. The encoding is
 *          unambiguous, so distinct inputs never serialize identically.
 *
 * @param stage Stage being identified
 * @param upstream Upstream fingerprints (order-sensitive)
 * @param config Canonical serialization of the stage configuration
 */
Fingerprint fingerprint(StageId stage, const std::vector<Fingerprint> &upstream,
                        const std::string &config);

/**
 * @brief Hash the full contents of a file.
 *
 * @param path File to hash
 * @param digest Output: SHA-256 of the contents
 * @param size Output: file size in bytes
 * @param error Output: cause on failure
 * @return true on success
 */
bool hash_file(const std::filesystem::path &path, Fingerprint &digest,
               uint64_t &size, std::string &error);

/**
 * @brief Identify a source file by content hash, byte length and mtime.
 *
 * @param path Source video file
 * @param identity Output: combined identity fingerprint
 * @param error Output: cause on failure
 * @return true on success
 */
bool source_identity(const std::filesystem::path &path, Fingerprint &identity,
                     std::string &error);

} // namespace scene_encode

#endif // SCENE_ENCODE_FINGERPRINT_HPP
