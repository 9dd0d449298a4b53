/**
 * @file memory_io.hpp
 * @brief Memory-mapped file access
 *
 * @details Provides:
 *          - MappedFile: RAII owner of a read-only mapping
 *
 *          - MemoryLoader: maps whole files for sequential reads (hashing)
 *
 */

#ifndef SCENE_ENCODE_MEMORY_IO_HPP
#define SCENE_ENCODE_MEMORY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace scene_encode {

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Handles automatic cleanup (munmap/close) on destruction.
 *       Supports move semantics but not copy.
 *       An empty file is valid and has size() == 0 and data() == nullptr.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  /// Disable copy
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  /// Enable move
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }

private:
  friend class MemoryLoader;
  void reset();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/**
 * @class MemoryLoader
 * @brief Maps files into memory for zero-copy sequential reading.
 *
 * @attention ROBUSTNESS:
 *
 * - Uses mmap for efficient file access (zero-copy)
 *
 * - Handles mapping failure without throwing
 *
 * - Reports the failing syscall through the error string
 */
class MemoryLoader {
public:
  /**
   * @brief Map an entire file into memory using mmap.
   * @param path Path to the file
   * @param file Output MappedFile object (takes ownership of the mapping)
   * @param error Output: cause on failure
   * @return true on success, false on failure
   */
  static bool load_file(const std::string &path, MappedFile &file,
                        std::string &error);
};

} // namespace scene_encode

#endif // SCENE_ENCODE_MEMORY_IO_HPP
