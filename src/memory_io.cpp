/**
 * @file memory_io.cpp
 * @brief Memory-mapped file access implementation
 *
 * @details Provides implementations for:
 *
 *          - MappedFile: RAII wrapper for mmap
 *
 *          - MemoryLoader::load_file - Map file into memory
 */

#include "scene_encode/memory_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

namespace scene_encode {

// **---- MappedFile Implementation ----**

MappedFile::~MappedFile() { reset(); }

void MappedFile::reset() {
  if (data_) {
    munmap(data_, size_);
  }
  if (fd_ != -1) {
    close(fd_);
  }
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    reset();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

// **---- MemoryLoader Implementation ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file,
                             std::string &error) {
  /// Open file for reading
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    error = fmt::format("Failed to open {}: {}", path, std::strerror(errno));
    return false;
  }

  /// Get file size
  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    error = fmt::format("Failed to stat {}: {}", path, std::strerror(errno));
    close(fd);
    return false;
  }

  file.reset();

  /// mmap rejects zero-length mappings; an empty file is simply empty
  if (sb.st_size == 0) {
    file.fd_ = fd;
    return true;
  }

  /// Map file into memory (read-only, private)
  void *addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    error = fmt::format("Failed to mmap {}: {}", path, std::strerror(errno));
    close(fd);
    return false;
  }

  ///\note MADV_SEQUENTIAL enables aggressive read-ahead for hashing
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  /// Transfer ownership to MappedFile
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);
  file.fd_ = fd;

  return true;
}

} // namespace scene_encode
