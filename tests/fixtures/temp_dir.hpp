// Scratch directories for tests that touch the filesystem.

#ifndef SCENE_ENCODE_TESTS_TEMP_DIR_HPP
#define SCENE_ENCODE_TESTS_TEMP_DIR_HPP

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <unistd.h>

namespace scene_encode::test_support {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &tag) {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("scene_encode_" + tag + "_" + std::to_string(getpid()) + "_" +
             std::to_string(counter++));
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &name) const { return path_ / name; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << data;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

} // namespace scene_encode::test_support

#endif // SCENE_ENCODE_TESTS_TEMP_DIR_HPP
