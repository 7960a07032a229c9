#pragma once

#include <stdlib.h>

#include <cerrno>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace codebox {
namespace testing {

// Scratch directory removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "codebox_test_XXXXXX").string();
    char* created = mkdtemp(pattern.data());
    if (created == nullptr) {
      throw std::system_error(errno, std::generic_category(), "mkdtemp");
    }
    path_ = created;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& Path() const { return path_; }

  std::filesystem::path Write(const std::string& name, const std::string& content) const {
    std::filesystem::path file = path_ / name;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    out << content;
    return file;
  }

 private:
  std::filesystem::path path_;
};

}  // namespace testing
}  // namespace codebox
