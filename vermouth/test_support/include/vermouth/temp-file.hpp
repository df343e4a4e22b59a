#pragma once

#include <filesystem>
#include <string_view>

namespace vermouth::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "vermouth-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Creates the sub directory 'relativePath' (and its parents) and returns its full path.
  std::filesystem::path makeSubDir(std::string_view relativePath) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a file with a given content inside an existing ScopedTempDir, removed on destruction.
// 'name' may contain sub directories ("css/site.css"), created as needed.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
};

}  // namespace vermouth::test
