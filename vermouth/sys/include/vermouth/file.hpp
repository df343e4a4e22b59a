#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "vermouth/base-fd.hpp"

namespace vermouth {

// Read-only regular file, the filesystem capability used to serve assets.
class File {
 public:
  enum class OpenMode : uint8_t { ReadOnly };

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a regular file by path. On failure (missing file, permission denied, directory),
  // operator bool() returns false.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  explicit File(std::string_view path, OpenMode mode = OpenMode::ReadOnly) : File(std::string(path), mode) {}

  // Open a regular file by path (must be null-terminated).
  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Return the file size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read the whole file content, starting from the beginning.
  // Throws std::logic_error if the file is not opened, std::system_error on read failure.
  [[nodiscard]] std::string loadAllContent() const;

  // Returns the probable content type based on the file extension.
  // If not found, return 'application/octet-stream'.
  [[nodiscard]] std::string_view detectedContentType() const noexcept;

 private:
  BaseFd _fd;
  std::string_view _mimeType;
  std::size_t _fileSize{0};
};

}  // namespace vermouth
