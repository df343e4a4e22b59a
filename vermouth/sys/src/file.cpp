#include "vermouth/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include "vermouth/errno-throw.hpp"
#include "vermouth/http-constants.hpp"
#include "vermouth/log.hpp"
#include "vermouth/mime-mappings.hpp"

namespace vermouth {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    default:
      throw std::invalid_argument("Invalid file open mode");
  }
}

}  // namespace

File::File(const char* path, OpenMode mode) : _fd(::open(path, Flags(mode))) {
  if (!_fd) {
    log::debug("Unable to open file '{}': {}", path, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    log::error("fstat on '{}' failed: {}", path, std::strerror(errno));
    _fd.close();
    return;
  }
  if (!S_ISREG(st.st_mode)) {
    log::debug("'{}' is not a regular file", path);
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
  _mimeType = DetermineMIMETypeStr(path);
}

std::string File::loadAllContent() const {
  if (!_fd) {
    throw std::logic_error("File is not opened");
  }

  std::string content(_fileSize, '\0');
  std::size_t nbRead = 0;
  while (nbRead < content.size()) {
    const auto ret = ::pread(_fd.fd(), content.data() + nbRead, content.size() - nbRead, static_cast<off_t>(nbRead));
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("read of file fd # ", std::to_string(_fd.fd()), " failed");
    }
    if (ret == 0) {
      // file shrank since it was opened
      break;
    }
    nbRead += static_cast<std::size_t>(ret);
  }
  content.resize(nbRead);
  return content;
}

std::string_view File::detectedContentType() const noexcept {
  return _mimeType.empty() ? http::ContentTypeApplicationOctetStream : _mimeType;
}

}  // namespace vermouth
