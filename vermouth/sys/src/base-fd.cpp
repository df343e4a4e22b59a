#include "vermouth/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "vermouth/log.hpp"

namespace vermouth {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  while (::close(_fd) != 0) {
    if (errno == EINTR) {
      continue;
    }
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
    break;
  }
  log::debug("fd # {} closed", _fd);
  _fd = kClosedFd;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace vermouth
