#include "vermouth/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace vermouth {

namespace {

bool SetTimeoutOption(int fd, int option, std::chrono::milliseconds timeout) noexcept {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

}  // namespace

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

bool SetRecvTimeout(int fd, std::chrono::milliseconds timeout) noexcept {
  return SetTimeoutOption(fd, SO_RCVTIMEO, timeout);
}

bool SetSendTimeout(int fd, std::chrono::milliseconds timeout) noexcept {
  return SetTimeoutOption(fd, SO_SNDTIMEO, timeout);
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

bool ShutdownWrite(int fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

bool ShutdownReadWrite(int fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

}  // namespace vermouth
