#include "vermouth/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include "vermouth/base-fd.hpp"
#include "vermouth/errno-throw.hpp"
#include "vermouth/log.hpp"
#include "vermouth/socket-ops.hpp"

namespace vermouth {

namespace {

int ToSysType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

void SetReuseOptions(int fd, bool reusePort) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }
}

sockaddr_in AnyAddress(uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  return addr;
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ToSysType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const {
  const int fd = _baseFd.fd();
  SetReuseOptions(fd, reusePort);
  if (tcpNoDelay && !SetTcpNoDelay(fd)) {
    throw_errno("setsockopt(TCP_NODELAY) failed");
  }
  const sockaddr_in addr = AnyAddress(port);
  return ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port, int backlog) {
  if (!tryBind(reusePort, tcpNoDelay, port)) {
    throw_errno("bind failed on port ", std::to_string(port));
  }
  const int fd = _baseFd.fd();
  if (::listen(fd, backlog) == -1) {
    throw_errno("listen failed on port ", std::to_string(port));
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd, port);
}

BaseFd Socket::accept() const noexcept {
  sockaddr_in peer{};
  socklen_t peerLen = sizeof(peer);
  return BaseFd(::accept4(_baseFd.fd(), reinterpret_cast<sockaddr*>(&peer), &peerLen, SOCK_CLOEXEC));
}

void Socket::shutdown() const noexcept {
  if (_baseFd && !ShutdownReadWrite(_baseFd.fd())) {
    log::debug("shutdown of listening fd # {} failed: {}", _baseFd.fd(), std::strerror(errno));
  }
}

}  // namespace vermouth
