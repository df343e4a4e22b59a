#pragma once

#include <cstdint>

#include "vermouth/base-fd.hpp"

namespace vermouth {

// Simple RAII class wrapping a blocking listening socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream };

  static constexpr int kDefaultBacklog = 128;

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::system_error on failure, std::invalid_argument on unknown type.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Try to bind the socket to the given port with specified options.
  // Returns true on success, false on failure.
  // Throws std::system_error on setsockopt failure.
  [[nodiscard]] bool tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const;

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port, int backlog = kDefaultBacklog);

  // Blocks until a client connects and returns the accepted (blocking, close-on-exec) descriptor.
  // On failure, returns a closed BaseFd and leaves errno set for the caller to classify.
  [[nodiscard]] BaseFd accept() const noexcept;

  // Wake up any thread blocked in accept() without releasing the descriptor.
  void shutdown() const noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace vermouth
