#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vermouth {

// Thin wrappers centralising socket system calls so that higher-level modules (http, main)
// never include networking headers directly.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Set a receive deadline on a blocking socket (SO_RCVTIMEO). A zero duration disables it.
// Returns true on success.
bool SetRecvTimeout(int fd, std::chrono::milliseconds timeout) noexcept;

// Set a send deadline on a blocking socket (SO_SNDTIMEO). A zero duration disables it.
// Returns true on success.
bool SetSendTimeout(int fd, std::chrono::milliseconds timeout) noexcept;

// Send data on a connected socket with MSG_NOSIGNAL so that a closed peer yields EPIPE instead of SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

// Shutdown both read and write halves of a socket connection.
// On a listening socket, this wakes up a thread blocked in accept().
// Returns true on success, false on error (errno is set).
bool ShutdownReadWrite(int fd) noexcept;

}  // namespace vermouth
