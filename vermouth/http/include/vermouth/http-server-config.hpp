#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "vermouth/http-status-code.hpp"

namespace vermouth {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. The effective port is
  // returned by HttpServer::listen() and available through HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT allowing several HttpServer instances to bind the same (non-ephemeral)
  // port. Disabled by default.
  bool reusePort{false};

  // Disables the Nagle algorithm on accepted connections. Default: false.
  bool tcpNoDelay{false};

  // Maximum length of the queue of pending connections given to listen(2).
  int listenBacklog{128};

  // ============================
  // Request parsing & body limits
  // ============================
  // Number of bytes requested from the connection per read call while collecting the request head.
  std::size_t readChunkBytes{1024};

  // Maximum allowed size (in bytes) of the request head (request line + all headers + CRLFCRLF).
  // If exceeded, the server replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum allowed size (in bytes) of a request body announced by Content-Length.
  // Larger requests are answered with 413 and closed. Default: 1 MiB.
  std::size_t maxBodyBytes{1UL << 20};

  // Status answered when the request line cannot be decoded. Default: 400.
  http::StatusCode malformedRequestStatus{http::StatusCodeBadRequest};

  // ============================
  // Deadlines
  // ============================
  // Maximum time a single blocking read on a connection may wait (SO_RCVTIMEO). 0 disables it.
  std::chrono::milliseconds readTimeout{std::chrono::milliseconds{5000}};

  // Maximum time a single blocking write on a connection may wait (SO_SNDTIMEO). 0 disables it.
  std::chrono::milliseconds writeTimeout{std::chrono::milliseconds{5000}};

  // Validates config. Throws std::invalid_argument if it's not valid.
  void validate() const;

  // Set the server port to bind to (0 = ephemeral)
  HttpServerConfig& withPort(uint16_t port);

  // Enable / disable SO_REUSEPORT
  HttpServerConfig& withReusePort(bool on = true);

  // Enable / disable TCP_NODELAY on accepted sockets
  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withListenBacklog(int backlog);

  HttpServerConfig& withReadChunkBytes(std::size_t readChunkBytes);

  // Set maximum request header bytes
  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  // Set maximum request body bytes
  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withMalformedRequestStatus(http::StatusCode status);

  HttpServerConfig& withReadTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withWriteTimeout(std::chrono::milliseconds timeout);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace vermouth
