#include "vermouth/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include "vermouth/http-status-code.hpp"

namespace vermouth {

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withListenBacklog(int backlog) {
  this->listenBacklog = backlog;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadChunkBytes(std::size_t readChunkBytes) {
  this->readChunkBytes = readChunkBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMalformedRequestStatus(http::StatusCode status) {
  this->malformedRequestStatus = status;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadTimeout(std::chrono::milliseconds timeout) {
  this->readTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withWriteTimeout(std::chrono::milliseconds timeout) {
  this->writeTimeout = timeout;
  return *this;
}

void HttpServerConfig::validate() const {
  if (readChunkBytes == 0) {
    throw std::invalid_argument("readChunkBytes must be > 0");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (listenBacklog <= 0) {
    throw std::invalid_argument("listenBacklog must be > 0");
  }
  if (!http::IsError(malformedRequestStatus)) {
    throw std::invalid_argument("malformedRequestStatus must be an error status code (4xx or 5xx)");
  }
  if (readTimeout.count() < 0) {
    throw std::invalid_argument("readTimeout must be non-negative");
  }
  if (writeTimeout.count() < 0) {
    throw std::invalid_argument("writeTimeout must be non-negative");
  }
}

}  // namespace vermouth
