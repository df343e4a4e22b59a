#include "vermouth/http-server.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "vermouth/base-fd.hpp"
#include "vermouth/connection-dispatcher.hpp"
#include "vermouth/http-server-config.hpp"
#include "vermouth/log.hpp"
#include "vermouth/socket.hpp"

namespace vermouth {

namespace {

// accept(2) failures that only concern the pending connection, or are transient.
bool IsRecoverableAcceptError(int err) {
  switch (err) {
    case EINTR:
    case ECONNABORTED:
    case EPROTO:
    case EPERM:
    case EAGAIN:
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
      return true;
    default:
      return false;
  }
}

bool IsResourceExhaustion(int err) { return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM; }

}  // namespace

HttpServer::HttpServer(HttpServerConfig config) : _config(std::move(config)) { _config.validate(); }

HttpServer::~HttpServer() {
  stop();
  waitForInFlightConnections();
}

uint16_t HttpServer::listen(uint16_t port) {
  std::scoped_lock lock(_listenMutex);
  if (_listenSocket) {
    throw std::logic_error("HttpServer is already listening on port " + std::to_string(_port.load()));
  }
  Socket socket(Socket::Type::Stream);
  socket.bindAndListen(_config.reusePort, _config.tcpNoDelay, port, _config.listenBacklog);
  _listenSocket = std::move(socket);
  _port.store(port, std::memory_order_release);
  log::info("Server listening on port {}", port);
  return port;
}

void HttpServer::run() {
  int listenFd;
  {
    std::scoped_lock lock(_listenMutex);
    if (!_listenSocket) {
      throw std::logic_error("HttpServer::listen() must be called before run()");
    }
    if (_running.exchange(true, std::memory_order_acq_rel)) {
      throw std::logic_error("HttpServer is already running");
    }
    listenFd = _listenSocket.fd();
  }

  int fatalErr = 0;
  while (!_stopRequested.load(std::memory_order_acquire)) {
    BaseFd connection = _listenSocket.accept();
    if (connection) {
      log::debug("Accepted connection fd # {} on listening fd # {}", connection.fd(), listenFd);
      spawnConnection(std::move(connection));
      continue;
    }
    const int err = errno;
    if (_stopRequested.load(std::memory_order_acquire)) {
      break;
    }
    if (!IsRecoverableAcceptError(err)) {
      fatalErr = err;
      break;
    }
    log::warn("accept failed: {}", std::strerror(err));
    if (IsResourceExhaustion(err)) {
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
  }

  waitForInFlightConnections();
  {
    std::scoped_lock lock(_listenMutex);
    _listenSocket.close();
    _port.store(0, std::memory_order_release);
    _stopRequested.store(false, std::memory_order_release);
    _running.store(false, std::memory_order_release);
  }

  if (fatalErr != 0) {
    log::error("Listener failure: {}", std::strerror(fatalErr));
    throw std::system_error(std::error_code(fatalErr, std::generic_category()), "accept failed");
  }
  log::info("Server stopped");
}

void HttpServer::stop() noexcept {
  if (!_stopRequested.exchange(true, std::memory_order_acq_rel)) {
    log::debug("Stop requested");
  }
  // unblocks accept()
  std::scoped_lock lock(_listenMutex);
  _listenSocket.shutdown();
}

std::size_t HttpServer::nbInFlightConnections() const {
  std::scoped_lock lock(_inFlightMutex);
  return _nbInFlight;
}

void HttpServer::spawnConnection(BaseFd connection) {
  {
    std::scoped_lock lock(_inFlightMutex);
    ++_nbInFlight;
  }
  try {
    std::thread([this, connection = std::move(connection)]() mutable {
      ConnectionDispatcher(_router, _config).serve(std::move(connection));
      std::scoped_lock lock(_inFlightMutex);
      --_nbInFlight;
      _inFlightCv.notify_all();
    }).detach();
  } catch (const std::system_error& ex) {
    log::error("Unable to spawn a connection thread: {}", ex.what());
    std::scoped_lock lock(_inFlightMutex);
    --_nbInFlight;
  }
}

void HttpServer::waitForInFlightConnections() {
  std::unique_lock lock(_inFlightMutex);
  _inFlightCv.wait(lock, [this] { return _nbInFlight == 0; });
}

}  // namespace vermouth
