#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string_view>
#include <utility>

#include "vermouth/base-fd.hpp"
#include "vermouth/http-server-config.hpp"
#include "vermouth/middleware.hpp"
#include "vermouth/router.hpp"
#include "vermouth/socket.hpp"

namespace vermouth {

// HttpServer
//  - Blocking accept loop running in the thread calling run() (or start()).
//  - Each accepted connection is served by its own detached thread, which reads one request,
//    answers it and closes the connection. run() waits for in-flight connections before returning.
//  - Routes and middlewares can be registered at any time, including while serving.
//  - stop() is thread safe and can be called from any thread (or from a handler).
//
// Typical usage:
//   HttpServer server;
//   server.get("/hello/:name", [](HttpRequest& req, ResponseContext& resp) {
//     resp.text(http::StatusCodeOK, "Hello " + std::string(req.pathParam("name")));
//   });
//   server.start(8080);  // blocks until stop()
class HttpServer {
 public:
  // Throws std::invalid_argument if 'config' is not valid.
  explicit HttpServer(HttpServerConfig config = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  // Stops the server (if needed) and waits for in-flight connections.
  ~HttpServer();

  [[nodiscard]] Router& router() noexcept { return _router; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  HttpServer& addRoute(std::string_view method, std::string_view pattern, Handler handler) {
    _router.addRoute(method, pattern, std::move(handler));
    return *this;
  }

  HttpServer& get(std::string_view pattern, Handler handler) {
    _router.get(pattern, std::move(handler));
    return *this;
  }

  HttpServer& post(std::string_view pattern, Handler handler) {
    _router.post(pattern, std::move(handler));
    return *this;
  }

  HttpServer& put(std::string_view pattern, Handler handler) {
    _router.put(pattern, std::move(handler));
    return *this;
  }

  HttpServer& del(std::string_view pattern, Handler handler) {
    _router.del(pattern, std::move(handler));
    return *this;
  }

  HttpServer& patch(std::string_view pattern, Handler handler) {
    _router.patch(pattern, std::move(handler));
    return *this;
  }

  HttpServer& head(std::string_view pattern, Handler handler) {
    _router.head(pattern, std::move(handler));
    return *this;
  }

  HttpServer& options(std::string_view pattern, Handler handler) {
    _router.options(pattern, std::move(handler));
    return *this;
  }

  HttpServer& use(Middleware middleware) {
    _router.use(std::move(middleware));
    return *this;
  }

  [[nodiscard]] RouteGroup group(std::string_view prefix) { return _router.group(prefix); }

  HttpServer& serveStatic(std::string_view prefix, const std::filesystem::path& rootDir) {
    _router.serveStatic(prefix, rootDir);
    return *this;
  }

  // Binds and listens on 'port' (0 = ephemeral). Returns the effective port.
  // Throws std::system_error on listener failure (port in use, ...),
  // std::logic_error if the server is already listening.
  uint16_t listen(uint16_t port);

  // Binds and listens on the port of the config.
  uint16_t listen() { return listen(_config.port); }

  // Runs the accept loop in the calling thread until stop() is called.
  // Returns once all in-flight connections are done, and clears the stop request on exit.
  // Throws std::logic_error if listen() was not called, std::system_error on fatal accept failure.
  void run();

  // listen(port) then run().
  void start(uint16_t port) {
    listen(port);
    run();
  }

  // Requests the accept loop to stop. In-flight connections run to completion.
  // A stop requested before run() makes the next run() return immediately.
  void stop() noexcept;

  // Effective listening port, 0 if not listening.
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(std::memory_order_acquire); }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  // Number of connections currently being served.
  [[nodiscard]] std::size_t nbInFlightConnections() const;

 private:
  void spawnConnection(BaseFd connection);

  void waitForInFlightConnections();

  HttpServerConfig _config;
  Router _router;
  // guards the listening socket descriptor against a concurrent stop()
  mutable std::mutex _listenMutex;
  Socket _listenSocket;
  std::atomic<uint16_t> _port{0};
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};

  mutable std::mutex _inFlightMutex;
  std::condition_variable _inFlightCv;
  std::size_t _nbInFlight{0};
};

}  // namespace vermouth
