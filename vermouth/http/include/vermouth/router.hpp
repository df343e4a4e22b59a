#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "vermouth/middleware.hpp"
#include "vermouth/path-params.hpp"
#include "vermouth/route-pattern.hpp"

namespace vermouth {

class RouteGroup;

// Ordered table of (method, pattern, handler) routes plus the global middleware chain.
// Registration may happen while requests are served: all accesses are guarded by one mutex,
// held only for the duration of the table access (never while a handler runs).
// Matching is a linear scan in registration order, first match wins. Duplicates are allowed.
class Router {
 public:
  Router() = default;

  Router(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router() = default;

  // Registers 'handler' for exact 'method' and 'pattern' (see RoutePattern for the syntax).
  // Throws std::invalid_argument for an invalid pattern, an empty method or an empty handler.
  Router& addRoute(std::string_view method, std::string_view pattern, Handler handler);

  Router& get(std::string_view pattern, Handler handler);
  Router& post(std::string_view pattern, Handler handler);
  Router& put(std::string_view pattern, Handler handler);
  Router& del(std::string_view pattern, Handler handler);
  Router& patch(std::string_view pattern, Handler handler);
  Router& head(std::string_view pattern, Handler handler);
  Router& options(std::string_view pattern, Handler handler);

  // Appends a middleware to the global chain. The first registered middleware is the outermost one.
  // Throws std::invalid_argument if 'middleware' is empty.
  Router& use(Middleware middleware);

  // Returns a registrar prepending 'prefix' to all its patterns.
  // 'prefix' must start with '/' (else std::invalid_argument); a trailing '/' is stripped.
  [[nodiscard]] RouteGroup group(std::string_view prefix);

  // Registers 'GET <prefix>/:filepath*' serving files below 'rootDir' (see StaticFileHandler).
  // Throws std::invalid_argument if 'prefix' does not start with '/' or if 'rootDir' is not an existing directory.
  Router& serveStatic(std::string_view prefix, const std::filesystem::path& rootDir);

  // Finds the first route matching 'method' and 'path'.
  // On success, returns its handler wrapped by the middleware chain and fills 'pathParams'.
  // Returns an empty Handler if no route matches.
  [[nodiscard]] Handler resolve(std::string_view method, std::string_view path, PathParams& pathParams) const;

  // Number of registered routes.
  [[nodiscard]] std::size_t size() const;

  // Number of registered middlewares.
  [[nodiscard]] std::size_t nbMiddlewares() const;

 private:
  struct Route {
    std::string method;
    RoutePattern pattern;
    Handler handler;
  };

  mutable std::mutex _mutex;
  std::vector<Route> _routes;
  std::vector<Middleware> _middlewares;
};

// Scoped registrar returned by Router::group. It does not own anything:
// the Router must outlive it. Groups nest: router.group("/api").group("/v1") registers under '/api/v1'.
class RouteGroup {
 public:
  // Registers 'handler' for '<prefix><pattern>'. 'pattern' must start with '/'.
  RouteGroup& addRoute(std::string_view method, std::string_view pattern, Handler handler);

  RouteGroup& get(std::string_view pattern, Handler handler);
  RouteGroup& post(std::string_view pattern, Handler handler);
  RouteGroup& put(std::string_view pattern, Handler handler);
  RouteGroup& del(std::string_view pattern, Handler handler);
  RouteGroup& patch(std::string_view pattern, Handler handler);
  RouteGroup& head(std::string_view pattern, Handler handler);
  RouteGroup& options(std::string_view pattern, Handler handler);

  RouteGroup& serveStatic(std::string_view prefix, const std::filesystem::path& rootDir);

  // Nested group, with the concatenation of both prefixes.
  [[nodiscard]] RouteGroup group(std::string_view prefix) const;

  [[nodiscard]] std::string_view prefix() const noexcept { return _prefix; }

 private:
  friend class Router;

  RouteGroup(Router& router, std::string prefix) noexcept;

  [[nodiscard]] std::string fullPattern(std::string_view pattern) const;

  Router* _router;
  std::string _prefix;
};

}  // namespace vermouth
