#include "vermouth/router.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vermouth/http-constants.hpp"
#include "vermouth/log.hpp"
#include "vermouth/middleware.hpp"
#include "vermouth/path-params.hpp"
#include "vermouth/route-pattern.hpp"
#include "vermouth/static-file-handler.hpp"

namespace vermouth {

namespace {

// Validates a group / static prefix and strips its trailing '/'. "/" becomes "".
std::string NormalizePrefix(std::string_view prefix) {
  if (prefix.empty() || prefix.front() != '/') {
    throw std::invalid_argument("Route prefix must start with '/': '" + std::string(prefix) + "'");
  }
  if (prefix.back() == '/') {
    prefix.remove_suffix(1);
  }
  return std::string(prefix);
}

std::string StaticPattern(std::string_view prefix) {
  std::string pattern = NormalizePrefix(prefix);
  pattern.append("/:");
  pattern.append(StaticFileHandler::kFilePathParam);
  pattern.push_back('*');
  return pattern;
}

}  // namespace

Router& Router::addRoute(std::string_view method, std::string_view pattern, Handler handler) {
  if (method.empty()) {
    throw std::invalid_argument("Route method cannot be empty");
  }
  if (!handler) {
    throw std::invalid_argument("Cannot register an empty handler");
  }
  // compiled outside of the lock
  Route route{std::string(method), RoutePattern(pattern), std::move(handler)};

  std::scoped_lock lock(_mutex);
  log::debug("Registering route {} {}", route.method, route.pattern.str());
  _routes.push_back(std::move(route));
  return *this;
}

Router& Router::get(std::string_view pattern, Handler handler) {
  return addRoute(http::GET, pattern, std::move(handler));
}

Router& Router::post(std::string_view pattern, Handler handler) {
  return addRoute(http::POST, pattern, std::move(handler));
}

Router& Router::put(std::string_view pattern, Handler handler) {
  return addRoute(http::PUT, pattern, std::move(handler));
}

Router& Router::del(std::string_view pattern, Handler handler) {
  return addRoute(http::DELETE, pattern, std::move(handler));
}

Router& Router::patch(std::string_view pattern, Handler handler) {
  return addRoute(http::PATCH, pattern, std::move(handler));
}

Router& Router::head(std::string_view pattern, Handler handler) {
  return addRoute(http::HEAD, pattern, std::move(handler));
}

Router& Router::options(std::string_view pattern, Handler handler) {
  return addRoute(http::OPTIONS, pattern, std::move(handler));
}

Router& Router::use(Middleware middleware) {
  if (!middleware) {
    throw std::invalid_argument("Cannot register an empty middleware");
  }
  std::scoped_lock lock(_mutex);
  _middlewares.push_back(std::move(middleware));
  return *this;
}

RouteGroup Router::group(std::string_view prefix) { return {*this, NormalizePrefix(prefix)}; }

Router& Router::serveStatic(std::string_view prefix, const std::filesystem::path& rootDir) {
  std::string pattern = StaticPattern(prefix);
  StaticFileHandler staticFileHandler(rootDir);
  log::info("Serving static files of '{}' under {}", staticFileHandler.root().string(), pattern);
  return get(pattern, std::move(staticFileHandler));
}

Handler Router::resolve(std::string_view method, std::string_view path, PathParams& pathParams) const {
  Handler handler;
  std::vector<Middleware> middlewares;
  {
    std::scoped_lock lock(_mutex);
    for (const Route& route : _routes) {
      if (route.method == method && route.pattern.match(path, pathParams)) {
        handler = route.handler;
        middlewares = _middlewares;
        break;
      }
    }
  }
  if (!handler) {
    pathParams.clear();
    return handler;
  }
  return ComposeMiddleware(middlewares, std::move(handler));
}

std::size_t Router::size() const {
  std::scoped_lock lock(_mutex);
  return _routes.size();
}

std::size_t Router::nbMiddlewares() const {
  std::scoped_lock lock(_mutex);
  return _middlewares.size();
}

RouteGroup::RouteGroup(Router& router, std::string prefix) noexcept : _router(&router), _prefix(std::move(prefix)) {}

std::string RouteGroup::fullPattern(std::string_view pattern) const {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("Route pattern must start with '/': '" + std::string(pattern) + "'");
  }
  std::string ret(_prefix);
  ret.append(pattern);
  return ret;
}

RouteGroup& RouteGroup::addRoute(std::string_view method, std::string_view pattern, Handler handler) {
  _router->addRoute(method, fullPattern(pattern), std::move(handler));
  return *this;
}

RouteGroup& RouteGroup::get(std::string_view pattern, Handler handler) {
  return addRoute(http::GET, pattern, std::move(handler));
}

RouteGroup& RouteGroup::post(std::string_view pattern, Handler handler) {
  return addRoute(http::POST, pattern, std::move(handler));
}

RouteGroup& RouteGroup::put(std::string_view pattern, Handler handler) {
  return addRoute(http::PUT, pattern, std::move(handler));
}

RouteGroup& RouteGroup::del(std::string_view pattern, Handler handler) {
  return addRoute(http::DELETE, pattern, std::move(handler));
}

RouteGroup& RouteGroup::patch(std::string_view pattern, Handler handler) {
  return addRoute(http::PATCH, pattern, std::move(handler));
}

RouteGroup& RouteGroup::head(std::string_view pattern, Handler handler) {
  return addRoute(http::HEAD, pattern, std::move(handler));
}

RouteGroup& RouteGroup::options(std::string_view pattern, Handler handler) {
  return addRoute(http::OPTIONS, pattern, std::move(handler));
}

RouteGroup& RouteGroup::serveStatic(std::string_view prefix, const std::filesystem::path& rootDir) {
  const std::string fullPrefix = _prefix + NormalizePrefix(prefix);
  _router->serveStatic(fullPrefix.empty() ? std::string_view("/") : std::string_view(fullPrefix), rootDir);
  return *this;
}

RouteGroup RouteGroup::group(std::string_view prefix) const {
  return {*_router, _prefix + NormalizePrefix(prefix)};
}

}  // namespace vermouth
