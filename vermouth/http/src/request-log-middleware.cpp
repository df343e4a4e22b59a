#include "vermouth/request-log-middleware.hpp"

#include <chrono>
#include <utility>

#include "vermouth/http-request.hpp"
#include "vermouth/log.hpp"
#include "vermouth/middleware.hpp"
#include "vermouth/response-context.hpp"

namespace vermouth {

Middleware RequestLogMiddleware() {
  return [](Handler next) -> Handler {
    return [next = std::move(next)](HttpRequest& request, ResponseContext& response) {
      const auto start = std::chrono::steady_clock::now();
      next(request, response);
      const auto elapsed =
          std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
      log::info("{} {} {} {} us", request.method(), request.path(), response.status(), elapsed.count());
    };
  };
}

}  // namespace vermouth
