#include "vermouth/middleware.hpp"

#include <span>
#include <stdexcept>
#include <string>
#include <utility>

namespace vermouth {

Handler ComposeMiddleware(std::span<const Middleware> middlewares, Handler handler) {
  for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
    handler = (*it)(std::move(handler));
    if (!handler) {
      throw std::logic_error("Middleware #" + std::to_string(it.base() - middlewares.begin() - 1) +
                             " returned an empty handler");
    }
  }
  return handler;
}

}  // namespace vermouth
