#pragma once

#include <functional>
#include <span>

namespace vermouth {

class HttpRequest;
class ResponseContext;

// Request handler. It answers through the ResponseContext, exactly once.
// Failures are reported by throwing: the connection dispatcher turns them into a 500 when possible.
using Handler = std::function<void(HttpRequest&, ResponseContext&)>;

// Handler transformer used to implement cross-cutting behavior around route handlers.
// The returned handler typically runs some code, calls 'next', then runs some more code.
// Example:
//   router.use([](Handler next) {
//     return [next = std::move(next)](HttpRequest& req, ResponseContext& resp) {
//       log::info("before {}", req.path());
//       next(req, resp);
//     };
//   });
using Middleware = std::function<Handler(Handler next)>;

// Wraps 'handler' with 'middlewares' in reverse order, so that middlewares[0] ends up outermost:
//   middlewares[0](middlewares[1](...middlewares[n-1](handler)))
// Throws std::logic_error if a middleware returns an empty handler.
[[nodiscard]] Handler ComposeMiddleware(std::span<const Middleware> middlewares, Handler handler);

}  // namespace vermouth
