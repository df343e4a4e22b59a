#pragma once

#include "vermouth/middleware.hpp"

namespace vermouth {

// Middleware logging, at info level, the method, path, status and duration of each request.
[[nodiscard]] Middleware RequestLogMiddleware();

}  // namespace vermouth
