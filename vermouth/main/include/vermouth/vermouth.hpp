// vermouth Umbrella Header
//
// Include this single header to pull in the public HTTP server API:
//   - HttpServer and its configuration (HttpServerConfig)
//   - Routing (Router, RouteGroup, Middleware, StaticFileHandler, RequestLogMiddleware)
//   - Request / Response primitives (HttpRequest, FormValues, ResponseContext)
//   - HTTP constants and status codes
//
// Each re-exported header line is annotated with 'IWYU pragma: export' so that users including only
// <vermouth/vermouth.hpp> have their symbols considered as satisfied.
//
// Usage Example:
//    #include <vermouth/vermouth.hpp>
//    using namespace vermouth;
//    int main() {
//      HttpServer server;
//      server.get("/", [](HttpRequest&, ResponseContext& resp) { resp.text(http::StatusCodeOK, "hi\n"); });
//      server.start(8080);
//    }
#pragma once

// IWYU pragma: begin_exports
#include "vermouth/form-values.hpp"
#include "vermouth/http-constants.hpp"
#include "vermouth/http-request.hpp"
#include "vermouth/http-server-config.hpp"
#include "vermouth/http-server.hpp"
#include "vermouth/http-status-code.hpp"
#include "vermouth/log.hpp"
#include "vermouth/middleware.hpp"
#include "vermouth/path-params.hpp"
#include "vermouth/request-log-middleware.hpp"
#include "vermouth/response-context.hpp"
#include "vermouth/router.hpp"
#include "vermouth/signal-handler.hpp"
#include "vermouth/static-file-handler.hpp"
// IWYU pragma: end_exports
