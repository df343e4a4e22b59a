#include <vermouth/vermouth.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

using namespace vermouth;

int main(int argc, char **argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    HttpServer server(HttpServerConfig{}.withPort(port));

    server.use(RequestLogMiddleware());

    server.get("/", [](HttpRequest &req, ResponseContext &resp) {
      std::string body("Hello from vermouth minimal server! You requested ");
      body.append(req.path());
      body.append("\nMethod: ").append(req.method());
      body.append("\nVersion: ").append(req.version());
      body.append("\nHeaders:\n");
      for (const auto &[headerKey, headerValue] : req.headers()) {
        body.append(headerKey).append(": ").append(headerValue).append("\n");
      }
      resp.text(http::StatusCodeOK, body);
    });

    server.get("/hello/:name", [](HttpRequest &req, ResponseContext &resp) {
      resp.text(http::StatusCodeOK, "Hello " + std::string(req.pathParam("name")) + "\n");
    });

    auto api = server.group("/api");
    api.post("/echo", [](HttpRequest &req, ResponseContext &resp) {
      std::string body;
      if (req.readBody(body) != BodyDecodeStatus::Ok) {
        resp.text(http::StatusCodeBadRequest, "Expected a request body\n");
        return;
      }
      resp.setHeader("X-Echo-Length", std::to_string(body.size()));
      resp.write(body);
    });
    api.get("/old", [](HttpRequest &, ResponseContext &resp) { resp.redirect("/"); });

    const uint16_t effectivePort = server.listen();
    std::cout << "vermouth minimal server listening on port " << effectivePort << '\n';

    std::jthread loop([&server] {
      try {
        server.run();
      } catch (const std::exception &ex) {
        log::error("Server loop failed: {}", ex.what());
      }
    });
    while (!SignalHandler::IsStopRequested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    server.stop();
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
