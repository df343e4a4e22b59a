#include <vermouth/vermouth.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char** argv) {
  uint16_t port = 0;
  std::filesystem::path root = ".";
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    root = argv[2];
  }

  vermouth::SignalHandler::Enable();

  try {
    vermouth::HttpServer server(vermouth::HttpServerConfig{}.withPort(port).withTcpNoDelay());

    // Files below `root` are served under /static, '/' redirects to the index
    server.serveStatic("/static", root);
    server.get("/", [](vermouth::HttpRequest&, vermouth::ResponseContext& resp) { resp.redirect("/static/"); });

    const uint16_t effectivePort = server.listen();
    std::cout << "Starting static file example on port: " << effectivePort << " serving root: " << root << '\n';

    std::jthread loop([&server] {
      try {
        server.run();
      } catch (const std::exception& ex) {
        vermouth::log::error("Server loop failed: {}", ex.what());
      }
    });
    while (!vermouth::SignalHandler::IsStopRequested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    server.stop();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
