#include "vermouth/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe operations here: logging happens when the flag is polled.
extern "C" void VermouthSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace vermouth {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::VermouthSignalHandler);
  std::signal(SIGTERM, ::VermouthSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace vermouth
