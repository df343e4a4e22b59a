#pragma once

namespace vermouth {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request graceful shutdown.
  // The handler only records the request: callers poll IsStopRequested() and stop their server.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag so that multiple tests can run in the same process.
  static void ResetStopRequest();
};

}  // namespace vermouth
