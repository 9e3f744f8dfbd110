#pragma once

#include <chrono>

namespace rangeserve {

// Process wide SIGINT / SIGTERM handling. The handler only records the signal; running servers poll
// IsStopRequested() from their accept loop, then drain their connections for at most GetMaxDrainPeriod().
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs the handlers for SIGINT and SIGTERM.
  // maxDrainPeriod bounds how long in-flight downloads may continue after a signal (0: abort them at once).
  static void Enable(std::chrono::milliseconds maxDrainPeriod = std::chrono::seconds{5});

  // Restores the default dispositions.
  static void Disable();

  [[nodiscard]] static bool IsStopRequested() noexcept;

  // Number of the last termination signal received, 0 if none.
  [[nodiscard]] static int ReceivedSignal() noexcept;

  [[nodiscard]] static std::chrono::milliseconds GetMaxDrainPeriod() noexcept;

  // Clears the received signal, so that a process can run servers again after a signal (used by tests).
  static void ResetStopRequest() noexcept;
};

}  // namespace rangeserve
