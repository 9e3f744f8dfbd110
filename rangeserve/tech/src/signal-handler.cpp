#include "rangeserve/signal-handler.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include "rangeserve/log.hpp"

namespace {

// Read from server threads and written from the signal handler: must be lock free to be async-signal-safe.
std::atomic<int> gReceivedSignal{0};
std::atomic<std::chrono::milliseconds::rep> gMaxDrainPeriodMs{5000};

static_assert(std::atomic<int>::is_always_lock_free);

}  // namespace

extern "C" void RangeserveOnTerminationSignal(int sigNum) { gReceivedSignal.store(sigNum, std::memory_order_relaxed); }

namespace rangeserve {

namespace {

void Install(int sigNum, void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: blocking calls return EINTR so that loops get a chance to look at the stop flag.
  action.sa_flags = 0;
  if (::sigaction(sigNum, &action, nullptr) != 0) {
    log::error("Unable to install handler for signal {}: {}", sigNum, std::strerror(errno));
  }
}

}  // namespace

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  gMaxDrainPeriodMs.store(maxDrainPeriod.count(), std::memory_order_relaxed);
  Install(SIGINT, ::RangeserveOnTerminationSignal);
  Install(SIGTERM, ::RangeserveOnTerminationSignal);
  log::debug("Termination signals handled, max drain period of {} ms", maxDrainPeriod.count());
}

void SignalHandler::Disable() {
  Install(SIGINT, SIG_DFL);
  Install(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() noexcept { return gReceivedSignal.load(std::memory_order_relaxed) != 0; }

int SignalHandler::ReceivedSignal() noexcept { return gReceivedSignal.load(std::memory_order_relaxed); }

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() noexcept {
  return std::chrono::milliseconds{gMaxDrainPeriodMs.load(std::memory_order_relaxed)};
}

void SignalHandler::ResetStopRequest() noexcept { gReceivedSignal.store(0, std::memory_order_relaxed); }

}  // namespace rangeserve
