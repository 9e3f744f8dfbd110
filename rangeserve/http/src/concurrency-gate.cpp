#include "rangeserve/concurrency-gate.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>

#include "rangeserve/log.hpp"

namespace rangeserve {

ConcurrencyToken& ConcurrencyToken::operator=(ConcurrencyToken&& other) noexcept {
  if (this != &other) {
    release();
    _gate = std::exchange(other._gate, nullptr);
  }
  return *this;
}

void ConcurrencyToken::release() noexcept {
  if (_gate != nullptr) {
    std::exchange(_gate, nullptr)->releaseSlot();
  }
}

ConcurrencyGate::ConcurrencyGate(std::uint32_t capacity) : _capacity(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("ConcurrencyGate capacity should be strictly positive");
  }
}

std::optional<ConcurrencyToken> ConcurrencyGate::tryAcquire() noexcept {
  std::uint32_t current = _active.load(std::memory_order_relaxed);
  do {
    if (current >= _capacity) {
      log::debug("Concurrency gate saturated ({}/{})", current, _capacity);
      return std::nullopt;
    }
  } while (!_active.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel, std::memory_order_relaxed));
  return ConcurrencyToken(this);
}

void ConcurrencyGate::releaseSlot() noexcept { _active.fetch_sub(1, std::memory_order_acq_rel); }

}  // namespace rangeserve
