#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <utility>

namespace rangeserve {

class ConcurrencyGate;

// Admission slot taken from a ConcurrencyGate. Move-only, the slot is given back exactly once,
// either explicitly with release() or at destruction.
// The gate must outlive all its tokens.
class ConcurrencyToken {
 public:
  ConcurrencyToken() noexcept = default;

  ConcurrencyToken(const ConcurrencyToken&) = delete;
  ConcurrencyToken(ConcurrencyToken&& other) noexcept : _gate(std::exchange(other._gate, nullptr)) {}
  ConcurrencyToken& operator=(const ConcurrencyToken&) = delete;
  ConcurrencyToken& operator=(ConcurrencyToken&& other) noexcept;

  ~ConcurrencyToken() { release(); }

  // Returns true if this token currently holds a slot.
  explicit operator bool() const noexcept { return _gate != nullptr; }

  // Give back the slot. No-op if already released (or default constructed).
  void release() noexcept;

 private:
  friend class ConcurrencyGate;

  explicit ConcurrencyToken(ConcurrencyGate* gate) noexcept : _gate(gate) {}

  ConcurrencyGate* _gate{nullptr};
};

// Non-blocking bounded admission control over simultaneously active streams.
class ConcurrencyGate {
 public:
  // capacity must be strictly positive (a zero capacity means no gate at all, callers should not create one).
  explicit ConcurrencyGate(std::uint32_t capacity);

  ConcurrencyGate(const ConcurrencyGate&) = delete;
  ConcurrencyGate(ConcurrencyGate&&) = delete;
  ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;
  ConcurrencyGate& operator=(ConcurrencyGate&&) = delete;

  ~ConcurrencyGate() = default;

  // Take a slot if one is available, never blocks.
  [[nodiscard]] std::optional<ConcurrencyToken> tryAcquire() noexcept;

  [[nodiscard]] std::uint32_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] std::uint32_t active() const noexcept { return _active.load(std::memory_order_acquire); }

 private:
  friend class ConcurrencyToken;

  void releaseSlot() noexcept;

  std::uint32_t _capacity;
  std::atomic<std::uint32_t> _active{0};
};

}  // namespace rangeserve
