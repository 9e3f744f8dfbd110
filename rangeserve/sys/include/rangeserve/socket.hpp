#pragma once

#include <cstdint>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/platform.hpp"

namespace rangeserve {

// Simple RAII class wrapping a blocking IPv4 TCP socket.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream };

  Socket() noexcept = default;

  // Construct a socket of the given type.
  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind on all interfaces and start listening. If port is 0, an ephemeral port is chosen and written back.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port);

  // Wait up to timeoutMs for an incoming connection.
  // Returns a closed BaseFd on timeout or on a transient accept failure (logged).
  [[nodiscard]] BaseFd accept(int timeoutMs) const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace rangeserve
