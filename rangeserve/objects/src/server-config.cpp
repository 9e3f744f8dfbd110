#include "rangeserve/server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace rangeserve {

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

ServerConfig& ServerConfig::withConnectionTimeout(std::chrono::milliseconds timeout) {
  this->connectionTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withMaxDrainPeriod(std::chrono::milliseconds drainPeriod) {
  this->maxDrainPeriod = drainPeriod;
  return *this;
}

void ServerConfig::validate() const {
  // Request line "GET / HTTP/1.1\r\n\r\n" needs at least this much.
  static constexpr std::size_t kMinHeaderBytes = 128;
  if (maxHeaderBytes < kMinHeaderBytes) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (connectionTimeout.count() <= 0) {
    throw std::invalid_argument("connectionTimeout should be strictly positive");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval should be strictly positive");
  }
  if (maxDrainPeriod.count() < 0) {
    throw std::invalid_argument("maxDrainPeriod should be non-negative");
  }
}

}  // namespace rangeserve
