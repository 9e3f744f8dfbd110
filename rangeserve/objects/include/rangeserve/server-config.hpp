#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace rangeserve {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, retrievable with HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT. Disabled by default.
  bool reusePort{false};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // Receive and send timeout applied to each accepted connection. A client idle for longer than this (between two
  // requests or in the middle of a request head) gets its connection closed, as does a client that reads nothing of
  // a response for that long. In the latter case the stream and its concurrency slot are released. Default: 120 s.
  std::chrono::milliseconds connectionTimeout{std::chrono::seconds{120}};

  // ============================
  // Request parsing limits
  // ============================
  // Maximum allowed size (in bytes) of the request head (request line + all headers + CRLFCRLF).
  // If exceeded while parsing, the server replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // ===========================================
  // Accept loop responsiveness / shutdown
  // ===========================================
  // Maximum duration the accept loop blocks before checking for stop requests.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Maximum duration run() waits for in-flight connections after HttpServer::stop(). 0 means no wait at all.
  // After a termination signal, the period given to SignalHandler::Enable applies instead.
  std::chrono::milliseconds maxDrainPeriod{std::chrono::seconds{5}};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Set explicit listening port (0 = ephemeral)
  ServerConfig& withPort(uint16_t port);

  // Enable/disable SO_REUSEPORT
  ServerConfig& withReusePort(bool on = true);

  // Adjust per-connection receive / send timeout
  ServerConfig& withConnectionTimeout(std::chrono::milliseconds timeout);

  // Adjust header size ceiling
  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  // Adjust accept loop max idle wait
  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  // Adjust graceful shutdown drain period
  ServerConfig& withMaxDrainPeriod(std::chrono::milliseconds drainPeriod);

  bool operator==(const ServerConfig&) const noexcept = default;
};

}  // namespace rangeserve
