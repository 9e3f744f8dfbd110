#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_set>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/download-service.hpp"
#include "rangeserve/file-response.hpp"
#include "rangeserve/http-request-head.hpp"
#include "rangeserve/platform.hpp"
#include "rangeserve/server-config.hpp"
#include "rangeserve/socket.hpp"

namespace rangeserve {

// Called on every accepted connection before its first read, typically to tune socket options.
// Failures should be logged, never thrown.
using ConnectionSetupHook = std::function<void(NativeHandle)>;

// Hook setting SO_SNDBUF / SO_RCVBUF to socketBufferSize (when non zero) and enabling TCP_NODELAY.
[[nodiscard]] ConnectionSetupHook MakeDefaultConnectionSetupHook(std::size_t socketBufferSize);

// Blocking HTTP/1.1 server, one thread per connection, serving downloads from a DownloadService.
//
// Usage:
//   HttpServer server(ServerConfig{}.withPort(8080), DownloadService(root, streamConfig));
//   server.run();  // returns after stop() or SIGINT / SIGTERM (when SignalHandler is enabled)
//
// The listening socket is bound at construction, so port() is known before run().
// run() must be called by at most one thread at a time. stop() may be called from any thread.
class HttpServer {
 public:
  // Throws std::invalid_argument if the config is invalid, std::system_error if the socket cannot be bound.
  // If setupHook is empty, the default hook built from the stream config socket buffer size is used.
  HttpServer(ServerConfig config, DownloadService service, ConnectionSetupHook setupHook = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  // Accept and serve connections until stop() is called or a termination signal is received.
  // Then wait for in-flight connections to finish before aborting the remaining ones. The wait is bounded by
  // ServerConfig::maxDrainPeriod after stop(), and by SignalHandler::GetMaxDrainPeriod() after a signal.
  // Returns only once all connection threads are done.
  void run();

  // Request the accept loop to stop. Returns immediately.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_release); }

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  [[nodiscard]] std::size_t nbActiveConnections() const;

  [[nodiscard]] const DownloadService& service() const noexcept { return _service; }

 private:
  [[nodiscard]] bool isStopRequested() const noexcept;

  void startConnection(BaseFd cnx);

  void handleConnection(NativeHandle fd);

  // Returns true if the connection can serve another request.
  bool sendResponse(NativeHandle fd, FileResponse& resp, http::Method method, bool keepAlive);

  void sendErrorAndClose(NativeHandle fd, http::StatusCode status);

  FileResponse dispatch(const http::RequestHead& head);

  void drain(std::chrono::milliseconds drainPeriod);

  ServerConfig _config;
  DownloadService _service;
  ConnectionSetupHook _setupHook;
  Socket _listenSocket;
  uint16_t _port{0};
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};

  mutable std::mutex _connectionsMutex;
  std::condition_variable _connectionsCv;
  std::unordered_set<NativeHandle> _connections;
};

}  // namespace rangeserve
