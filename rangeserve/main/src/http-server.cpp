#include "rangeserve/http-server.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "rangeserve/chunked-streamer.hpp"
#include "rangeserve/http-constants.hpp"
#include "rangeserve/http-method.hpp"
#include "rangeserve/http-status-code.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/signal-handler.hpp"
#include "rangeserve/socket-ops.hpp"

namespace rangeserve {

namespace {

constexpr std::size_t kReadChunkSize = 8192;

ServerConfig Validated(ServerConfig config) {
  config.validate();
  return config;
}

// Parse a Content-Length value. Returns std::nullopt if it is not a plain decimal number.
std::optional<std::uint64_t> ParseContentLength(std::string_view value) {
  std::uint64_t length;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return length;
}

}  // namespace

ConnectionSetupHook MakeDefaultConnectionSetupHook(std::size_t socketBufferSize) {
  return [socketBufferSize](NativeHandle fd) {
    if (socketBufferSize != 0) {
      const int nbBytes = static_cast<int>(socketBufferSize);
      if (!SetSendBufferSize(fd, nbBytes)) {
        log::warn("Unable to set SO_SNDBUF to {} on fd # {}: {}", nbBytes, fd, std::strerror(errno));
      }
      if (!SetReceiveBufferSize(fd, nbBytes)) {
        log::warn("Unable to set SO_RCVBUF to {} on fd # {}: {}", nbBytes, fd, std::strerror(errno));
      }
    }
    if (!SetTcpNoDelay(fd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
    }
  };
}

HttpServer::HttpServer(ServerConfig config, DownloadService service, ConnectionSetupHook setupHook)
    : _config(Validated(std::move(config))),
      _service(std::move(service)),
      _setupHook(setupHook ? std::move(setupHook)
                           : MakeDefaultConnectionSetupHook(_service.config().socketBufferSize)),
      _listenSocket(Socket::Type::Stream),
      _port(_config.port) {
  _listenSocket.bindAndListen(_config.reusePort, _port);
  log::info("Server bound to port {}, serving '{}'", _port, _service.shareRoot().string());
}

HttpServer::~HttpServer() {
  stop();
  // run() may still be active in another thread. Wait for it rather than destroying state it uses.
  while (isRunning()) {
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
}

std::size_t HttpServer::nbActiveConnections() const {
  std::scoped_lock lock(_connectionsMutex);
  return _connections.size();
}

bool HttpServer::isStopRequested() const noexcept {
  return _stopRequested.load(std::memory_order_acquire) || SignalHandler::IsStopRequested();
}

void HttpServer::run() {
  if (_running.exchange(true, std::memory_order_acq_rel)) {
    throw std::logic_error("HttpServer::run called while already running");
  }
  log::info("Accepting connections on port {}", _port);
  const int pollTimeoutMs = static_cast<int>(_config.pollInterval.count());
  while (!isStopRequested()) {
    BaseFd cnx = _listenSocket.accept(pollTimeoutMs);
    if (cnx) {
      startConnection(std::move(cnx));
    }
  }
  auto drainPeriod = _config.maxDrainPeriod;
  if (!_stopRequested.load(std::memory_order_acquire) && SignalHandler::IsStopRequested()) {
    drainPeriod = SignalHandler::GetMaxDrainPeriod();
    log::warn("Signal {} received, server on port {} shutting down", SignalHandler::ReceivedSignal(), _port);
  }
  drain(drainPeriod);
  log::info("Server on port {} stopped", _port);
  _running.store(false, std::memory_order_release);
}

void HttpServer::startConnection(BaseFd cnx) {
  const NativeHandle fd = cnx.fd();
  {
    std::scoped_lock lock(_connectionsMutex);
    _connections.insert(fd);
  }
  try {
    std::thread([this, cnx = std::move(cnx)]() mutable {
      try {
        handleConnection(cnx.fd());
      } catch (const std::exception& ex) {
        log::error("Exception on connection fd # {}: {}", cnx.fd(), ex.what());
      }
      // Deregister before closing, so that drain() never shuts down a recycled descriptor.
      std::scoped_lock lock(_connectionsMutex);
      _connections.erase(cnx.fd());
      cnx.close();
      _connectionsCv.notify_all();
    }).detach();
  } catch (const std::system_error& ex) {
    log::error("Unable to start a thread for connection fd # {}: {}", fd, ex.what());
    std::scoped_lock lock(_connectionsMutex);
    _connections.erase(fd);
  }
}

void HttpServer::drain(std::chrono::milliseconds drainPeriod) {
  std::unique_lock lock(_connectionsMutex);
  if (_connections.empty()) {
    return;
  }
  log::info("Draining {} connection(s) for at most {} ms", _connections.size(), drainPeriod.count());
  // idle keep-alive connections see end of stream, in-flight responses can still be written
  for (NativeHandle fd : _connections) {
    if (!ShutdownRead(fd)) {
      log::debug("shutdown(SHUT_RD) failed on fd # {}: {}", fd, std::strerror(errno));
    }
  }
  if (!_connectionsCv.wait_for(lock, drainPeriod, [this] { return _connections.empty(); })) {
    log::warn("Aborting {} connection(s) still active after drain period", _connections.size());
    for (NativeHandle fd : _connections) {
      if (!ShutdownReadWrite(fd)) {
        log::debug("shutdown(SHUT_RDWR) failed on fd # {}: {}", fd, std::strerror(errno));
      }
    }
    _connectionsCv.wait(lock, [this] { return _connections.empty(); });
  }
}

void HttpServer::handleConnection(NativeHandle fd) {
  if (_setupHook) {
    _setupHook(fd);
  }
  // bounds both idle clients and clients that stop reading a response, which would otherwise hold a stream slot
  if (!SetReceiveTimeout(fd, _config.connectionTimeout)) {
    log::warn("Unable to set receive timeout on fd # {}: {}", fd, std::strerror(errno));
  }
  if (!SetSendTimeout(fd, _config.connectionTimeout)) {
    log::warn("Unable to set send timeout on fd # {}: {}", fd, std::strerror(errno));
  }

  std::string buffer;
  char readBuf[kReadChunkSize];
  while (!isStopRequested()) {
    // Read until the end of the request head
    std::size_t headEnd;
    while ((headEnd = buffer.find(http::DoubleCRLF)) == std::string::npos) {
      if (buffer.size() > _config.maxHeaderBytes) {
        sendErrorAndClose(fd, http::StatusCodeRequestHeaderFieldsTooLarge);
        return;
      }
      const auto nbRead = SafeRecv(fd, readBuf, sizeof(readBuf));
      if (nbRead <= 0) {
        // orderly close, idle timeout, or shutdown on drain
        if (!buffer.empty()) {
          log::debug("Connection fd # {} closed with a partial request head", fd);
        }
        return;
      }
      buffer.append(readBuf, static_cast<std::size_t>(nbRead));
    }
    if (headEnd + http::DoubleCRLF.size() > _config.maxHeaderBytes) {
      sendErrorAndClose(fd, http::StatusCodeRequestHeaderFieldsTooLarge);
      return;
    }

    http::RequestHead head;
    const auto parseStatus = head.parse(std::string_view(buffer).substr(0, headEnd));
    if (parseStatus != http::StatusCodeOK) {
      sendErrorAndClose(fd, parseStatus);
      return;
    }
    std::size_t consumed = headEnd + http::DoubleCRLF.size();

    // Request bodies are not used, they are read and discarded.
    if (head.headerValue(http::TransferEncoding)) {
      sendErrorAndClose(fd, http::StatusCodeBadRequest);
      return;
    }
    if (const auto contentLengthStr = head.headerValue(http::ContentLength)) {
      const auto contentLength = ParseContentLength(*contentLengthStr);
      if (!contentLength) {
        sendErrorAndClose(fd, http::StatusCodeBadRequest);
        return;
      }
      if (*contentLength > _service.config().maxFileSize) {
        sendErrorAndClose(fd, http::StatusCodePayloadTooLarge);
        return;
      }
      const auto inBuffer = std::min<std::uint64_t>(*contentLength, buffer.size() - consumed);
      consumed += static_cast<std::size_t>(inBuffer);
      for (std::uint64_t toDiscard = *contentLength - inBuffer; toDiscard != 0;) {
        const auto toRead = static_cast<std::size_t>(std::min<std::uint64_t>(sizeof(readBuf), toDiscard));
        const auto nbRead = SafeRecv(fd, readBuf, toRead);
        if (nbRead <= 0) {
          return;
        }
        toDiscard -= static_cast<std::uint64_t>(nbRead);
      }
    }

    const bool keepAlive = head.wantsKeepAlive() && !isStopRequested();
    FileResponse resp = dispatch(head);
    log::debug("{} {} -> {}", head.methodStr(), head.path(), resp.status());
    if (!sendResponse(fd, resp, head.method(), keepAlive) || !keepAlive) {
      return;
    }
    buffer.erase(0, consumed);
  }
}

FileResponse HttpServer::dispatch(const http::RequestHead& head) {
  const auto method = head.method();
  if (method != http::Method::OTHER && head.path() == "/") {
    return _service.listingResponse();
  }
  return _service.streamRequest(head.path(), head.headerValue(http::Range), method);
}

bool HttpServer::sendResponse(NativeHandle fd, FileResponse& resp, http::Method method, bool keepAlive) {
  ChunkStream* stream = resp.stream();

  resp.addHeader(http::Connection, keepAlive ? http::keepalive : http::close);
  std::string out;
  resp.appendHead(out);
  if (method != http::Method::HEAD) {
    out.append(resp.body());
  }
  if (!SendAll(fd, out)) {
    log::debug("Client on fd # {} disconnected before the response head was sent", fd);
    return false;
  }
  if (stream == nullptr) {
    return true;
  }

  for (auto chunk = stream->next(); !chunk.empty(); chunk = stream->next()) {
    if (!SendAll(fd, chunk.data(), chunk.size())) {
      const bool stalled = errno == EAGAIN || errno == EWOULDBLOCK;
      log::info("Client on fd # {} {} after {} bytes, {} bytes not sent", fd,
                stalled ? "stopped reading" : "disconnected", stream->bytesSent() - chunk.size(),
                stream->remaining() + chunk.size());
      stream->close();
      return false;
    }
  }
  if (!stream->completed()) {
    // Content-Length cannot be honored anymore, the connection must be closed
    log::error("Stream on fd # {} ended {} bytes early", fd, stream->remaining());
    return false;
  }
  return true;
}

void HttpServer::sendErrorAndClose(NativeHandle fd, http::StatusCode status) {
  log::warn("Rejecting request on fd # {} with status {}", fd, status);
  FileResponse resp(status);
  resp.body(std::string(http::ReasonPhraseFor(status)));
  resp.addHeader(http::Connection, http::close);
  std::string out;
  resp.appendHead(out);
  out.append(resp.body());
  if (!SendAll(fd, out)) {
    log::debug("Unable to send error response on fd # {}", fd);
  }
}

}  // namespace rangeserve
