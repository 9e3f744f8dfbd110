#include "rangeserve/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace rangeserve {

namespace {

bool SetIntOption(NativeHandle fd, int level, int option, int value) noexcept {
  return ::setsockopt(fd, level, option, &value, sizeof(value)) == 0;
}

int GetIntOption(NativeHandle fd, int level, int option) noexcept {
  int value = 0;
  socklen_t len = sizeof(value);
  if (::getsockopt(fd, level, option, &value, &len) == -1) {
    return -1;
  }
  return value;
}

bool SetTimeoutOption(NativeHandle fd, int optname, std::chrono::milliseconds timeout) noexcept {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(secs.count());
  tv.tv_usec = static_cast<suseconds_t>(std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs).count());
  return ::setsockopt(fd, SOL_SOCKET, optname, &tv, sizeof(tv)) == 0;
}

}  // namespace

bool SetTcpNoDelay(NativeHandle fd) noexcept { return SetIntOption(fd, IPPROTO_TCP, TCP_NODELAY, 1); }

bool SetSendBufferSize(NativeHandle fd, int nbBytes) noexcept {
  return SetIntOption(fd, SOL_SOCKET, SO_SNDBUF, nbBytes);
}

bool SetReceiveBufferSize(NativeHandle fd, int nbBytes) noexcept {
  return SetIntOption(fd, SOL_SOCKET, SO_RCVBUF, nbBytes);
}

int GetSendBufferSize(NativeHandle fd) noexcept { return GetIntOption(fd, SOL_SOCKET, SO_SNDBUF); }

int GetReceiveBufferSize(NativeHandle fd) noexcept { return GetIntOption(fd, SOL_SOCKET, SO_RCVBUF); }

bool SetReceiveTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  return SetTimeoutOption(fd, SO_RCVTIMEO, timeout);
}

bool SetSendTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  return SetTimeoutOption(fd, SO_SNDTIMEO, timeout);
}

bool SendAll(NativeHandle fd, const void* data, std::size_t len) noexcept {
  const auto* ptr = static_cast<const char*>(data);
  while (len != 0) {
    const ssize_t nbSent = ::send(fd, ptr, len, MSG_NOSIGNAL);
    if (nbSent == -1) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    ptr += nbSent;
    len -= static_cast<std::size_t>(nbSent);
  }
  return true;
}

bool ShutdownRead(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_RD) == 0; }

bool ShutdownReadWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

int64_t SafeRecv(NativeHandle fd, void* data, std::size_t len) noexcept {
  while (true) {
    const ssize_t nbRead = ::recv(fd, data, len, 0);
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(nbRead);
  }
}

}  // namespace rangeserve
