#include "rangeserve/socket.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/errno-throw.hpp"
#include "rangeserve/log.hpp"

namespace rangeserve {

namespace {

int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    default:
      std::unreachable();
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSocketType(type), 0)) {
  if (_baseFd.fd() == -1) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, uint16_t& port) {
  static constexpr int kEnable = 1;
  const int fd = _baseFd.fd();
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("bind failed for port {}", port);
  }
  if (::listen(fd, SOMAXCONN) == -1) {
    throw_errno("listen failed for port {}", port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
}

BaseFd Socket::accept(int timeoutMs) const {
  pollfd pfd{_baseFd.fd(), POLLIN, 0};
  const int nbReady = ::poll(&pfd, 1, timeoutMs);
  if (nbReady <= 0) {
    if (nbReady == -1 && errno != EINTR) {
      log::error("poll on listening socket fd # {} failed: {}", _baseFd.fd(), std::strerror(errno));
    }
    return BaseFd{};
  }
  BaseFd cnx(::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_CLOEXEC));
  if (!cnx) {
    // ECONNABORTED, EMFILE... are not fatal for the listening socket.
    log::warn("accept on fd # {} failed: {}", _baseFd.fd(), std::strerror(errno));
  }
  return cnx;
}

}  // namespace rangeserve
