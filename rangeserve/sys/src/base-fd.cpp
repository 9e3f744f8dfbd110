#include "rangeserve/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "rangeserve/log.hpp"

namespace rangeserve {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    while (true) {
      if (::close(_fd) == 0) {
        break;
      }
      if (errno == EINTR) {
        continue;
      }
      // EBADF is benign if the descriptor was closed elsewhere.
      log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
      break;
    }
    log::trace("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace rangeserve
