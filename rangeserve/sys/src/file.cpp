#include "rangeserve/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "rangeserve/errno-throw.hpp"
#include "rangeserve/log.hpp"

namespace rangeserve {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

int CreateFileBaseFd(const char* path, File::OpenMode mode) {
  int fd;
  do {
    fd = ::open(path, Flags(mode));
  } while (fd == -1 && errno == EINTR);
  if (fd < 0) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    fd = -1;
  }
  return fd;
}

}  // namespace

File::File(const char* path, OpenMode mode) : _fd(CreateFileBaseFd(path, mode)) {}

std::uint64_t File::size() const {
  struct stat st{};
  if (!_fd) {
    errno = EBADF;
  }
  if (!_fd || ::fstat(_fd.fd(), &st) != 0) {
    throw_errno("File::size failed for fd # {}", _fd.fd());
  }
  return static_cast<std::uint64_t>(st.st_size);
}

std::size_t File::readAt(std::span<std::byte> dst, std::uint64_t offset) const {
  while (true) {
    const ssize_t nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      return kError;
    }
  }
}

}  // namespace rangeserve
