#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>

#include "rangeserve/base-fd.hpp"

namespace rangeserve {

// Read-only file handle.
// Reads are positioned (pread), so several File objects opened on the same path never interfere.
class File {
 public:
  enum class OpenMode : uint8_t { ReadOnly };

  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path.
  // On success, the File owns the underlying descriptor and will close it on destruction.
  // On failure, the error is logged and operator bool() returns false.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  // Open a file by path (must be null-terminated). Same semantics as above.
  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Current file size in bytes. Throws std::system_error if the file is closed or fstat fails.
  [[nodiscard]] std::uint64_t size() const;

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Does not modify the file's current offset, and retries on EINTR.
  // Returns the number of bytes read (0 on EOF). Returns kError on error, with errno set.
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::uint64_t offset) const;

  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
};

}  // namespace rangeserve
