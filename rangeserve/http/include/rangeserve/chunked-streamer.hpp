#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include "rangeserve/byte-range.hpp"
#include "rangeserve/concurrency-gate.hpp"
#include "rangeserve/file.hpp"
#include "rangeserve/path-resolver.hpp"
#include "rangeserve/stream-config.hpp"

namespace rangeserve {

// Pull-based, finite, non restartable sequence of chunks covering a byte interval of an opened file.
// Owns the file descriptor, a single chunk buffer and optionally a concurrency token,
// all released exactly once when the stream ends (completion, read error, or explicit close()).
class ChunkStream {
 public:
  // Stream length bytes of file starting at offset.
  ChunkStream(File file, std::uint64_t offset, std::uint64_t length, std::size_t chunkSize,
              std::chrono::milliseconds chunkDelay = {}, ConcurrencyToken token = {});

  ChunkStream(const ChunkStream&) = delete;
  ChunkStream(ChunkStream&&) noexcept = default;
  ChunkStream& operator=(const ChunkStream&) = delete;
  ChunkStream& operator=(ChunkStream&&) noexcept = default;

  ~ChunkStream() { close(); }

  // Read the next chunk, of at most chunkSize bytes, in strictly increasing offset order.
  // Returns an empty span when the stream is over. The returned data is valid until the next call.
  // Never throws on read errors: they end the stream, are logged, and failed() becomes true.
  [[nodiscard]] std::span<const std::byte> next();

  // Release the file and the token. Idempotent.
  void close() noexcept;

  [[nodiscard]] bool isOpen() const noexcept { return static_cast<bool>(_file); }

  [[nodiscard]] bool failed() const noexcept { return _failed; }

  // True when all the bytes of the interval were produced.
  [[nodiscard]] bool completed() const noexcept { return _remaining == 0 && !_failed; }

  [[nodiscard]] std::uint64_t bytesSent() const noexcept { return _bytesSent; }

  [[nodiscard]] std::uint64_t remaining() const noexcept { return _remaining; }

 private:
  File _file;
  std::unique_ptr<std::byte[]> _buffer;
  std::uint64_t _offset;
  std::uint64_t _remaining;
  std::uint64_t _bytesSent{0};
  std::size_t _chunkSize;
  std::chrono::milliseconds _chunkDelay;
  ConcurrencyToken _token;
  bool _started{false};
  bool _failed{false};
};

// Open a stream over the given range of the entry (the whole file if no range).
// Returns std::nullopt if the file cannot be opened anymore, in which case the token is released.
[[nodiscard]] std::optional<ChunkStream> OpenChunkStream(const FileEntry& entry, const std::optional<ByteRange>& range,
                                                         const StreamConfig& config, ConcurrencyToken token = {});

}  // namespace rangeserve
