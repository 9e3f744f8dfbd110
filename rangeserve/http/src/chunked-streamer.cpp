#include "rangeserve/chunked-streamer.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <thread>
#include <utility>

#include "rangeserve/log.hpp"

namespace rangeserve {

ChunkStream::ChunkStream(File file, std::uint64_t offset, std::uint64_t length, std::size_t chunkSize,
                         std::chrono::milliseconds chunkDelay, ConcurrencyToken token)
    : _file(std::move(file)),
      _offset(offset),
      _remaining(length),
      _chunkSize(chunkSize),
      _chunkDelay(chunkDelay),
      _token(std::move(token)) {
  const auto bufferSize = static_cast<std::size_t>(std::min<std::uint64_t>(_chunkSize, _remaining));
  if (bufferSize != 0) {
    _buffer = std::make_unique_for_overwrite<std::byte[]>(bufferSize);
  }
}

std::span<const std::byte> ChunkStream::next() {
  if (!_file) {
    return {};
  }
  if (_remaining == 0) {
    close();
    return {};
  }
  if (_started && _chunkDelay.count() > 0) {
    std::this_thread::sleep_for(_chunkDelay);
  }
  _started = true;

  const auto toRead = static_cast<std::size_t>(std::min<std::uint64_t>(_chunkSize, _remaining));
  const auto nbRead = _file.readAt(std::span<std::byte>(_buffer.get(), toRead), _offset);
  if (nbRead == File::kError) {
    log::error("Read error at offset {} ({} bytes remaining): {}", _offset, _remaining, std::strerror(errno));
    _failed = true;
    close();
    return {};
  }
  if (nbRead == 0) {
    // the file shrank since its size was read
    log::debug("Unexpected end of file at offset {}, {} bytes short", _offset, _remaining);
    close();
    return {};
  }

  _offset += nbRead;
  _remaining -= nbRead;
  _bytesSent += nbRead;
  return {_buffer.get(), nbRead};
}

void ChunkStream::close() noexcept {
  _file.close();
  _token.release();
  _buffer.reset();
}

std::optional<ChunkStream> OpenChunkStream(const FileEntry& entry, const std::optional<ByteRange>& range,
                                           const StreamConfig& config, ConcurrencyToken token) {
  File file(entry.path.string());
  if (!file) {
    return std::nullopt;
  }
  const std::uint64_t offset = range ? range->start : 0;
  const std::uint64_t length = range ? range->length() : entry.size;
  return ChunkStream(std::move(file), offset, length, config.chunkSize, config.chunkDelay, std::move(token));
}

}  // namespace rangeserve
