#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace rangeserve {

// Tuning knobs of the download engine. Built once at startup, validated, then only passed around by const reference.
struct StreamConfig {
  enum class Preset : std::uint8_t { Maximum, Balanced, Conservative, Tunnel };

  static constexpr std::size_t kKiB = 1024;
  static constexpr std::size_t kMiB = 1024 * kKiB;

  // Chunk sizes accepted by validate().
  static constexpr std::array<std::size_t, 5> kAllowedChunkSizes{512 * kKiB, 1 * kMiB, 2 * kMiB, 4 * kMiB, 8 * kMiB};

  // Number of bytes read from the file and handed to the transport per chunk.
  // This is also the size of the single buffer allocated per stream.
  std::size_t chunkSize{4 * kMiB};

  // SO_SNDBUF / SO_RCVBUF applied by the default connection setup hook. 0 leaves the OS default.
  std::size_t socketBufferSize{2 * kMiB};

  // Largest request body accepted by the transport (413 above). Downloads themselves are not limited by it.
  std::uint64_t maxFileSize{std::uint64_t{16} * 1024 * kMiB};

  // Whether Range headers are honored. When disabled, Range is ignored and the full file is sent.
  bool enableRange{true};

  // Whether Cache-Control and Last-Modified are emitted.
  bool enableCache{true};

  // Value of max-age in Cache-Control.
  std::chrono::seconds cacheMaxAge{3600};

  // Maximum number of simultaneously active streams. 0 disables admission control.
  std::uint32_t maxConcurrentStreams{0};

  // Delay applied before each chunk except the first one, to smooth out bursts on constrained uplinks.
  std::chrono::milliseconds chunkDelay{0};

  // Build a configuration from a named preset (other fields keep their defaults).
  [[nodiscard]] static StreamConfig FromPreset(Preset preset);

  StreamConfig& withChunkSize(std::size_t bytes);

  StreamConfig& withSocketBufferSize(std::size_t bytes);

  StreamConfig& withMaxFileSize(std::uint64_t bytes);

  StreamConfig& withRange(bool on = true);

  StreamConfig& withCache(bool on = true);

  StreamConfig& withCacheMaxAge(std::chrono::seconds maxAge);

  StreamConfig& withMaxConcurrentStreams(std::uint32_t maxStreams);

  StreamConfig& withChunkDelay(std::chrono::milliseconds delay);

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  bool operator==(const StreamConfig&) const noexcept = default;
};

// Parse a preset name (case insensitive): maximum, balanced, conservative, tunnel.
[[nodiscard]] std::optional<StreamConfig::Preset> ParsePreset(std::string_view name);

[[nodiscard]] std::string_view PresetName(StreamConfig::Preset preset);

}  // namespace rangeserve
