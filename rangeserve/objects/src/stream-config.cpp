#include "rangeserve/stream-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "rangeserve/string-equal-ignore-case.hpp"

namespace rangeserve {

namespace {

constexpr std::string_view kPresetNames[] = {"maximum", "balanced", "conservative", "tunnel"};

}  // namespace

StreamConfig StreamConfig::FromPreset(Preset preset) {
  StreamConfig config;
  switch (preset) {
    case Preset::Maximum:
      config.withChunkSize(8 * kMiB).withSocketBufferSize(4 * kMiB);
      break;
    case Preset::Balanced:
      config.withChunkSize(4 * kMiB).withSocketBufferSize(2 * kMiB);
      break;
    case Preset::Conservative:
      config.withChunkSize(1 * kMiB).withSocketBufferSize(512 * kKiB);
      break;
    case Preset::Tunnel:
      config.withChunkSize(512 * kKiB)
          .withSocketBufferSize(1 * kMiB)
          .withMaxConcurrentStreams(3)
          .withChunkDelay(std::chrono::milliseconds{1});
      break;
    default:
      std::unreachable();
  }
  return config;
}

StreamConfig& StreamConfig::withChunkSize(std::size_t bytes) {
  chunkSize = bytes;
  return *this;
}

StreamConfig& StreamConfig::withSocketBufferSize(std::size_t bytes) {
  socketBufferSize = bytes;
  return *this;
}

StreamConfig& StreamConfig::withMaxFileSize(std::uint64_t bytes) {
  maxFileSize = bytes;
  return *this;
}

StreamConfig& StreamConfig::withRange(bool on) {
  enableRange = on;
  return *this;
}

StreamConfig& StreamConfig::withCache(bool on) {
  enableCache = on;
  return *this;
}

StreamConfig& StreamConfig::withCacheMaxAge(std::chrono::seconds maxAge) {
  cacheMaxAge = maxAge;
  return *this;
}

StreamConfig& StreamConfig::withMaxConcurrentStreams(std::uint32_t maxStreams) {
  maxConcurrentStreams = maxStreams;
  return *this;
}

StreamConfig& StreamConfig::withChunkDelay(std::chrono::milliseconds delay) {
  chunkDelay = delay;
  return *this;
}

void StreamConfig::validate() const {
  if (std::ranges::find(kAllowedChunkSizes, chunkSize) == kAllowedChunkSizes.end()) {
    throw std::invalid_argument("chunkSize must be one of 512 KiB, 1 MiB, 2 MiB, 4 MiB or 8 MiB");
  }
  if (socketBufferSize > static_cast<std::size_t>(1 << 30)) {
    throw std::invalid_argument("socketBufferSize is too large");
  }
  if (maxFileSize == 0) {
    throw std::invalid_argument("maxFileSize should be strictly positive");
  }
  if (cacheMaxAge.count() < 0) {
    throw std::invalid_argument("cacheMaxAge should be non-negative");
  }
  if (chunkDelay.count() < 0) {
    throw std::invalid_argument("chunkDelay should be non-negative");
  }
}

std::optional<StreamConfig::Preset> ParsePreset(std::string_view name) {
  for (std::size_t idx = 0; idx < std::size(kPresetNames); ++idx) {
    if (CaseInsensitiveEqual(name, kPresetNames[idx])) {
      return static_cast<StreamConfig::Preset>(idx);
    }
  }
  return std::nullopt;
}

std::string_view PresetName(StreamConfig::Preset preset) { return kPresetNames[static_cast<std::size_t>(preset)]; }

}  // namespace rangeserve
