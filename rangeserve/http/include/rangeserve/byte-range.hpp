#pragma once

#include <cstdint>

namespace rangeserve {

// Inclusive byte interval [start, end] of a file. Always satisfies start <= end < file size once validated.
struct ByteRange {
  [[nodiscard]] constexpr std::uint64_t length() const noexcept { return end - start + 1; }

  bool operator==(const ByteRange&) const noexcept = default;

  std::uint64_t start{0};
  std::uint64_t end{0};
};

}  // namespace rangeserve
