#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "rangeserve/byte-range.hpp"

namespace rangeserve {

struct RangeSelection {
  enum class State : std::uint8_t { None, Valid, Invalid, Unsatisfiable };

  State state{State::None};
  ByteRange range;
};

// Parse the value of a Range request header for a file of given size.
// Only the first specifier of a 'bytes=' set is honored, the others are ignored.
// An empty start means 0 and an empty end means the last byte. The end is clamped to the last byte before validation.
//  - None          : header absent, or ranges disabled
//  - Invalid       : unknown unit, missing '-', non numeric bounds
//  - Unsatisfiable : start beyond the file, or end before start (any range on an empty file)
[[nodiscard]] RangeSelection ParseRange(std::optional<std::string_view> rangeHeader, std::uint64_t fileSize,
                                        bool rangeEnabled = true);

}  // namespace rangeserve
