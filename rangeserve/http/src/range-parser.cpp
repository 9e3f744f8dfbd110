#include "rangeserve/range-parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

#include "rangeserve/string-equal-ignore-case.hpp"
#include "rangeserve/string-trim.hpp"

namespace rangeserve {

namespace {

// Parse a range bound made of decimal digits only. Leading '+' or '-' signs are rejected.
// Values that do not fit on 64 bits saturate: they lie beyond any file end.
[[nodiscard]] std::optional<std::uint64_t> ParseUint(std::string_view token) {
  std::uint64_t value;
  const auto first = token.data();
  const auto last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ptr != last) {
    return std::nullopt;
  }
  if (ec == std::errc::result_out_of_range) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] RangeSelection Make(RangeSelection::State state, std::uint64_t start = 0, std::uint64_t end = 0) {
  return RangeSelection{state, ByteRange{start, end}};
}

}  // namespace

RangeSelection ParseRange(std::optional<std::string_view> rangeHeader, std::uint64_t fileSize, bool rangeEnabled) {
  if (!rangeHeader || !rangeEnabled) {
    return {};
  }
  std::string_view raw = TrimOws(*rangeHeader);
  static constexpr std::string_view kBytesEqual = "bytes=";
  if (!StartsWithCaseInsensitive(raw, kBytesEqual)) {
    return Make(RangeSelection::State::Invalid);
  }
  raw.remove_prefix(kBytesEqual.size());

  // only the first specifier counts
  raw = TrimOws(raw.substr(0, raw.find(',')));

  const auto dashPos = raw.find('-');
  if (dashPos == std::string_view::npos) {
    return Make(RangeSelection::State::Invalid);
  }
  const auto firstPart = TrimOws(raw.substr(0, dashPos));
  const auto secondPart = TrimOws(raw.substr(dashPos + 1));

  std::uint64_t start = 0;
  if (!firstPart.empty()) {
    const auto startValue = ParseUint(firstPart);
    if (!startValue) {
      return Make(RangeSelection::State::Invalid);
    }
    start = *startValue;
  }

  std::uint64_t end = fileSize == 0 ? 0 : fileSize - 1;
  if (!secondPart.empty()) {
    const auto endValue = ParseUint(secondPart);
    if (!endValue) {
      return Make(RangeSelection::State::Invalid);
    }
    end = std::min(end, *endValue);
  }

  if (start >= fileSize || end < start) {
    return Make(RangeSelection::State::Unsatisfiable);
  }
  return Make(RangeSelection::State::Valid, start, end);
}

}  // namespace rangeserve
