#pragma once

#include <concepts>

namespace rangeserve {

constexpr auto write2(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto write4(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 1000));
  *++buf = static_cast<char>('0' + ((value / 100) % 10));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

// Copy exactly 3 chars from a string known to have size >= 3.
constexpr auto copy3(auto des, auto src) {
  *des = src[0];
  *++des = src[1];
  *++des = src[2];
  return ++des;
}

}  // namespace rangeserve
