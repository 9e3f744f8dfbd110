#pragma once

#include <cstdint>
#include <string_view>

#include "rangeserve/http-constants.hpp"

namespace rangeserve::http {

// Only GET and HEAD are served, all other methods are answered with 405.
enum class Method : std::uint8_t { GET, HEAD, OTHER };

// Method tokens are case-sensitive (RFC 9110).
constexpr Method MethodStrToEnum(std::string_view str) noexcept {
  if (str == http::GET) {
    return Method::GET;
  }
  if (str == http::HEAD) {
    return Method::HEAD;
  }
  return Method::OTHER;
}

}  // namespace rangeserve::http
