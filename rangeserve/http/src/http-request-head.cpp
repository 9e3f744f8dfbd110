#include "rangeserve/http-request-head.hpp"

#include <optional>
#include <string_view>

#include "rangeserve/http-constants.hpp"
#include "rangeserve/http-status-code.hpp"
#include "rangeserve/string-equal-ignore-case.hpp"
#include "rangeserve/string-trim.hpp"

namespace rangeserve::http {

namespace {

// RFC 9110 tchar
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

constexpr bool IsToken(std::string_view str) noexcept {
  if (str.empty()) {
    return false;
  }
  for (char ch : str) {
    if (!IsTokenChar(ch)) {
      return false;
    }
  }
  return true;
}

}  // namespace

StatusCode RequestHead::parse(std::string_view head) {
  _headers.clear();

  const auto lineEnd = head.find(CRLF);
  std::string_view requestLine = head.substr(0, lineEnd);
  head = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + CRLF.size());

  // request-line = method SP request-target SP HTTP-version
  const auto firstSpace = requestLine.find(' ');
  if (firstSpace == std::string_view::npos) {
    return StatusCodeBadRequest;
  }
  const auto secondSpace = requestLine.find(' ', firstSpace + 1);
  if (secondSpace == std::string_view::npos || requestLine.find(' ', secondSpace + 1) != std::string_view::npos) {
    return StatusCodeBadRequest;
  }
  _method = requestLine.substr(0, firstSpace);
  std::string_view target = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
  _version = requestLine.substr(secondSpace + 1);
  if (!IsToken(_method) || target.empty() || target.front() != '/') {
    return StatusCodeBadRequest;
  }
  if (!_version.starts_with("HTTP/")) {
    return StatusCodeBadRequest;
  }
  if (_version != HTTP10Sv && _version != HTTP11Sv) {
    return StatusCodeHTTPVersionNotSupported;
  }
  _path = target.substr(0, target.find_first_of("?#"));

  while (!head.empty()) {
    const auto end = head.find(CRLF);
    const std::string_view line = head.substr(0, end);
    head = end == std::string_view::npos ? std::string_view{} : head.substr(end + CRLF.size());

    const auto colon = line.find(':');
    if (colon == std::string_view::npos || !IsToken(line.substr(0, colon))) {
      return StatusCodeBadRequest;
    }
    _headers.emplace_back(line.substr(0, colon), TrimOws(line.substr(colon + 1)));
  }
  return StatusCodeOK;
}

std::optional<std::string_view> RequestHead::headerValue(std::string_view name) const noexcept {
  for (const auto& [key, value] : _headers) {
    if (CaseInsensitiveEqual(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

bool RequestHead::wantsKeepAlive() const noexcept {
  const auto connection = headerValue(Connection);
  if (_version == HTTP10Sv) {
    return connection && CaseInsensitiveEqual(*connection, keepalive);
  }
  return !connection || !CaseInsensitiveEqual(*connection, close);
}

}  // namespace rangeserve::http
