#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "rangeserve/http-method.hpp"
#include "rangeserve/http-status-code.hpp"

namespace rangeserve::http {

// Parsed view over a request head (request line and header fields). Views point into the parsed buffer.
class RequestHead {
 public:
  // Parse a request head, the terminating empty line excluded.
  // Returns StatusCodeOK on success, otherwise the status code of the error response to send:
  //  - StatusCodeBadRequest for a malformed request line or header field
  //  - StatusCodeHTTPVersionNotSupported for a version other than HTTP/1.0 or HTTP/1.1
  [[nodiscard]] StatusCode parse(std::string_view head);

  [[nodiscard]] Method method() const noexcept { return MethodStrToEnum(_method); }

  [[nodiscard]] std::string_view methodStr() const noexcept { return _method; }

  // Request target without query string and fragment, still percent-encoded.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Value of the first header with given name (case insensitive), trimmed of optional whitespace.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Whether the connection should stay open after the response, according to the version and Connection header.
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

 private:
  std::vector<std::pair<std::string_view, std::string_view>> _headers;
  std::string_view _method;
  std::string_view _path;
  std::string_view _version;
};

}  // namespace rangeserve::http
