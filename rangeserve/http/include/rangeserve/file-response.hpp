#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "rangeserve/chunked-streamer.hpp"
#include "rangeserve/http-constants.hpp"
#include "rangeserve/http-status-code.hpp"

namespace rangeserve {

namespace http {

struct Header {
  bool operator==(const Header&) const noexcept = default;

  std::string name;
  std::string value;
};

}  // namespace http

// Response to a download request: status, headers, and either a small in-memory body or a chunk stream.
// Header names are compared case-insensitively on lookup, and emitted in insertion order.
class FileResponse {
 public:
  explicit FileResponse(http::StatusCode status = http::StatusCodeOK)
      : FileResponse(status, http::ReasonPhraseFor(status)) {}

  // reason must point to static storage.
  FileResponse(http::StatusCode status, std::string_view reason) : _reason(reason), _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  FileResponse& addHeader(std::string_view key, std::string_view value);

  FileResponse& addHeader(std::string_view key, std::uint64_t value);

  // Returns the value of the first header with given name (case insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Set an in-memory body, along with its Content-Type and Content-Length headers.
  FileResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Attach the stream producing the body. Content-Length must have been set by the caller.
  FileResponse& stream(ChunkStream stream);

  // Returns the attached stream, or nullptr.
  [[nodiscard]] ChunkStream* stream() noexcept { return _stream ? &*_stream : nullptr; }

  [[nodiscard]] bool hasStream() const noexcept { return _stream.has_value(); }

  // Serialize the status line and the headers, including the empty line terminating the head.
  void appendHead(std::string& out, std::string_view version = http::HTTP11Sv) const;

 private:
  std::vector<http::Header> _headers;
  std::string _body;
  std::optional<ChunkStream> _stream;
  std::string_view _reason;
  http::StatusCode _status;
};

}  // namespace rangeserve
