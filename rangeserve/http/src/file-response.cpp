#include "rangeserve/file-response.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rangeserve/http-constants.hpp"
#include "rangeserve/string-equal-ignore-case.hpp"

namespace rangeserve {

FileResponse& FileResponse::addHeader(std::string_view key, std::string_view value) {
  _headers.emplace_back(std::string(key), std::string(value));
  return *this;
}

FileResponse& FileResponse::addHeader(std::string_view key, std::uint64_t value) {
  char buf[20];
  const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  return addHeader(key, std::string_view(buf, ptr));
}

std::optional<std::string_view> FileResponse::headerValue(std::string_view key) const noexcept {
  for (const auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, key)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

FileResponse& FileResponse::body(std::string body, std::string_view contentType) {
  _body = std::move(body);
  addHeader(http::ContentType, contentType);
  addHeader(http::ContentLength, static_cast<std::uint64_t>(_body.size()));
  return *this;
}

FileResponse& FileResponse::stream(ChunkStream stream) {
  _stream.emplace(std::move(stream));
  return *this;
}

void FileResponse::appendHead(std::string& out, std::string_view version) const {
  char statusBuf[8];
  const auto [ptr, ec] = std::to_chars(statusBuf, statusBuf + sizeof(statusBuf), _status);
  out.append(version).append(" ").append(statusBuf, ptr).append(" ").append(_reason).append(http::CRLF);
  for (const auto& [name, value] : _headers) {
    out.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  out.append(http::CRLF);
}

}  // namespace rangeserve
