#include "rangeserve/response-assembler.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rangeserve/http-constants.hpp"
#include "rangeserve/http-status-code.hpp"
#include "rangeserve/timestring.hpp"

namespace rangeserve {

namespace {

constexpr http::StatusCode StatusFor(DownloadError error) {
  switch (error) {
    case DownloadError::NotFound:
      return http::StatusCodeNotFound;
    case DownloadError::AccessDenied:
      return http::StatusCodeForbidden;
    case DownloadError::InvalidRange:
      return http::StatusCodeBadRequest;
    case DownloadError::RangeNotSatisfiable:
      return http::StatusCodeRangeNotSatisfiable;
    case DownloadError::Busy:
      return http::StatusCodeServiceUnavailable;
    default:
      std::unreachable();
  }
}

}  // namespace

std::string_view ErrorMessage(DownloadError error) {
  switch (error) {
    case DownloadError::NotFound:
      return "File not found";
    case DownloadError::AccessDenied:
      return "Access denied";
    case DownloadError::InvalidRange:
      return "Invalid range";
    case DownloadError::RangeNotSatisfiable:
      return "Range not satisfiable";
    case DownloadError::Busy:
      return "Server busy, please try again";
    default:
      std::unreachable();
  }
}

std::string QuoteFilename(std::string_view name) {
  std::string quoted;
  quoted.reserve(name.size() + 2);
  quoted.push_back('"');
  for (char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (ch == '"' || ch == '\\') {
      quoted.push_back('\\');
      quoted.push_back(ch);
    } else if (uch < 0x20 || uch == 0x7F) {
      quoted.push_back('_');
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('"');
  return quoted;
}

std::string BuildContentRange(ByteRange range, std::uint64_t fileSize) {
  std::string value(http::bytes);
  value.push_back(' ');
  value.append(std::to_string(range.start)).push_back('-');
  value.append(std::to_string(range.end)).push_back('/');
  value.append(std::to_string(fileSize));
  return value;
}

FileResponse AssembleFileResponse(const FileEntry& entry, const std::optional<ByteRange>& range,
                                  const StreamConfig& config, std::optional<ChunkStream> stream) {
  FileResponse resp(range ? http::StatusCodePartialContent : http::StatusCodeOK);
  resp.addHeader(http::ContentType, entry.mimeType);
  resp.addHeader(http::ContentLength, range ? range->length() : entry.size);

  std::string disposition("attachment; filename=");
  disposition.append(QuoteFilename(entry.name));
  resp.addHeader(http::ContentDisposition, disposition);

  if (range) {
    resp.addHeader(http::ContentRange, BuildContentRange(*range, entry.size));
  }
  if (range || config.enableRange) {
    resp.addHeader(http::AcceptRanges, http::bytes);
  }
  if (config.enableCache) {
    std::string cacheControl("public, max-age=");
    cacheControl.append(std::to_string(config.cacheMaxAge.count()));
    resp.addHeader(http::CacheControl, cacheControl);
    resp.addHeader(http::LastModified, TimeToStringRFC7231(entry.modifiedAt));
  }
  if (stream) {
    resp.stream(std::move(*stream));
  }
  return resp;
}

FileResponse AssembleErrorResponse(DownloadError error, std::uint64_t fileSize) {
  FileResponse resp(StatusFor(error));
  if (error == DownloadError::RangeNotSatisfiable) {
    std::string contentRange("bytes */");
    contentRange.append(std::to_string(fileSize));
    resp.addHeader(http::ContentRange, contentRange);
    resp.addHeader(http::AcceptRanges, http::bytes);
  } else if (error == DownloadError::Busy) {
    resp.addHeader(http::RetryAfter, "1");
  }
  resp.body(std::string(ErrorMessage(error)));
  return resp;
}

}  // namespace rangeserve
