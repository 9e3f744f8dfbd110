#pragma once

#include <string_view>

#include "rangeserve/http-status-code.hpp"

namespace rangeserve::http {

// Header field names are case-insensitive per RFC 7230. They are stored here in their canonical form for emission;
// parsing code compares them with CaseInsensitiveEqual.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";

// Standard Header Field Names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view CacheControl = "Cache-Control";
inline constexpr std::string_view RetryAfter = "Retry-After";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Range = "Range";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Common Header Values (lowercase tokens where case-insensitive comparison used)
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view bytes = "bytes";

// Reason Phrases
inline constexpr std::string_view ReasonOK = "OK";                                               // 200
inline constexpr std::string_view ReasonPartialContent = "Partial Content";                      // 206
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                              // 400
inline constexpr std::string_view ReasonForbidden = "Forbidden";                                 // 403
inline constexpr std::string_view NotFound = "Not Found";                                        // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";                 // 405
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";                   // 413
inline constexpr std::string_view ReasonRangeNotSatisfiable = "Range Not Satisfiable";           // 416
inline constexpr std::string_view ReasonHeadersTooLarge = "Request Header Fields Too Large";     // 431
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";           // 500
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";              // 503
inline constexpr std::string_view ReasonHTTPVersionNotSupported = "HTTP Version Not Supported";  // 505

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Return the canonical reason phrase for the status codes we emit.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return NotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeRangeNotSatisfiable:
      return ReasonRangeNotSatisfiable;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonHeadersTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeHTTPVersionNotSupported:
      return ReasonHTTPVersionNotSupported;
    default:
      return {};
  }
}

}  // namespace rangeserve::http
