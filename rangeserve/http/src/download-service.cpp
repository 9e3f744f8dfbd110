#include "rangeserve/download-service.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rangeserve/byte-range.hpp"
#include "rangeserve/chunked-streamer.hpp"
#include "rangeserve/http-constants.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/range-parser.hpp"
#include "rangeserve/response-assembler.hpp"
#include "rangeserve/timestring.hpp"

namespace rangeserve {

namespace {

StreamConfig Validated(const StreamConfig& config) {
  config.validate();
  return config;
}

}  // namespace

DownloadService::DownloadService(const std::filesystem::path& shareRoot, const StreamConfig& config)
    : _config(Validated(config)), _resolver(shareRoot) {
  if (_config.maxConcurrentStreams != 0) {
    _gate = std::make_unique<ConcurrencyGate>(_config.maxConcurrentStreams);
  }
}

FileResponse DownloadService::streamRequest(std::string_view rawPath, std::optional<std::string_view> rangeHeader,
                                            http::Method method) {
  if (method == http::Method::OTHER) {
    FileResponse resp(http::StatusCodeMethodNotAllowed);
    resp.addHeader(http::Allow, "GET, HEAD");
    resp.body("Method not allowed");
    return resp;
  }

  auto resolved = _resolver.resolve(rawPath);
  switch (resolved.state) {
    case ResolveResult::State::AccessDenied:
      return AssembleErrorResponse(DownloadError::AccessDenied);
    case ResolveResult::State::NotFound:
      log::debug("File not found: '{}'", rawPath);
      return AssembleErrorResponse(DownloadError::NotFound);
    default:
      break;
  }
  const FileEntry& entry = resolved.entry;

  const auto selection = ParseRange(rangeHeader, entry.size, _config.enableRange);
  std::optional<ByteRange> range;
  switch (selection.state) {
    case RangeSelection::State::Invalid:
      log::debug("Invalid range '{}' for '{}'", rangeHeader.value_or(""), rawPath);
      return AssembleErrorResponse(DownloadError::InvalidRange);
    case RangeSelection::State::Unsatisfiable:
      log::debug("Unsatisfiable range '{}' for '{}' of size {}", rangeHeader.value_or(""), rawPath, entry.size);
      return AssembleErrorResponse(DownloadError::RangeNotSatisfiable, entry.size);
    case RangeSelection::State::Valid:
      range = selection.range;
      break;
    default:
      break;
  }

  if (method == http::Method::HEAD) {
    return AssembleFileResponse(entry, range, _config, std::nullopt);
  }

  ConcurrencyToken token;
  if (_gate) {
    auto acquired = _gate->tryAcquire();
    if (!acquired) {
      log::warn("Rejecting download of '{}': {} streams already active", entry.name, _gate->capacity());
      return AssembleErrorResponse(DownloadError::Busy);
    }
    token = std::move(*acquired);
  }

  auto stream = OpenChunkStream(entry, range, _config, std::move(token));
  if (!stream) {
    // vanished between stat and open, the slot was given back with the token
    return AssembleErrorResponse(DownloadError::NotFound);
  }

  if (range) {
    log::debug("Streaming '{}' bytes {}-{} ({} bytes)", entry.name, range->start, range->end, range->length());
  } else {
    log::debug("Streaming '{}' ({} bytes)", entry.name, entry.size);
  }
  return AssembleFileResponse(entry, range, _config, std::move(stream));
}

FileResponse DownloadService::listingResponse() const {
  std::string body;
  for (const auto& listingEntry : listEntries()) {
    body.append(listingEntry.name).push_back('\t');
    body.append(std::to_string(listingEntry.size)).push_back('\t');
    body.append(TimeToStringRFC7231(listingEntry.modifiedAt)).push_back('\n');
  }
  FileResponse resp(http::StatusCodeOK);
  resp.addHeader(http::CacheControl, "no-cache");
  resp.body(std::move(body), http::ContentTypeTextPlainUtf8);
  return resp;
}

}  // namespace rangeserve
