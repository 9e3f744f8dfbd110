#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "rangeserve/concurrency-gate.hpp"
#include "rangeserve/file-response.hpp"
#include "rangeserve/http-method.hpp"
#include "rangeserve/path-resolver.hpp"
#include "rangeserve/stream-config.hpp"

namespace rangeserve {

// Entry point of the download engine: resolves the path, validates the range, takes an admission slot
// and opens the chunk stream, in this order. May be called concurrently from several threads.
class DownloadService {
 public:
  // Validates the config and canonicalizes the share root.
  // Throws std::invalid_argument if the config is invalid or if shareRoot is not an existing directory.
  DownloadService(const std::filesystem::path& shareRoot, const StreamConfig& config);

  // Build the response for a request of rawPath (percent-encoded, without query string).
  // Expected failures (404, 403, 400, 416, 503, 405) are complete responses without stream.
  // HEAD requests get the same status and headers as GET, without stream and without taking a slot.
  [[nodiscard]] FileResponse streamRequest(std::string_view rawPath, std::optional<std::string_view> rangeHeader,
                                           http::Method method = http::Method::GET);

  // Regular files directly under the share root, sorted by name.
  [[nodiscard]] std::vector<ListingEntry> listEntries() const { return _resolver.listEntries(); }

  // text/plain rendering of listEntries(), one 'name<TAB>size<TAB>Last-Modified' line per file.
  [[nodiscard]] FileResponse listingResponse() const;

  [[nodiscard]] const StreamConfig& config() const noexcept { return _config; }

  [[nodiscard]] const std::filesystem::path& shareRoot() const noexcept { return _resolver.root(); }

  // Number of streams currently holding an admission slot (always 0 without gate).
  [[nodiscard]] std::uint32_t activeStreams() const noexcept { return _gate ? _gate->active() : 0; }

 private:
  StreamConfig _config;
  PathResolver _resolver;
  // nullptr when maxConcurrentStreams is 0
  std::unique_ptr<ConcurrencyGate> _gate;
};

}  // namespace rangeserve
