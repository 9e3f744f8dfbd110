#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rangeserve/byte-range.hpp"
#include "rangeserve/chunked-streamer.hpp"
#include "rangeserve/file-response.hpp"
#include "rangeserve/path-resolver.hpp"
#include "rangeserve/stream-config.hpp"

namespace rangeserve {

// Expected failures of a download request, all detected before any byte of the response is written.
enum class DownloadError : std::uint8_t { NotFound, AccessDenied, InvalidRange, RangeNotSatisfiable, Busy };

// Quote a file name for the filename parameter of Content-Disposition.
// '"' and '\' are escaped with a backslash, control characters are replaced by '_'.
[[nodiscard]] std::string QuoteFilename(std::string_view name);

// Content-Range value of a partial response: 'bytes <start>-<end>/<size>'.
[[nodiscard]] std::string BuildContentRange(ByteRange range, std::uint64_t fileSize);

// Build a 200 (no range) or 206 response for the entry. stream is empty for HEAD requests.
[[nodiscard]] FileResponse AssembleFileResponse(const FileEntry& entry, const std::optional<ByteRange>& range,
                                                const StreamConfig& config, std::optional<ChunkStream> stream);

// Build the complete response of an expected failure, with a short plain text body.
// fileSize is only used for 416 responses.
[[nodiscard]] FileResponse AssembleErrorResponse(DownloadError error, std::uint64_t fileSize = 0);

[[nodiscard]] std::string_view ErrorMessage(DownloadError error);

}  // namespace rangeserve
