#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "rangeserve/timedef.hpp"

namespace rangeserve {

// Metadata of a servable file, freshly read for each request.
struct FileEntry {
  std::filesystem::path path;
  // Final segment of the path, used as download name.
  std::string name;
  std::uint64_t size{0};
  // Points to static storage (MIME mappings table).
  std::string_view mimeType;
  SysTimePoint modifiedAt;
};

struct ResolveResult {
  enum class State : std::uint8_t { Found, NotFound, AccessDenied };

  State state{State::NotFound};
  FileEntry entry;
};

struct ListingEntry {
  bool operator==(const ListingEntry&) const noexcept = default;

  std::string name;
  std::uint64_t size{0};
  SysTimePoint modifiedAt;
};

// Returns true if candidate is root itself or lies under it. Both paths are expected to be absolute and normalized.
// Comparison is made element by element, so that '/srv/share2' is not considered under '/srv/share'.
[[nodiscard]] bool IsWithinRoot(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Maps request paths to regular files confined under a share root.
class PathResolver {
 public:
  // Throws std::invalid_argument if shareRoot is not an existing directory.
  explicit PathResolver(const std::filesystem::path& shareRoot);

  // Resolve a raw (still percent-encoded) request path, without query string.
  // Containment is checked before existence, so an escaping path is AccessDenied even if it does not exist.
  [[nodiscard]] ResolveResult resolve(std::string_view rawPath) const;

  // Regular files directly under the root, sorted by name. Symbolic links are not followed.
  [[nodiscard]] std::vector<ListingEntry> listEntries() const;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return _root; }

 private:
  std::filesystem::path _root;
};

}  // namespace rangeserve
