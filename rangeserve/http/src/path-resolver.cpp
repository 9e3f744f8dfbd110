#include "rangeserve/path-resolver.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "rangeserve/log.hpp"
#include "rangeserve/mime-mappings.hpp"
#include "rangeserve/timedef.hpp"
#include "rangeserve/url-decode.hpp"

namespace rangeserve {

namespace {

ResolveResult NotFound() { return ResolveResult{ResolveResult::State::NotFound, {}}; }

ResolveResult AccessDenied() { return ResolveResult{ResolveResult::State::AccessDenied, {}}; }

SysTimePoint ToSysTime(std::filesystem::file_time_type writeTime) {
  return std::chrono::file_clock::to_sys(writeTime);
}

}  // namespace

bool IsWithinRoot(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  auto rootIt = root.begin();
  auto candIt = candidate.begin();
  for (; rootIt != root.end(); ++rootIt, ++candIt) {
    // a trailing separator of the root is represented by an empty last element
    if (rootIt->empty() && std::next(rootIt) == root.end()) {
      break;
    }
    if (candIt == candidate.end() || *rootIt != *candIt) {
      return false;
    }
  }
  return true;
}

PathResolver::PathResolver(const std::filesystem::path& shareRoot) {
  std::error_code ec;
  _root = std::filesystem::canonical(shareRoot, ec);
  if (ec || !std::filesystem::is_directory(_root, ec)) {
    throw std::invalid_argument("share root must be an existing directory");
  }
}

ResolveResult PathResolver::resolve(std::string_view rawPath) const {
  std::string decoded(rawPath);
  const char* decodedEnd = url::DecodePathInPlace(decoded.data(), decoded.data() + decoded.size());
  if (decodedEnd == nullptr) {
    log::debug("Invalid percent encoding in path '{}'", rawPath);
    return NotFound();
  }
  decoded.resize(static_cast<std::size_t>(decodedEnd - decoded.data()));
  if (decoded.find('\0') != std::string::npos) {
    return NotFound();
  }

  std::string_view relative(decoded);
  if (relative.starts_with('/')) {
    relative.remove_prefix(1);
  }

  // An absolute path remaining after the strip replaces the root when joined, and is then caught by containment.
  const std::filesystem::path target = (_root / relative).lexically_normal();
  if (!IsWithinRoot(_root, target)) {
    log::warn("Rejected path escaping share root: '{}'", rawPath);
    return AccessDenied();
  }

  std::error_code ec;
  const auto status = std::filesystem::status(target, ec);
  if (ec || !std::filesystem::is_regular_file(status)) {
    return NotFound();
  }

  // symbolic links must not lead out of the root either
  const auto canonicalTarget = std::filesystem::canonical(target, ec);
  if (ec) {
    return NotFound();
  }
  if (!IsWithinRoot(_root, canonicalTarget)) {
    log::warn("Rejected symbolic link escaping share root: '{}'", rawPath);
    return AccessDenied();
  }

  ResolveResult result;
  result.entry.size = static_cast<std::uint64_t>(std::filesystem::file_size(target, ec));
  if (ec) {
    return NotFound();
  }
  const auto writeTime = std::filesystem::last_write_time(target, ec);
  if (ec) {
    return NotFound();
  }
  result.state = ResolveResult::State::Found;
  result.entry.modifiedAt = ToSysTime(writeTime);
  result.entry.name = target.filename().string();
  result.entry.mimeType = DetermineMIMEType(result.entry.name);
  result.entry.path = target;
  return result;
}

std::vector<ListingEntry> PathResolver::listEntries() const {
  std::vector<ListingEntry> entries;
  std::error_code ec;
  std::filesystem::directory_iterator it(_root, ec);
  if (ec) {
    log::error("Unable to list share root '{}': {}", _root.string(), ec.message());
    return entries;
  }
  const std::filesystem::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto& dirEntry = *it;
    std::error_code entryEc;
    if (!dirEntry.is_regular_file(entryEc) || dirEntry.is_symlink(entryEc)) {
      continue;
    }
    ListingEntry listingEntry;
    listingEntry.size = static_cast<std::uint64_t>(dirEntry.file_size(entryEc));
    if (entryEc) {
      log::warn("Skipping '{}' in listing: {}", dirEntry.path().string(), entryEc.message());
      continue;
    }
    const auto writeTime = dirEntry.last_write_time(entryEc);
    if (entryEc) {
      log::warn("Skipping '{}' in listing: {}", dirEntry.path().string(), entryEc.message());
      continue;
    }
    listingEntry.modifiedAt = ToSysTime(writeTime);
    listingEntry.name = dirEntry.path().filename().string();
    entries.push_back(std::move(listingEntry));
  }
  if (ec) {
    log::error("Listing of '{}' interrupted: {}", _root.string(), ec.message());
  }
  std::ranges::sort(entries, {}, &ListingEntry::name);
  return entries;
}

}  // namespace rangeserve
