#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace rangeserve::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "rangeserve-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: creates a file inside an existing ScopedTempDir and removes it on destruction.
// The ScopedTempDir owns the directory lifecycle.
class ScopedTempFile {
 public:
  // Create a file with the given name (relative to the directory, sub directories are created) and content.
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content);

  // Create a file of given size filled with a deterministic, non periodic byte pattern,
  // so that any misplaced byte is detected. The full content is kept in memory (see content()).
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::uint64_t size);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }
  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }
  [[nodiscard]] std::string filename() const { return _path.filename().string(); }
  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void write();
  void cleanup() noexcept;

  std::filesystem::path _dir;
  std::filesystem::path _path;
  std::string _content;
};

}  // namespace rangeserve::test
