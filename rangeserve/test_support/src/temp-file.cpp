#include "rangeserve/temp-file.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "rangeserve/log.hpp"

namespace rangeserve::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64 &threadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      // canonical form, so that tests can compare against paths built by the code under test
      _dir = std::filesystem::canonical(candidate);
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    // restore permissions possibly removed by a test before removing
    std::filesystem::permissions(_dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::add, ec);
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view name, std::string_view content)
    : _dir(dir.dirPath()), _path(dir.dirPath() / name), _content(content) {
  write();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view name, std::uint64_t size)
    : _dir(dir.dirPath()), _path(dir.dirPath() / name) {
  _content.resize(static_cast<std::size_t>(size));
  // Linear congruential sequence: a shifted window never matches the original.
  uint32_t state = 0x2545F491U;
  for (char &ch : _content) {
    state = (state * 1664525U) + 1013904223U;
    ch = static_cast<char>(state >> 24U);
  }
  write();
}

void ScopedTempFile::write() {
  std::filesystem::create_directories(_path.parent_path());
  std::ofstream ofs(_path, std::ios::binary | std::ios::trunc);
  ofs.write(_content.data(), static_cast<std::streamsize>(_content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempFile: write failed");
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile &&other) noexcept
    : _dir(std::move(other._dir)), _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    _path = std::move(other._path);
    _content = std::move(other._content);

    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {} ({})", _path.string(), ec.value(), ec.message());
    }
    _path.clear();
  }
}

}  // namespace rangeserve::test
