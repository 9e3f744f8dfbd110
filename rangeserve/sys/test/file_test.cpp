#include "rangeserve/file.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "rangeserve/temp-file.hpp"

using namespace rangeserve;

using test::ScopedTempDir;
using test::ScopedTempFile;

namespace {

std::string ReadString(const File& file, std::uint64_t offset, std::size_t len) {
  std::vector<std::byte> buf(len);
  const auto nbRead = file.readAt(buf, offset);
  if (nbRead == File::kError) {
    return "<error>";
  }
  return {reinterpret_cast<const char*>(buf.data()), nbRead};
}

}  // namespace

TEST(FileTest, OpenMissingFileIsFalse) {
  ScopedTempDir dir;
  File file((dir.dirPath() / "missing.bin").string());
  EXPECT_FALSE(file);
  EXPECT_THROW((void)file.size(), std::system_error);
}

TEST(FileTest, SizeMatchesContent) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "hello.txt", "Hello World");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 11U);
}

TEST(FileTest, ReadAtOffsets) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "hello.txt", "Hello World");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);

  EXPECT_EQ(ReadString(file, 0, 5), "Hello");
  EXPECT_EQ(ReadString(file, 6, 5), "World");
  // Positioned reads do not depend on each other.
  EXPECT_EQ(ReadString(file, 0, 1), "H");
}

TEST(FileTest, ReadAtEndOfFileReturnsShortOrZero) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "hello.txt", "Hello World");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);

  EXPECT_EQ(ReadString(file, 8, 100), "rld");
  EXPECT_EQ(ReadString(file, 11, 4), "");
  EXPECT_EQ(ReadString(file, 1000, 4), "");
}

TEST(FileTest, ReadAtLargeGeneratedFile) {
  ScopedTempDir dir;
  static constexpr std::uint64_t kSize = 3UL * 1024 * 1024 + 17;
  ScopedTempFile tmp(dir, "big.bin", kSize);
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), kSize);

  const std::string_view expected(tmp.content());
  EXPECT_EQ(ReadString(file, 1024 * 1024 - 3, 64), expected.substr(1024 * 1024 - 3, 64));
  EXPECT_EQ(ReadString(file, kSize - 10, 64), expected.substr(kSize - 10));
}

TEST(FileTest, ReadAtOnClosedFileReturnsError) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "hello.txt", "Hello World");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  file.close();
  EXPECT_FALSE(file);

  std::vector<std::byte> buf(4);
  EXPECT_EQ(file.readAt(buf, 0), File::kError);
  EXPECT_THROW((void)file.size(), std::system_error);
}

TEST(FileTest, IndependentHandlesOnSamePath) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "shared.bin", std::uint64_t{4096});
  File first(tmp.filePath().string());
  File second(tmp.filePath().string());
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);

  EXPECT_EQ(ReadString(first, 100, 10), tmp.content().substr(100, 10));
  EXPECT_EQ(ReadString(second, 0, 10), tmp.content().substr(0, 10));
  EXPECT_EQ(ReadString(first, 110, 10), tmp.content().substr(110, 10));
}
