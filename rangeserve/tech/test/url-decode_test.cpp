#include "rangeserve/url-decode.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace rangeserve {

namespace {
std::optional<std::string> decode(std::string_view input) {
  std::string buf(input);
  char* end = url::DecodePathInPlace(buf.data(), buf.data() + buf.size());
  if (end == nullptr) {
    return std::nullopt;
  }
  buf.resize(static_cast<std::size_t>(end - buf.data()));
  return buf;
}
}  // namespace

TEST(UrlDecodePath, PlainPathUnchanged) { EXPECT_EQ(decode("dir/file.bin"), "dir/file.bin"); }

TEST(UrlDecodePath, PercentSequences) {
  EXPECT_EQ(decode("my%20file.txt"), "my file.txt");
  EXPECT_EQ(decode("%2e%2E/secret"), "../secret");
  EXPECT_EQ(decode("caf%C3%A9"), "caf\xC3\xA9");
}

TEST(UrlDecodePath, PlusIsNotSpace) { EXPECT_EQ(decode("a+b.txt"), "a+b.txt"); }

TEST(UrlDecodePath, Empty) { EXPECT_EQ(decode(""), ""); }

TEST(UrlDecodePath, InvalidSequences) {
  EXPECT_FALSE(decode("abc%").has_value());
  EXPECT_FALSE(decode("abc%2").has_value());
  EXPECT_FALSE(decode("abc%zz").has_value());
  EXPECT_FALSE(decode("%G0").has_value());
}

}  // namespace rangeserve
