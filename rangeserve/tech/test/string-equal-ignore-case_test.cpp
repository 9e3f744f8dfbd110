#include "rangeserve/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

#include "rangeserve/string-trim.hpp"

namespace rangeserve {

TEST(StringEqualIgnoreCase, Equal) {
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Length", "content-length"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("Range", "Ranges"));
  EXPECT_FALSE(CaseInsensitiveEqual("Range", "Rangf"));
}

TEST(StringEqualIgnoreCase, StartsWith) {
  EXPECT_TRUE(StartsWithCaseInsensitive("bytes=0-", "bytes="));
  EXPECT_TRUE(StartsWithCaseInsensitive("BYTES=0-", "bytes="));
  EXPECT_FALSE(StartsWithCaseInsensitive("byte", "bytes="));
  EXPECT_FALSE(StartsWithCaseInsensitive("items=0-", "bytes="));
}

TEST(StringTrim, TrimOws) {
  EXPECT_EQ(TrimOws("  value\t "), "value");
  EXPECT_EQ(TrimOws("\t\t"), "");
  EXPECT_EQ(TrimOws("a b"), "a b");
  EXPECT_EQ(TrimOws(""), "");
}

}  // namespace rangeserve
