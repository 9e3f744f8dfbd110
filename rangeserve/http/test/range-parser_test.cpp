#include "rangeserve/range-parser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace rangeserve {

namespace {

constexpr std::uint64_t kSize = 1000;

RangeSelection Parse(std::string_view header, std::uint64_t size = kSize) { return ParseRange(header, size); }

void ExpectValid(std::string_view header, std::uint64_t start, std::uint64_t end, std::uint64_t size = kSize) {
  const auto sel = Parse(header, size);
  ASSERT_EQ(sel.state, RangeSelection::State::Valid) << header;
  EXPECT_EQ(sel.range.start, start) << header;
  EXPECT_EQ(sel.range.end, end) << header;
  EXPECT_EQ(sel.range.length(), end - start + 1) << header;
}

}  // namespace

TEST(RangeParser, AbsentHeaderMeansNoRange) {
  EXPECT_EQ(ParseRange(std::nullopt, kSize).state, RangeSelection::State::None);
}

TEST(RangeParser, DisabledRangesIgnoreHeader) {
  EXPECT_EQ(ParseRange("bytes=0-10", kSize, false).state, RangeSelection::State::None);
  EXPECT_EQ(ParseRange("garbage", kSize, false).state, RangeSelection::State::None);
}

TEST(RangeParser, OpenEndedFromStart) { ExpectValid("bytes=0-", 0, 999); }

TEST(RangeParser, ClosedInterval) { ExpectValid("bytes=100-199", 100, 199); }

TEST(RangeParser, EndIsClampedBeforeValidation) { ExpectValid("bytes=995-2000", 995, 999); }

TEST(RangeParser, EndBeyondAnyFileIsClamped) {
  ExpectValid("bytes=995-18446744073709551614", 995, 999);
  ExpectValid("bytes=995-18446744073709551615", 995, 999);
  ExpectValid("bytes=995-99999999999999999999", 995, 999);
  ExpectValid("bytes=0-99999999999999999999999999999999", 0, 999);
  ExpectValid("bytes=-18446744073709551616", 0, 999);
}

TEST(RangeParser, StartBeyondAnyFileIsUnsatisfiable) {
  EXPECT_EQ(Parse("bytes=18446744073709551615-").state, RangeSelection::State::Unsatisfiable);
  EXPECT_EQ(Parse("bytes=99999999999999999999999-").state, RangeSelection::State::Unsatisfiable);
  EXPECT_EQ(Parse("bytes=99999999999999999999999-99999999999999999999999").state,
            RangeSelection::State::Unsatisfiable);
}

TEST(RangeParser, StartAtSizeIsUnsatisfiable) {
  EXPECT_EQ(Parse("bytes=1000-").state, RangeSelection::State::Unsatisfiable);
  EXPECT_EQ(Parse("bytes=5000-6000").state, RangeSelection::State::Unsatisfiable);
}

TEST(RangeParser, EndBeforeStartIsUnsatisfiable) {
  EXPECT_EQ(Parse("bytes=500-100").state, RangeSelection::State::Unsatisfiable);
}

TEST(RangeParser, EmptyStartMeansZero) {
  ExpectValid("bytes=-499", 0, 499);
  ExpectValid("bytes=-", 0, 999);
}

TEST(RangeParser, SingleByteRanges) {
  ExpectValid("bytes=0-0", 0, 0);
  ExpectValid("bytes=999-999", 999, 999);
  ExpectValid("bytes=999-", 999, 999);
}

TEST(RangeParser, OnlyFirstSpecifierIsHonored) {
  ExpectValid("bytes=0-9,20-29", 0, 9);
  ExpectValid("bytes=10-19, garbage", 10, 19);
}

TEST(RangeParser, UnitIsCaseInsensitiveAndWhitespaceTrimmed) {
  ExpectValid("Bytes=1-2", 1, 2);
  ExpectValid("  BYTES= 3 - 4 ", 3, 4);
}

TEST(RangeParser, InvalidSyntax) {
  for (std::string_view header : {"", "bytes", "items=0-10", "bytes 0-10", "bytes=10", "bytes=abc-def", "bytes=1-x",
                                  "bytes=x-10", "bytes=+1-2", "bytes=-1-2", "bytes=0x10-20",
                                  "bytes=99999999999999999999999x-", "bytes=0-99999999999999999999999x"}) {
    EXPECT_EQ(Parse(header).state, RangeSelection::State::Invalid) << header;
  }
}

TEST(RangeParser, EmptyFileIsAlwaysUnsatisfiable) {
  for (std::string_view header : {"bytes=0-", "bytes=0-0", "bytes=-", "bytes=-10"}) {
    EXPECT_EQ(Parse(header, 0).state, RangeSelection::State::Unsatisfiable) << header;
  }
}

TEST(RangeParser, LargeFileOffsets) {
  static constexpr std::uint64_t kHuge = std::uint64_t{20} * 1024 * 1024 * 1024;
  ExpectValid("bytes=17179869184-", 17179869184ULL, kHuge - 1, kHuge);
}

}  // namespace rangeserve
