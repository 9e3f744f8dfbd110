#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <string>

#include "rangeserve/simple-charconv.hpp"
#include "rangeserve/timedef.hpp"

namespace rangeserve {

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Buffer must have space for at least 29 characters (no null terminator added):
/// WWW, DD Mon YYYY HH:MM:SS GMT
/// Returns pointer past last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  static constexpr const char* const WEEKDAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto day_point = floor<days>(secTp);
  const year_month_day ymd{day_point};
  const weekday wd{day_point};
  const hh_mm_ss hms{secTp - day_point};
  out = copy3(out, WEEKDAYS[wd.c_encoding()]);
  *out = ',';
  *++out = ' ';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = copy3(++out, MONTHS[static_cast<unsigned>(ymd.month()) - 1]);
  *out = ' ';
  out = write4(++out, static_cast<int>(ymd.year()));
  *out = ' ';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = ' ';
  return copy3(++out, "GMT");
}

inline constexpr std::size_t kRFC7231DateStrLen = 29;
inline constexpr SysTimePoint kInvalidTimePoint = SysTimePoint::max();

inline std::string TimeToStringRFC7231(SysTimePoint tp) {
  std::array<char, kRFC7231DateStrLen> buf;
  auto* end = TimeToStringRFC7231(tp, buf.data());
  return {buf.data(), end};
}

}  // namespace rangeserve
