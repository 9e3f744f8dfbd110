#include "rangeserve/url-decode.hpp"

#include "rangeserve/char-hexadecimal-converter.hpp"

namespace rangeserve::url {

char* DecodePathInPlace(char* first, const char* last) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (first + 2 >= last) {
      return nullptr;
    }
    const int v1 = from_hex_digit(*++first);
    const int v2 = from_hex_digit(*++first);
    if (v1 < 0 || v2 < 0) {
      return nullptr;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
  }
  return out;
}

}  // namespace rangeserve::url
