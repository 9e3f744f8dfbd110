#pragma once

#ifndef __linux__
#error "Unsupported platform - rangeserve currently supports Linux only"
#endif

namespace rangeserve {

// The OS-level socket / file descriptor type.
using NativeHandle = int;

inline constexpr NativeHandle kInvalidHandle = -1;

}  // namespace rangeserve
