#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "rangeserve/platform.hpp"

namespace rangeserve {

// Thin wrappers centralising socket system calls, so that higher level modules never include
// networking headers directly. They do not log; callers decide how to report failures.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Set SO_SNDBUF / SO_RCVBUF. The kernel may round (and on Linux doubles) the requested value.
bool SetSendBufferSize(NativeHandle fd, int nbBytes) noexcept;
bool SetReceiveBufferSize(NativeHandle fd, int nbBytes) noexcept;

// Retrieve the effective buffer sizes. Return -1 on failure.
// The server never reads them back; they exist to check what the kernel applied (tests, diagnostics).
int GetSendBufferSize(NativeHandle fd) noexcept;
int GetReceiveBufferSize(NativeHandle fd) noexcept;

// Set SO_RCVTIMEO so that blocking reads fail with EAGAIN after the given timeout (0: no timeout).
bool SetReceiveTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

// Set SO_SNDTIMEO so that a send blocked on a full socket buffer fails with EAGAIN after the given timeout
// (0: no timeout). A partial write may happen before the failure.
bool SetSendTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

// Send the whole buffer, retrying on EINTR and partial writes, without raising SIGPIPE.
// Returns false on the first unrecoverable failure (errno set), typically a peer disconnection.
bool SendAll(NativeHandle fd, const void* data, std::size_t len) noexcept;

inline bool SendAll(NativeHandle fd, std::string_view data) noexcept { return SendAll(fd, data.data(), data.size()); }

// Shutdown the reading side of a connected socket: blocked and future reads return 0 (end of stream).
bool ShutdownRead(NativeHandle fd) noexcept;

// Shutdown both sides of a connected socket: pending writes fail, reads return 0.
bool ShutdownReadWrite(NativeHandle fd) noexcept;

// Receive some bytes, retrying on EINTR. Returns the number of bytes read, 0 on orderly shutdown, -1 on error.
int64_t SafeRecv(NativeHandle fd, void* data, std::size_t len) noexcept;

}  // namespace rangeserve
