#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rangeserve/base-fd.hpp"

// Lightweight HTTP/1.1 test client helpers with timeouts, so that a misbehaving server never blocks a test forever.
// Not intended to be a fully compliant client. Only covers scenarios needed by tests.

namespace rangeserve::test {

using namespace std::chrono_literals;

struct ParsedResponse {
  int statusCode{0};
  std::string reason;
  std::map<std::string, std::string> headers;  // case-sensitive keys, the server emits canonical names
  std::string body;
};

// Connect to 127.0.0.1:port with a receive timeout. Throws std::system_error on failure.
BaseFd ConnectLoopback(uint16_t port, std::chrono::milliseconds recvTimeout = 2000ms);

// Read until the peer closes the connection, the timeout expires or maxBytes are received.
std::string RecvUntilClosed(NativeHandle fd, std::size_t maxBytes = 64UL << 20);

// Parse a single response. The body is everything after the head (no chunked decoding).
std::optional<ParsedResponse> ParseResponse(std::string_view raw);

// Connect, send the raw request, and collect everything until the server closes the connection.
std::string SendAndCollect(uint16_t port, std::string_view raw);

// Build and send a 'Connection: close' request and parse its response. Throws std::runtime_error on parse failure.
ParsedResponse Request(uint16_t port, std::string_view method, std::string_view target,
                       const std::vector<std::pair<std::string, std::string>>& headers = {});

}  // namespace rangeserve::test
