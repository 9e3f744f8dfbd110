#include "rangeserve/test-http-client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rangeserve/errno-throw.hpp"
#include "rangeserve/http-constants.hpp"
#include "rangeserve/socket-ops.hpp"

namespace rangeserve::test {

BaseFd ConnectLoopback(uint16_t port, std::chrono::milliseconds recvTimeout) {
  BaseFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd) {
    throw_errno("test client: socket failed");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("test client: connect to port {} failed", port);
  }
  if (!SetReceiveTimeout(fd.fd(), recvTimeout)) {
    throw_errno("test client: unable to set receive timeout");
  }
  return fd;
}

std::string RecvUntilClosed(NativeHandle fd, std::size_t maxBytes) {
  std::string out;
  char buf[16384];
  while (out.size() < maxBytes) {
    const auto nbRead = SafeRecv(fd, buf, sizeof(buf));
    if (nbRead <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
  return out;
}

std::optional<ParsedResponse> ParseResponse(std::string_view raw) {
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view head = raw.substr(0, headEnd);
  ParsedResponse pr;

  auto lineEnd = head.find(http::CRLF);
  const std::string_view statusLine = head.substr(0, lineEnd);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos) {
    return std::nullopt;
  }
  const auto secondSpace = statusLine.find(' ', firstSpace + 1);
  pr.statusCode = std::atoi(std::string(statusLine.substr(firstSpace + 1, secondSpace - firstSpace - 1)).c_str());
  if (secondSpace != std::string_view::npos) {
    pr.reason = statusLine.substr(secondSpace + 1);
  }

  while (lineEnd != std::string_view::npos) {
    head.remove_prefix(lineEnd + http::CRLF.size());
    lineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, lineEnd);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }
    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    pr.headers.emplace(line.substr(0, colon), value);
  }

  pr.body = raw.substr(headEnd + http::DoubleCRLF.size());
  return pr;
}

std::string SendAndCollect(uint16_t port, std::string_view raw) {
  BaseFd fd = ConnectLoopback(port);
  if (!SendAll(fd.fd(), raw)) {
    throw_errno("test client: send failed");
  }
  return RecvUntilClosed(fd.fd());
}

ParsedResponse Request(uint16_t port, std::string_view method, std::string_view target,
                       const std::vector<std::pair<std::string, std::string>>& headers) {
  std::string raw;
  raw.append(method).append(" ").append(target).append(" HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n");
  for (const auto& [name, value] : headers) {
    raw.append(name).append(": ").append(value).append(http::CRLF);
  }
  raw.append(http::CRLF);

  auto parsed = ParseResponse(SendAndCollect(port, raw));
  if (!parsed) {
    throw std::runtime_error("test client: unable to parse response");
  }
  return std::move(*parsed);
}

}  // namespace rangeserve::test
