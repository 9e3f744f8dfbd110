#include "rangeserve/socket-ops.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/socket.hpp"

using namespace rangeserve;

namespace {

struct SocketPair {
  SocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0) {
      first = BaseFd(fds[0]);
      second = BaseFd(fds[1]);
    }
  }

  BaseFd first;
  BaseFd second;
};

}  // namespace

TEST(SocketOps, BufferSizesAreApplied) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);

  ASSERT_TRUE(SetSendBufferSize(pair.first.fd(), 256 * 1024));
  ASSERT_TRUE(SetReceiveBufferSize(pair.first.fd(), 128 * 1024));
  // The kernel adjusts the requested values, only check they are readable back.
  EXPECT_GT(GetSendBufferSize(pair.first.fd()), 0);
  EXPECT_GT(GetReceiveBufferSize(pair.first.fd()), 0);
}

TEST(SocketOps, GetBufferSizeOnInvalidFdFails) {
  EXPECT_EQ(GetSendBufferSize(-1), -1);
  EXPECT_EQ(GetReceiveBufferSize(-1), -1);
  EXPECT_FALSE(SetSendBufferSize(-1, 1024));
}

TEST(SocketOps, TcpNoDelayOnTcpSocket) {
  Socket sock(Socket::Type::Stream);
  EXPECT_TRUE(SetTcpNoDelay(sock.fd()));
}

TEST(SocketOps, TcpNoDelayOnUnixSocketFails) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  EXPECT_FALSE(SetTcpNoDelay(pair.first.fd()));
}

TEST(SocketOps, SendAllAndRecv) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);

  // Small enough to fit in the socket buffer without a concurrent reader.
  const std::string payload(1000, 'x');
  ASSERT_TRUE(SendAll(pair.first.fd(), payload));

  char buf[2048];
  std::string received;
  while (received.size() < 1000) {
    const auto nbRead = SafeRecv(pair.second.fd(), buf, sizeof(buf));
    ASSERT_GT(nbRead, 0);
    received.append(buf, static_cast<std::size_t>(nbRead));
  }
  EXPECT_EQ(received, payload);
}

TEST(SocketOps, SendAllToClosedPeerReturnsFalse) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  pair.second.close();

  // No SIGPIPE is raised, the failure is reported through the return value.
  const std::string payload(4096, 'y');
  EXPECT_FALSE(SendAll(pair.first.fd(), payload));
}

TEST(SocketOps, RecvTimeoutExpires) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  ASSERT_TRUE(SetReceiveTimeout(pair.first.fd(), std::chrono::milliseconds{20}));

  char buf[16];
  EXPECT_EQ(SafeRecv(pair.first.fd(), buf, sizeof(buf)), -1);
}

TEST(SocketOps, SendTimeoutExpiresWhenPeerStopsReading) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  ASSERT_TRUE(SetSendTimeout(pair.first.fd(), std::chrono::milliseconds{50}));

  // far more than the socket buffers can hold, the peer never reads
  const std::string payload(16UL << 20, 'z');
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(SendAll(pair.first.fd(), payload));
  EXPECT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
}

TEST(SocketOps, RecvReturnsZeroOnOrderlyShutdown) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  pair.second.close();

  char buf[16];
  EXPECT_EQ(SafeRecv(pair.first.fd(), buf, sizeof(buf)), 0);
}

TEST(SocketOps, ShutdownReadUnblocksReader) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  ASSERT_TRUE(ShutdownRead(pair.first.fd()));

  char buf[16];
  EXPECT_EQ(SafeRecv(pair.first.fd(), buf, sizeof(buf)), 0);
  // writing side is still usable
  EXPECT_TRUE(SendAll(pair.first.fd(), "abc"));
}

TEST(SocketOps, ShutdownReadWriteMakesSendFail) {
  SocketPair pair;
  ASSERT_TRUE(pair.first);
  ASSERT_TRUE(ShutdownReadWrite(pair.first.fd()));
  EXPECT_FALSE(SendAll(pair.first.fd(), "abc"));
  EXPECT_FALSE(ShutdownRead(-1));
}
