#include "rangeserve/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

using namespace rangeserve;

namespace {
bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }
}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ReleaseMakesObjectClosedAndReturnsFd) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  ::close(fds[1]);

  ASSERT_TRUE(rd);
  int raw = rd.release();
  EXPECT_FALSE(rd);
  EXPECT_GE(raw, 0);
  EXPECT_EQ(0, ::close(raw));
}

TEST(BaseFd, DestructorClosesDescriptor) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  ::close(fds[1]);
  {
    BaseFd rd(fds[0]);
    EXPECT_TRUE(IsOpen(fds[0]));
  }
  EXPECT_FALSE(IsOpen(fds[0]));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  BaseFd moved(std::move(rd));
  EXPECT_FALSE(rd);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(moved.fd(), fds[0]);

  // Move assignment closes the previously held descriptor.
  moved = std::move(wr);
  EXPECT_FALSE(IsOpen(fds[0]));
  EXPECT_EQ(moved.fd(), fds[1]);
}

TEST(BaseFd, CloseIsIdempotent) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  ::close(fds[1]);
  BaseFd rd(fds[0]);
  rd.close();
  EXPECT_FALSE(rd);
  rd.close();
  EXPECT_FALSE(rd);
}
