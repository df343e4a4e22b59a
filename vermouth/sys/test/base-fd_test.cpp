#include "vermouth/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace vermouth {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF; }

}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, DestructorClosesDescriptor) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  ::close(fds[1]);
  {
    BaseFd owner(fds[0]);
    EXPECT_TRUE(owner);
  }
  EXPECT_FALSE(IsOpen(fds[0]));
}

TEST(BaseFd, ReleaseGivesOwnershipBack) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  ::close(fds[1]);

  BaseFd owner(fds[0]);
  const int raw = owner.release();
  EXPECT_FALSE(owner);
  EXPECT_EQ(raw, fds[0]);
  EXPECT_EQ(0, ::close(raw));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd readEnd(fds[0]);
  BaseFd writeEnd(fds[1]);

  BaseFd moved(std::move(readEnd));
  EXPECT_FALSE(readEnd);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(moved.fd(), fds[0]);

  writeEnd = std::move(moved);
  EXPECT_FALSE(moved);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(writeEnd.fd(), fds[0]);
  // previous descriptor of writeEnd was closed by the move assignment
  EXPECT_FALSE(IsOpen(fds[1]));
}

TEST(BaseFd, CloseIsIdempotent) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  ::close(fds[1]);

  BaseFd owner(fds[0]);
  owner.close();
  EXPECT_FALSE(owner);
  owner.close();
  EXPECT_FALSE(owner);
}

}  // namespace vermouth
