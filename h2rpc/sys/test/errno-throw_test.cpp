#include "h2rpc/errno-throw.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string_view>
#include <system_error>

namespace h2rpc {

TEST(ErrnoThrow, ThrowsSystemErrorWithErrno) {
  try {
    errno = EMFILE;
    const int fd = 7;
    throw_errno("Unable to create fd # {}", fd);
    FAIL() << "Expected std::system_error to be thrown";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), EMFILE);
    EXPECT_EQ(e.code(), std::errc::too_many_files_open);
    EXPECT_TRUE(std::string_view(e.what()).starts_with("Unable to create fd # 7"));
  }
}

TEST(ErrnoThrow, MessageWithoutArguments) {
  errno = EINVAL;
  EXPECT_THROW(throw_errno("epoll_create1 failed"), std::system_error);
}

}  // namespace h2rpc
