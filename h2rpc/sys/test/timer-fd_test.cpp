#include "h2rpc/timer-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include <chrono>

#include "h2rpc/timedef.hpp"

namespace h2rpc {

using namespace std::chrono_literals;

namespace {

bool WaitReadable(int fd, int timeoutMs) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, timeoutMs) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

TEST(TimerFdTest, CreatedDisarmed) {
  TimerFd timer;
  EXPECT_GE(timer.fd(), 0);
  EXPECT_FALSE(WaitReadable(timer.fd(), 20));
}

TEST(TimerFdTest, PastDeadlineExpiresImmediately) {
  TimerFd timer;
  timer.armAt(SteadyClock::now() - 1s);
  EXPECT_TRUE(WaitReadable(timer.fd(), 1000));
  timer.drain();
  EXPECT_FALSE(WaitReadable(timer.fd(), 0));
}

TEST(TimerFdTest, FutureDeadlineExpiresAfterDelay) {
  TimerFd timer;
  const auto start = SteadyClock::now();
  timer.armAt(start + 30ms);
  EXPECT_TRUE(WaitReadable(timer.fd(), 2000));
  EXPECT_GE(SteadyClock::now() - start, 30ms);
}

TEST(TimerFdTest, DisarmPreventsExpiration) {
  TimerFd timer;
  timer.armAt(SteadyClock::now() + 20ms);
  timer.disarm();
  EXPECT_FALSE(WaitReadable(timer.fd(), 60));

  timer.armAt(SteadyClock::now() + 10ms);
  timer.armAt(SteadyTimePoint::max());
  EXPECT_FALSE(WaitReadable(timer.fd(), 40));
}

TEST(TimerFdTest, DrainWithoutExpirationIsHarmless) {
  TimerFd timer;
  timer.drain();
}

}  // namespace h2rpc
