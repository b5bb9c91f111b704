#include "h2rpc/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <utility>

#include "h2rpc/errno-throw.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

static_assert(SteadyClock::is_steady);

namespace {

// std::chrono::steady_clock is CLOCK_MONOTONIC on Linux, its epoch is the same as the timerfd clock.
timespec ToAbsoluteTimespec(SteadyTimePoint deadline) {
  using namespace std::chrono;
  auto ns = duration_cast<nanoseconds>(deadline.time_since_epoch());
  if (ns <= nanoseconds::zero()) {
    // {0, 0} would disarm the timer.
    ns = nanoseconds(1);
  }
  const auto secs = duration_cast<seconds>(ns);
  const auto rem = ns - secs;
  return {static_cast<time_t>(secs.count()), static_cast<long>(rem.count())};
}

}  // namespace

TimerFd::TimerFd() : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new TimerFd");
  }
  log::debug("TimerFd fd # {} opened", fd());
}

void TimerFd::armAt(SteadyTimePoint deadline) const {
  if (deadline == SteadyTimePoint::max()) {
    disarm();
    return;
  }
  itimerspec spec{};
  spec.it_value = ToAbsoluteTimespec(deadline);
  setTime(spec, TFD_TIMER_ABSTIME);
}

void TimerFd::disarm() const {
  itimerspec spec{};
  setTime(spec, 0);
}

void TimerFd::setTime(const itimerspec& spec, int flags) const {
  if (::timerfd_settime(fd(), flags, &spec, nullptr) != 0) {
    const int timerFd = fd();
    throw_errno("timerfd_settime failed (fd # {})", timerFd);
  }
}

void TimerFd::drain() const noexcept {
  while (true) {
    std::uint64_t expirations = 0;
    const auto ret = ::read(fd(), &expirations, sizeof(expirations));
    if (std::cmp_equal(ret, sizeof(expirations))) {
      continue;
    }
    if (ret == -1) {
      const auto err = errno;
      if (err != EAGAIN) {
        log::error("TimerFd drain failed err={}: {}", err, std::strerror(err));
      }
    }
    return;
  }
}

}  // namespace h2rpc
