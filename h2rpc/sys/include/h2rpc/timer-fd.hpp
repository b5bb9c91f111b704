#pragma once

#include <ctime>

#include "h2rpc/base-fd.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

// RAII wrapper around a CLOCK_MONOTONIC Linux timerfd, armed in one-shot mode at an absolute deadline.
// Lets an epoll loop wake up for the earliest pending timer without relying on epoll_wait timeouts.
class TimerFd {
 public:
  // Create a disarmed timerfd (non-blocking, close-on-exec).
  TimerFd();

  // Arm a one-shot expiration at 'deadline'. A deadline already in the past expires immediately.
  // SteadyTimePoint::max() disarms the timer.
  void armAt(SteadyTimePoint deadline) const;

  void disarm() const;

  // Drain expirations (non-blocking). Safe to call even if the timer has not fired.
  void drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  void setTime(const itimerspec& spec, int flags) const;

  BaseFd _baseFd;
};

}  // namespace h2rpc
