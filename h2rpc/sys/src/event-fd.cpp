#include "h2rpc/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "h2rpc/errno-throw.hpp"
#include "h2rpc/log.hpp"

namespace h2rpc {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
}

void EventFd::notify() const noexcept {
  // A saturated counter (EAGAIN) still leaves the fd readable.
  if (::eventfd_write(fd(), 1) != 0 && errno != EAGAIN) {
    log::error("eventfd # {} write failed: {}", fd(), std::strerror(errno));
  }
}

uint64_t EventFd::drain() const noexcept {
  eventfd_t counter = 0;
  if (::eventfd_read(fd(), &counter) != 0) {
    if (errno != EAGAIN) {
      log::error("eventfd # {} read failed: {}", fd(), std::strerror(errno));
    }
    return 0;
  }
  return counter;
}

}  // namespace h2rpc
