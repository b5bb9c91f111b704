#include "h2rpc/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "h2rpc/log.hpp"

namespace h2rpc {

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::reset(int fd) noexcept {
  const int previous = std::exchange(_fd, fd);
  if (previous == kClosedFd || previous == fd) {
    return;
  }
  // Linux releases the descriptor even when close is interrupted, it should not be retried.
  if (::close(previous) != 0 && errno != EINTR) {
    log::error("Failed to close fd # {}: {}", previous, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", previous);
}

}  // namespace h2rpc
