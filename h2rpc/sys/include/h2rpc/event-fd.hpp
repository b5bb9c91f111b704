#pragma once

#include <cstdint>

#include "h2rpc/base-fd.hpp"

namespace h2rpc {

// Non-blocking eventfd waking up the loop of a SerialExecutor from other threads.
// Notifications accumulate in the kernel counter until drained.
class EventFd {
 public:
  EventFd();

  void notify() const noexcept;

  // Resets the counter and returns the number of notifications received since the last drain.
  uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace h2rpc
