#pragma once

#include <cstdint>
#include <span>

#include "h2rpc/base-fd.hpp"

namespace h2rpc {

using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;

// Thin RAII wrapper over epoll.
// The ready-event buffer starts at initialCapacity slots and doubles each time a poll saturates it.
// It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 8;

  struct Event {
    EventBmp eventBmp;
    int fd;
  };

  explicit EventLoop(uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(int fd, EventBmp eventBmp) const;

  // Delete fd from monitoring. Logs on error.
  void del(int fd) const;

  // Waits at most 'timeoutMs' milliseconds (-1 for no timeout) for ready events.
  //  - On success: returns a non-empty span over an internal reusable buffer.
  //  - On timeout or EINTR: returns an empty span with non-null data() pointer.
  //  - On unrecoverable failure (already logged): returns an empty span with nullptr data() pointer.
  [[nodiscard]] std::span<const Event> poll(int timeoutMs);

  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

 private:
  uint32_t _nbAllocatedEvents = 0;
  BaseFd _baseFd;
  void* _pEpollEvents = nullptr;
  Event* _pEvents = nullptr;
};

}  // namespace h2rpc
