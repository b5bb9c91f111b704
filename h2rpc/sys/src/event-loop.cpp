#include "h2rpc/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <utility>

#include "h2rpc/base-fd.hpp"
#include "h2rpc/errno-throw.hpp"
#include "h2rpc/log.hpp"

namespace h2rpc {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");

EventLoop::EventLoop(uint32_t initialCapacity)
    : _nbAllocatedEvents(std::max(1U, initialCapacity)), _baseFd(::epoll_create1(EPOLL_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  _pEpollEvents = std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(epoll_event));
  _pEvents = static_cast<Event*>(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(Event)));
  if (_pEpollEvents == nullptr || _pEvents == nullptr) {
    std::free(_pEpollEvents);
    std::free(_pEvents);
    throw std::bad_alloc();
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::EventLoop(EventLoop&& rhs) noexcept
    : _nbAllocatedEvents(std::exchange(rhs._nbAllocatedEvents, 0)),
      _baseFd(std::move(rhs._baseFd)),
      _pEpollEvents(std::exchange(rhs._pEpollEvents, nullptr)),
      _pEvents(std::exchange(rhs._pEvents, nullptr)) {}

EventLoop& EventLoop::operator=(EventLoop&& rhs) noexcept {
  if (this != &rhs) [[likely]] {
    std::free(_pEpollEvents);
    std::free(_pEvents);

    _nbAllocatedEvents = std::exchange(rhs._nbAllocatedEvents, 0);
    _baseFd = std::move(rhs._baseFd);
    _pEpollEvents = std::exchange(rhs._pEpollEvents, nullptr);
    _pEvents = std::exchange(rhs._pEvents, nullptr);
  }
  return *this;
}

EventLoop::~EventLoop() {
  std::free(_pEpollEvents);
  std::free(_pEvents);
}

void EventLoop::addOrThrow(int fd, EventBmp eventBmp) const {
  epoll_event ev{eventBmp, epoll_data_t{.fd = fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", fd, eventBmp);
  }
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // DEL failures are usually benign if fd already closed.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll(int timeoutMs) {
  const uint32_t capacityBeforePoll = _nbAllocatedEvents;
  auto* epollEvents = static_cast<epoll_event*>(_pEpollEvents);

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), timeoutMs);
  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return {_pEvents, 0U};
    }
    const auto err = errno;
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", timeoutMs, err, std::strerror(err));
    return {};
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _pEvents[idx] = Event{static_cast<EventBmp>(epollEvents[idx].events), epollEvents[idx].data.fd};
  }
  std::span<const Event> ret(_pEvents, static_cast<std::size_t>(nbReadyFds));

  // If saturated, grow buffers for subsequent polls.
  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    const uint32_t newCapacity = capacityBeforePoll * 2U;
    void* newEpollEvents = std::realloc(_pEpollEvents, static_cast<std::size_t>(newCapacity) * sizeof(epoll_event));
    void* newEvents = newEpollEvents == nullptr
                          ? nullptr
                          : std::malloc(static_cast<std::size_t>(newCapacity) * sizeof(Event));
    if (newEpollEvents != nullptr) {
      _pEpollEvents = newEpollEvents;
    }
    if (newEvents == nullptr) {
      log::error("Failed to reallocate memory for saturated events, keeping actual size of {}", _nbAllocatedEvents);
    } else {
      std::memcpy(newEvents, _pEvents, static_cast<std::size_t>(nbReadyFds) * sizeof(Event));
      std::free(_pEvents);
      _pEvents = static_cast<Event*>(newEvents);
      _nbAllocatedEvents = newCapacity;
      ret = std::span<const Event>(_pEvents, static_cast<std::size_t>(nbReadyFds));
    }
  }

  return ret;
}

}  // namespace h2rpc
