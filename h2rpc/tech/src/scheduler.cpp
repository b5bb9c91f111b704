#include "h2rpc/scheduler.hpp"

#include <cstddef>
#include <utility>
#include <vector>

#include "h2rpc/timedef.hpp"

namespace h2rpc {

void ScheduledTask::cancel() const noexcept {
  if (_state) {
    _state->cancelled = true;
  }
}

bool ScheduledTask::markRun() const noexcept {
  if (!_state || _state->cancelled) {
    return false;
  }
  _state->ran = true;
  return true;
}

namespace internal {

ScheduledTask TimerQueue::add(SteadyTimePoint deadline, Scheduler::Task task) {
  ScheduledTask handle = ScheduledTask::Create();
  add(deadline, handle, std::move(task));
  return handle;
}

void TimerQueue::add(SteadyTimePoint deadline, ScheduledTask handle, Scheduler::Task task) {
  _timers.emplace(deadline, Entry{std::move(handle), std::move(task)});
}

std::size_t TimerQueue::runExpired(SteadyTimePoint now) {
  // Tasks may schedule new timers while running, so the due entries are extracted first.
  std::vector<Entry> expired;
  auto it = _timers.begin();
  for (; it != _timers.end() && it->first <= now; ++it) {
    expired.push_back(std::move(it->second));
  }
  _timers.erase(_timers.begin(), it);

  std::size_t nbRun = 0;
  for (Entry& entry : expired) {
    if (entry.handle.markRun()) {
      entry.task();
      ++nbRun;
    }
  }
  return nbRun;
}

SteadyTimePoint TimerQueue::nextDeadline() {
  purgeCancelledFront();
  return _timers.empty() ? SteadyTimePoint::max() : _timers.begin()->first;
}

void TimerQueue::purgeCancelledFront() noexcept {
  while (!_timers.empty() && _timers.begin()->second.handle.isCancelled()) {
    _timers.erase(_timers.begin());
  }
}

}  // namespace internal

}  // namespace h2rpc
