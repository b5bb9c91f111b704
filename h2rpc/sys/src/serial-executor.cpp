#include "h2rpc/serial-executor.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "h2rpc/event-loop.hpp"
#include "h2rpc/log.hpp"
#include "h2rpc/scheduler.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

SerialExecutor::SerialExecutor() {
  _eventLoop.addOrThrow(_wakeupFd.fd(), EventIn);
  _eventLoop.addOrThrow(_timerFd.fd(), EventIn);
}

SerialExecutor::~SerialExecutor() {
  _eventLoop.del(_timerFd.fd());
  _eventLoop.del(_wakeupFd.fd());
}

void SerialExecutor::run() {
  _stopRequested.store(false, std::memory_order_relaxed);
  log::debug("SerialExecutor started");
  while (!_stopRequested.load(std::memory_order_acquire)) {
    runOnce(SteadyDuration::max());
  }
  log::debug("SerialExecutor stopped");
}

std::size_t SerialExecutor::runOnce(SteadyDuration maxWait) {
  _loopThreadId.store(std::this_thread::get_id(), std::memory_order_relaxed);

  int timeoutMs = -1;
  if (maxWait != SteadyDuration::max()) {
    timeoutMs = static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(maxWait).count());
  }

  for (const EventLoop::Event& event : _eventLoop.poll(timeoutMs)) {
    if (event.fd == _wakeupFd.fd()) {
      log::trace("Serial executor woken up by {} notifications", _wakeupFd.drain());
    } else if (event.fd == _timerFd.fd()) {
      _timerFd.drain();
      _armedDeadline = SteadyTimePoint::max();
    }
  }

  std::size_t nbRun = runPendingTasks();
  nbRun += _timers.runExpired(SteadyClock::now());
  rearmTimer();

  _loopThreadId.store(std::thread::id{}, std::memory_order_relaxed);
  return nbRun;
}

void SerialExecutor::stop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _wakeupFd.notify();
}

void SerialExecutor::execute(Task task) {
  {
    std::scoped_lock lock(_pendingMutex);
    _pendingTasks.push_back(std::move(task));
  }
  if (!inContext()) {
    _wakeupFd.notify();
  }
}

ScheduledTask SerialExecutor::scheduleTask(SteadyDuration delay, Task task) {
  const SteadyTimePoint deadline = SteadyClock::now() + std::max(delay, SteadyDuration::zero());
  if (inContext()) {
    return _timers.add(deadline, std::move(task));
  }
  // The timer queue belongs to the loop thread, hand the registration over to it.
  ScheduledTask handle = ScheduledTask::Create();
  execute([this, deadline, handle, task = std::move(task)]() mutable {
    _timers.add(deadline, handle, std::move(task));
  });
  return handle;
}

bool SerialExecutor::inContext() const noexcept {
  return _loopThreadId.load(std::memory_order_relaxed) == std::this_thread::get_id();
}

std::size_t SerialExecutor::runPendingTasks() {
  std::vector<Task> tasks;
  {
    std::scoped_lock lock(_pendingMutex);
    tasks.swap(_pendingTasks);
  }
  for (Task& task : tasks) {
    task();
  }
  return tasks.size();
}

void SerialExecutor::rearmTimer() {
  bool hasPendingTasks;
  {
    std::scoped_lock lock(_pendingMutex);
    hasPendingTasks = !_pendingTasks.empty();
  }
  if (hasPendingTasks) {
    // Tasks submitted from inside the context did not wake up the loop.
    _wakeupFd.notify();
  }
  const SteadyTimePoint deadline = _timers.nextDeadline();
  if (deadline != _armedDeadline) {
    _timerFd.armAt(deadline);
    _armedDeadline = deadline;
  }
}

}  // namespace h2rpc
