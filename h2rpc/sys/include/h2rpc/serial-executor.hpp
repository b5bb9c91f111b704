#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

#include "h2rpc/event-fd.hpp"
#include "h2rpc/event-loop.hpp"
#include "h2rpc/scheduler.hpp"
#include "h2rpc/timedef.hpp"
#include "h2rpc/timer-fd.hpp"

namespace h2rpc {

// Scheduler running its tasks on the thread calling run().
//
// execute(), scheduleTask() and stop() can be called from any thread. Cross-thread submissions wake up the loop
// through an eventfd. Timers are kept in a deadline-ordered queue owned by the loop thread, and a single
// one-shot timerfd is armed at the earliest deadline.
class SerialExecutor final : public Scheduler {
 public:
  SerialExecutor();

  ~SerialExecutor() override;

  // Runs the loop in the calling thread until stop() is called.
  void run();

  // Runs one iteration: waits at most 'maxWait' for an event, then runs submitted tasks and expired timers.
  // Returns the number of tasks that ran.
  std::size_t runOnce(SteadyDuration maxWait);

  // Requests the loop to exit. Pending tasks are not run.
  void stop() noexcept;

  void execute(Task task) override;

  ScheduledTask scheduleTask(SteadyDuration delay, Task task) override;

  [[nodiscard]] bool inContext() const noexcept override;

  [[nodiscard]] SteadyTimePoint now() const noexcept override { return SteadyClock::now(); }

 private:
  std::size_t runPendingTasks();

  void rearmTimer();

  EventLoop _eventLoop;
  EventFd _wakeupFd;
  TimerFd _timerFd;

  std::mutex _pendingMutex;
  std::vector<Task> _pendingTasks;

  // Only accessed from the loop thread.
  internal::TimerQueue _timers;
  SteadyTimePoint _armedDeadline{SteadyTimePoint::max()};

  std::atomic<std::thread::id> _loopThreadId;
  std::atomic<bool> _stopRequested{false};
};

}  // namespace h2rpc
