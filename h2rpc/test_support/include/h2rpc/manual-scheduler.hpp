#pragma once

#include <cstddef>
#include <deque>

#include "h2rpc/scheduler.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc::test {

// Scheduler driven by hand, with a virtual clock. Nothing runs until runPending() or advance() is called,
// and the caller is always considered inside the context.
class ManualScheduler final : public Scheduler {
 public:
  ManualScheduler() noexcept = default;

  void execute(Task task) override;

  ScheduledTask scheduleTask(SteadyDuration delay, Task task) override;

  [[nodiscard]] bool inContext() const noexcept override { return true; }

  [[nodiscard]] SteadyTimePoint now() const noexcept override { return _now; }

  // Runs the tasks submitted with execute() (including those they submit) and the timers due now.
  // Returns the number of tasks run.
  std::size_t runPending();

  // Moves the clock forward by 'duration', running timers at their deadline in order, then pending tasks.
  std::size_t advance(SteadyDuration duration);

  [[nodiscard]] std::size_t nbPendingTasks() const noexcept { return _tasks.size(); }

  // Earliest timer deadline, relative to now (SteadyDuration::max() if none).
  [[nodiscard]] SteadyDuration nextTimerDelay();

 private:
  std::deque<Task> _tasks;
  internal::TimerQueue _timers;
  SteadyTimePoint _now;
};

}  // namespace h2rpc::test
