#include "h2rpc/manual-scheduler.hpp"

#include <cstddef>
#include <utility>

#include "h2rpc/scheduler.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc::test {

void ManualScheduler::execute(Task task) { _tasks.push_back(std::move(task)); }

ScheduledTask ManualScheduler::scheduleTask(SteadyDuration delay, Task task) {
  if (delay < SteadyDuration::zero()) {
    delay = SteadyDuration::zero();
  }
  return _timers.add(_now + delay, std::move(task));
}

std::size_t ManualScheduler::runPending() {
  std::size_t nbRun = 0;
  do {
    while (!_tasks.empty()) {
      Task task = std::move(_tasks.front());
      _tasks.pop_front();
      task();
      ++nbRun;
    }
    nbRun += _timers.runExpired(_now);
    // Expired tasks may have submitted tasks or zero delay timers.
  } while (!_tasks.empty() || _timers.nextDeadline() <= _now);
  return nbRun;
}

std::size_t ManualScheduler::advance(SteadyDuration duration) {
  const SteadyTimePoint target = _now + duration;
  std::size_t nbRun = runPending();
  for (SteadyTimePoint deadline = _timers.nextDeadline(); deadline <= target; deadline = _timers.nextDeadline()) {
    _now = deadline;
    nbRun += runPending();
  }
  _now = target;
  return nbRun + runPending();
}

SteadyDuration ManualScheduler::nextTimerDelay() {
  const SteadyTimePoint deadline = _timers.nextDeadline();
  return deadline == SteadyTimePoint::max() ? SteadyDuration::max() : deadline - _now;
}

}  // namespace h2rpc::test
