#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <utility>

#include "h2rpc/timedef.hpp"

namespace h2rpc {

// Handle on a task scheduled with Scheduler::scheduleTask.
// Copies share the same underlying state: cancelling one of them cancels the task.
// A default constructed handle refers to no task, cancel() is then a no-op.
class ScheduledTask {
 public:
  ScheduledTask() noexcept = default;

  static ScheduledTask Create() { return ScheduledTask(std::make_shared<State>()); }

  // Prevents the task from running if it has not run yet. Idempotent.
  void cancel() const noexcept;

  [[nodiscard]] bool isCancelled() const noexcept { return _state && _state->cancelled; }

  [[nodiscard]] bool hasRun() const noexcept { return _state && _state->ran; }

  // Marks the task as run. Returns false if it was cancelled before (in which case it should not be run).
  [[nodiscard]] bool markRun() const noexcept;

  explicit operator bool() const noexcept { return static_cast<bool>(_state); }

 private:
  struct State {
    bool cancelled{false};
    bool ran{false};
  };

  explicit ScheduledTask(std::shared_ptr<State> state) noexcept : _state(std::move(state)) {}

  std::shared_ptr<State> _state;
};

// A serial execution context: tasks are run one after the other, never concurrently,
// in submission order for execute() and in deadline order for scheduleTask().
// Connection state machines rely on being called only from their scheduler's context.
class Scheduler {
 public:
  using Task = std::function<void()>;

  Scheduler() noexcept = default;

  Scheduler(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

  virtual ~Scheduler() = default;

  // Enqueue 'task' to run on the next tick of the context.
  virtual void execute(Task task) = 0;

  // Run 'task' after 'delay'. A non-positive delay runs it on the next tick.
  virtual ScheduledTask scheduleTask(SteadyDuration delay, Task task) = 0;

  // Tells whether the caller is currently running inside this context.
  [[nodiscard]] virtual bool inContext() const noexcept = 0;

  [[nodiscard]] virtual SteadyTimePoint now() const noexcept = 0;
};

namespace internal {

// Deadline-ordered timer storage shared by Scheduler implementations.
// Tasks with equal deadlines keep their insertion order.
class TimerQueue {
 public:
  ScheduledTask add(SteadyTimePoint deadline, Scheduler::Task task);

  // Registers 'task' under an existing handle.
  void add(SteadyTimePoint deadline, ScheduledTask handle, Scheduler::Task task);

  // Runs the tasks due at 'now' in deadline order and returns how many ran.
  // A task cancelled by an earlier task of the same batch does not run.
  std::size_t runExpired(SteadyTimePoint now);

  // Earliest deadline of a non cancelled task, or SteadyTimePoint::max() if none.
  [[nodiscard]] SteadyTimePoint nextDeadline();

  [[nodiscard]] std::size_t size() const noexcept { return _timers.size(); }

  void clear() noexcept { _timers.clear(); }

 private:
  struct Entry {
    ScheduledTask handle;
    Scheduler::Task task;
  };

  void purgeCancelledFront() noexcept;

  std::multimap<SteadyTimePoint, Entry> _timers;
};

}  // namespace internal

}  // namespace h2rpc
