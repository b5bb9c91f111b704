#pragma once

#include <chrono>

namespace h2rpc {

/// Timers and deadlines are expressed on the steady clock, as connection lifecycle decisions
/// must not be affected by wall clock adjustments.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

/// Backoff arithmetic (multiplier, jitter) is performed on fractional seconds.
using FloatingSeconds = std::chrono::duration<double>;

}  // namespace h2rpc
