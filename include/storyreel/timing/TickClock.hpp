// Repository: StoryReel
// Component: Tick Clock
// Purpose: Tick-indexed pacing for the host scheduling loop.
// Copyright (c) 2025 StoryReel
//
// TickClock paces the StoryPlayer loop to absolute deadlines keyed by a
// monotonically increasing tick index, so a slow tick never accumulates
// drift into the following ones. One tick is the granularity at which the
// subtitle driver polls the playback clock and the upper bound on
// inter-track start skew.

#ifndef STORYREEL_TIMING_TICK_CLOCK_HPP_
#define STORYREEL_TIMING_TICK_CLOCK_HPP_

#include <chrono>
#include <cstdint>
#include <memory>

namespace storyreel::timing {

// Blocks the host loop until a tick deadline. Tests inject a waiter that
// steps virtual time instead of sleeping.
class ITickWaiter {
 public:
  virtual ~ITickWaiter() = default;
  virtual void WaitForDeadline(int64_t tick_index,
                               std::chrono::steady_clock::time_point deadline) = 0;
};

// Sleeps on the steady clock.
class SleepingTickWaiter : public ITickWaiter {
 public:
  void WaitForDeadline(int64_t tick_index,
                       std::chrono::steady_clock::time_point deadline) override;
};

class TickClock {
 public:
  // Rational tick rate (rate_num/rate_den ticks per second).
  // Both terms must be positive; SequenceConfig bounds them further.
  // A null waiter means SleepingTickWaiter.
  TickClock(int64_t rate_num, int64_t rate_den,
            std::shared_ptr<ITickWaiter> waiter = nullptr);

  // Record session start. Must be called once before WaitForTick().
  void Start();

  // Exact offset of tick N from session start:
  //   offset_ns(N) = N * ns_per_tick_whole_ + (N * ns_per_tick_rem_) / rate_num_
  std::chrono::nanoseconds DeadlineOffsetNs(int64_t tick_index) const;

  // Absolute monotonic deadline for tick N. Pure arithmetic.
  std::chrono::steady_clock::time_point DeadlineFor(int64_t tick_index) const;

  // Wait (via the waiter) until the deadline for tick N.
  void WaitForTick(int64_t tick_index);

  // Tick duration in seconds (diagnostics and headless backend stepping).
  double TickDurationSeconds() const;

  std::chrono::steady_clock::time_point SessionStartTime() const;

 private:
  int64_t rate_num_;
  int64_t rate_den_;
  int64_t ns_per_tick_whole_;
  int64_t ns_per_tick_rem_;
  std::shared_ptr<ITickWaiter> waiter_;
  std::chrono::steady_clock::time_point session_start_;
};

}  // namespace storyreel::timing

#endif  // STORYREEL_TIMING_TICK_CLOCK_HPP_
