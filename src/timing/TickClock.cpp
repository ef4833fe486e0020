// Repository: StoryReel
// Component: Tick Clock
// Purpose: Tick-indexed pacing for the host scheduling loop.
// Copyright (c) 2025 StoryReel

#include "storyreel/timing/TickClock.hpp"

#include <thread>
#include <utility>

namespace storyreel::timing {

static constexpr int64_t kNanosPerSecond = 1'000'000'000;

void SleepingTickWaiter::WaitForDeadline(int64_t /*tick_index*/,
                                         std::chrono::steady_clock::time_point deadline) {
  std::this_thread::sleep_until(deadline);
}

TickClock::TickClock(int64_t rate_num, int64_t rate_den,
                     std::shared_ptr<ITickWaiter> waiter)
    : rate_num_(rate_num),
      rate_den_(rate_den),
      ns_per_tick_whole_((kNanosPerSecond * rate_den) / rate_num),
      ns_per_tick_rem_((kNanosPerSecond * rate_den) % rate_num),
      waiter_(waiter ? std::move(waiter) : std::make_shared<SleepingTickWaiter>()) {}

void TickClock::Start() {
  session_start_ = std::chrono::steady_clock::now();
}

std::chrono::nanoseconds TickClock::DeadlineOffsetNs(int64_t tick_index) const {
  const int64_t whole_ns = tick_index * ns_per_tick_whole_;
  const int64_t rem_ns = (tick_index * ns_per_tick_rem_) / rate_num_;
  return std::chrono::nanoseconds(whole_ns + rem_ns);
}

std::chrono::steady_clock::time_point TickClock::DeadlineFor(
    int64_t tick_index) const {
  return session_start_ + DeadlineOffsetNs(tick_index);
}

void TickClock::WaitForTick(int64_t tick_index) {
  waiter_->WaitForDeadline(tick_index, DeadlineFor(tick_index));
}

double TickClock::TickDurationSeconds() const {
  return static_cast<double>(rate_den_) / static_cast<double>(rate_num_);
}

std::chrono::steady_clock::time_point TickClock::SessionStartTime() const {
  return session_start_;
}

}  // namespace storyreel::timing
