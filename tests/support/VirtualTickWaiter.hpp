// Repository: StoryReel
// Component: Virtual Tick Waiter (test only)
// Purpose: Moves a DeterministicTimeSource forward to each tick deadline
//          instead of sleeping.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_TESTS_SUPPORT_VIRTUAL_TICK_WAITER_HPP_
#define STORYREEL_TESTS_SUPPORT_VIRTUAL_TICK_WAITER_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "storyreel/timing/TickClock.hpp"

namespace storyreel::timing {

// The first deadline waited on is anchored to the time source's current
// reading. Later deadlines move the time source to the same distance from
// that anchor; time the test advanced on its own is never counted twice.
class VirtualTickWaiter : public ITickWaiter {
 public:
  explicit VirtualTickWaiter(std::shared_ptr<DeterministicTimeSource> ts)
      : ts_(std::move(ts)) {}

  void WaitForDeadline(int64_t tick_index,
                       std::chrono::steady_clock::time_point deadline) override {
    waited_ticks_.push_back(tick_index);
    if (!anchored_) {
      anchor_deadline_ = deadline;
      anchor_ns_ = ts_->NowMonotonicNs();
      anchored_ = true;
      return;
    }
    const int64_t target_ns =
        anchor_ns_ + std::chrono::duration_cast<std::chrono::nanoseconds>(
                         deadline - anchor_deadline_).count();
    const int64_t now_ns = ts_->NowMonotonicNs();
    if (target_ns > now_ns) {
      ts_->AdvanceNs(target_ns - now_ns);
    }
  }

  const std::vector<int64_t>& waited_ticks() const { return waited_ticks_; }

 private:
  std::shared_ptr<DeterministicTimeSource> ts_;
  bool anchored_ = false;
  std::chrono::steady_clock::time_point anchor_deadline_{};
  int64_t anchor_ns_ = 0;
  std::vector<int64_t> waited_ticks_;
};

}  // namespace storyreel::timing

#endif  // STORYREEL_TESTS_SUPPORT_VIRTUAL_TICK_WAITER_HPP_
