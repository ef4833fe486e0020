// Repository: StoryReel
// Component: Time Source Interface
// Purpose: Monotonic time for the headless backends. System vs deterministic (tests).
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_TIMING_ITIME_SOURCE_HPP_
#define STORYREEL_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace storyreel::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMonotonicNs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMonotonicNs() const override {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace storyreel::timing

#endif  // STORYREEL_TIMING_ITIME_SOURCE_HPP_
