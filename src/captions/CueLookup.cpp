// Repository: StoryReel
// Component: Cue Lookup
// Purpose: O(log n) queries over a sorted cue list, run on every tick.
// Copyright (c) 2025 StoryReel

#include "storyreel/captions/CueLookup.hpp"

#include <algorithm>
#include <cmath>

namespace storyreel::captions {

std::optional<std::size_t> Locate(const CueList& cues, double t) {
  if (cues.empty() || !std::isfinite(t)) {
    return std::nullopt;
  }

  std::size_t lo = 0;
  std::size_t hi = cues.size();  // half-open [lo, hi)
  while (lo < hi) {
    const std::size_t mid = lo + (hi - lo) / 2;
    const Cue& c = cues[mid];
    if (t < c.start_s) {
      hi = mid;
    } else if (t > c.end_s) {
      lo = mid + 1;
    } else {
      return mid;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> LastStartAtOrBefore(const CueList& cues, double t) {
  if (cues.empty() || !std::isfinite(t)) {
    return std::nullopt;
  }

  // First cue starting after t; the answer is the one before it.
  const auto after = std::upper_bound(
      cues.begin(), cues.end(), t,
      [](double time, const Cue& cue) { return time < cue.start_s; });
  if (after == cues.begin()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(after - cues.begin()) - 1;
}

}  // namespace storyreel::captions
