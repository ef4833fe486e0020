// Repository: StoryReel
// Component: Caption Cue
// Purpose: One timed caption entry.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_CAPTIONS_CUE_HPP_
#define STORYREEL_CAPTIONS_CUE_HPP_

#include <string>
#include <vector>

namespace storyreel::captions {

// Closed interval [start_s, end_s] in seconds of playback time.
// Invariant: end_s >= start_s.
struct Cue {
  double start_s = 0.0;
  double end_s = 0.0;
  std::string text;

  bool Contains(double t) const { return t >= start_s && t <= end_s; }
};

// Cue lists are always sorted ascending by start_s.
using CueList = std::vector<Cue>;

}  // namespace storyreel::captions

#endif  // STORYREEL_CAPTIONS_CUE_HPP_
