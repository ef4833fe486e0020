// Repository: StoryReel
// Component: Cue Lookup
// Purpose: O(log n) queries over a sorted cue list, run on every tick.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_CAPTIONS_CUE_LOOKUP_HPP_
#define STORYREEL_CAPTIONS_CUE_LOOKUP_HPP_

#include <cstddef>
#include <optional>

#include "storyreel/captions/Cue.hpp"

namespace storyreel::captions {

// Index of a cue with start_s <= t <= end_s, or nullopt.
// Overlapping cues: whichever containing cue the search lands on.
// Non-finite t never matches.
std::optional<std::size_t> Locate(const CueList& cues, double t);

// Highest index whose start_s <= t, or nullopt when t precedes every cue.
std::optional<std::size_t> LastStartAtOrBefore(const CueList& cues, double t);

}  // namespace storyreel::captions

#endif  // STORYREEL_CAPTIONS_CUE_LOOKUP_HPP_
