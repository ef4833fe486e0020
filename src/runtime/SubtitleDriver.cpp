// Repository: StoryReel
// Component: Subtitle Driver
// Purpose: Per-tick mapping of the playback clock to the visible caption.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/SubtitleDriver.h"

#include <cmath>
#include <utility>

#include "storyreel/captions/CueLookup.hpp"

namespace storyreel::runtime {

SubtitleDriver::SubtitleDriver(backend::ICaptionDisplay& display,
                               SubtitleDriverConfig config)
    : display_(display), config_(config) {
  display_.SetText(std::string());
}

void SubtitleDriver::LoadCues(captions::CueList cues) {
  cues_ = std::move(cues);
  active_index_.reset();
  gap_after_index_.reset();
  Show(std::string());
}

void SubtitleDriver::Clear() {
  LoadCues(captions::CueList());
}

void SubtitleDriver::Tick(std::optional<double> clock_seconds) {
  if (cues_.empty()) {
    Show(std::string());
    return;
  }
  if (!clock_seconds.has_value() || !std::isfinite(*clock_seconds)) {
    return;
  }
  const double t = *clock_seconds + config_.time_offset_s;

  if (active_index_.has_value()) {
    if (cues_[*active_index_].Contains(t)) {
      return;
    }
    // Left the cue: no stale text into the gap.
    if (config_.clear_in_gaps) {
      Show(std::string());
    }
    active_index_.reset();
  } else if (gap_after_index_.has_value() && InGapAfter(*gap_after_index_, t)) {
    return;
  }

  ++lookups_;
  auto found = captions::Locate(cues_, t);
  if (found.has_value()) {
    active_index_ = found;
    gap_after_index_.reset();
    Show(cues_[*found].text);
    return;
  }

  gap_after_index_ = captions::LastStartAtOrBefore(cues_, t);
  if (config_.clear_in_gaps) {
    Show(std::string());
  }
}

bool SubtitleDriver::InGapAfter(std::size_t index, double t) const {
  if (t <= cues_[index].end_s) {
    return false;
  }
  const std::size_t next = index + 1;
  return next >= cues_.size() || t < cues_[next].start_s;
}

void SubtitleDriver::Show(const std::string& text) {
  if (text == displayed_) {
    return;
  }
  displayed_ = text;
  ++caption_changes_;
  display_.SetText(displayed_);
}

}  // namespace storyreel::runtime
