// Repository: StoryReel
// Component: Subtitle Driver
// Purpose: Per-tick mapping of the playback clock to the visible caption.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_SUBTITLE_DRIVER_H_
#define STORYREEL_RUNTIME_SUBTITLE_DRIVER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "storyreel/backend/ICaptionDisplay.hpp"
#include "storyreel/captions/Cue.hpp"

namespace storyreel::runtime {

struct SubtitleDriverConfig {
  // Added to the playback clock before lookup; compensates backend latency.
  double time_offset_s = 0.0;
  // When false the last caption stays up across gaps until the next cue.
  bool clear_in_gaps = true;
};

// SubtitleDriver owns the active cue list and the last-cue bookkeeping. The
// list is replaced wholesale on every bundle load; nothing else mutates it.
//
// Tick() is the only polling component of the runtime: the backend has no
// "cue changed" event, so the clock is sampled once per tick. The display is
// written only when the visible text changes.
class SubtitleDriver {
 public:
  SubtitleDriver(backend::ICaptionDisplay& display, SubtitleDriverConfig config);

  SubtitleDriver(const SubtitleDriver&) = delete;
  SubtitleDriver& operator=(const SubtitleDriver&) = delete;

  // Replace the cue list (sorted by start). Clears the display.
  void LoadCues(captions::CueList cues);

  // Drop all cues. Clears the display.
  void Clear();

  // clock_seconds is nullopt while media is not prepared; the display is
  // then left as is.
  void Tick(std::optional<double> clock_seconds);

  [[nodiscard]] std::size_t cue_count() const { return cues_.size(); }
  [[nodiscard]] std::optional<std::size_t> active_index() const { return active_index_; }
  [[nodiscard]] const std::string& displayed_text() const { return displayed_; }
  [[nodiscard]] int64_t caption_changes() const { return caption_changes_; }
  [[nodiscard]] int64_t lookups() const { return lookups_; }
  [[nodiscard]] const SubtitleDriverConfig& config() const { return config_; }

 private:
  void Show(const std::string& text);
  bool InGapAfter(std::size_t index, double t) const;

  backend::ICaptionDisplay& display_;
  SubtitleDriverConfig config_;

  captions::CueList cues_;
  // Cue whose text is currently displayed (or was, with clear_in_gaps off).
  std::optional<std::size_t> active_index_;
  // Last cue passed when t is in a gap; skips searching while t stays there.
  std::optional<std::size_t> gap_after_index_;

  std::string displayed_;
  int64_t caption_changes_ = 0;
  int64_t lookups_ = 0;
};

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_SUBTITLE_DRIVER_H_
