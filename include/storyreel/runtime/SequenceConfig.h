// Repository: StoryReel
// Component: SequenceConfig Domain
// Purpose: Configuration surface for one StoryPlayer: the question sequence
//          plus caption and retry options.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_SEQUENCE_CONFIG_H_
#define STORYREEL_RUNTIME_SEQUENCE_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>

#include "storyreel/runtime/FlowStateMachine.h"
#include "storyreel/runtime/MediaBundle.h"
#include "storyreel/runtime/PlaybackSession.h"
#include "storyreel/runtime/SubtitleDriver.h"

namespace storyreel::runtime {

// Host tick rate as a rational (e.g. 30/1, 60000/1001).
struct TickRate {
  int64_t num = 30;
  int64_t den = 1;

  // Terms are bounded so the tick period fits TickClock's integer math;
  // the period is at least 1 ms.
  static constexpr int64_t kMaxTerm = 1'000'000;

  bool IsValid() const {
    return num > 0 && den > 0 && num <= kMaxTerm && den <= kMaxTerm &&
           den * 1000 >= num;
  }
  std::string ToString() const;
  // Parses "N/D". Returns empty optional on malformed input.
  static std::optional<TickRate> Parse(const std::string& text);
};

// SequenceConfig is created once at startup and read-only afterwards.
//
// JSON shape:
//   {
//     "caption_time_offset_s": -0.12,
//     "clear_captions_in_gaps": true,
//     "caption_clock": "narration",
//     "max_failure_retries": 0,
//     "tick_rate": "30/1",
//     "questions": [
//       { "question": {"video": "q1.mp4", "narration": "q1.mp3",
//                      "music": "bed.mp3", "captions": "q1.srt"},
//         "success":  {"video": "q1_ok.mp4"},
//         "failure":  {"video": "q1_ko.mp4"} }
//     ]
//   }
// Every key except "questions" is optional.
struct SequenceConfig {
  Sequence questions;
  double caption_time_offset_s = 0.0;
  bool clear_captions_in_gaps = true;
  CaptionClock caption_clock = CaptionClock::kNarration;
  int32_t max_failure_retries = 0;
  TickRate tick_rate;

  // Returns empty optional on parse or validation failure.
  static std::optional<SequenceConfig> FromJson(const std::string& json_str);

  std::string ToJson() const;

  // Non-empty sequence, first question has a video, valid tick rate,
  // non-negative retry cap.
  bool IsValid() const;

  SubtitleDriverConfig subtitle_config() const;
  PlaybackSessionConfig session_config() const;
  FlowConfig flow_config() const;
};

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_SEQUENCE_CONFIG_H_
