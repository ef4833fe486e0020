// Repository: StoryReel
// Component: Headless Audio Backend
// Purpose: Clock-driven stand-in for one audio track.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_HEADLESS_AUDIO_BACKEND_HPP_
#define STORYREEL_BACKEND_HEADLESS_AUDIO_BACKEND_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "storyreel/backend/HeadlessVideoBackend.hpp"
#include "storyreel/backend/IAudioBackend.hpp"
#include "storyreel/timing/ITimeSource.hpp"

namespace storyreel::backend {

// The track runs out on its own: IsPlaying() turns false once the position
// reaches the clip duration. A clip with an unknown duration never plays.
// SetClip() resolves the duration inline, so the resolver should be a
// lookup (see CacheClipDurations). Tick thread only.
class HeadlessAudioBackend : public IAudioBackend {
 public:
  // name tags log lines ("narration", "music").
  HeadlessAudioBackend(std::string name,
                       const timing::ITimeSource& time_source,
                       ClipDurationFn durations);

  void SetClip(const std::string& uri) override;
  bool HasClip() const override { return !clip_uri_.empty(); }

  void Play() override;
  void Stop() override;
  void SetTime(double seconds) override;
  double CurrentTime() const override;
  bool IsPlaying() const override;

  const std::string& clip_uri() const { return clip_uri_; }

 private:
  double Elapsed() const;

  std::string name_;
  const timing::ITimeSource& time_source_;
  ClipDurationFn durations_;

  std::string clip_uri_;
  double duration_s_ = 0.0;
  bool playing_ = false;
  int64_t play_start_ns_ = 0;
  double position_s_ = 0.0;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_HEADLESS_AUDIO_BACKEND_HPP_
