// Repository: StoryReel
// Component: Headless Audio Backend
// Purpose: Clock-driven stand-in for one audio track.
// Copyright (c) 2025 StoryReel

#include "storyreel/backend/HeadlessAudioBackend.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "storyreel/util/Logger.hpp"

namespace storyreel::backend {

using storyreel::util::Logger;

namespace {
constexpr double kNsPerSecond = 1'000'000'000.0;
}  // namespace

HeadlessAudioBackend::HeadlessAudioBackend(std::string name,
                                           const timing::ITimeSource& time_source,
                                           ClipDurationFn durations)
    : name_(std::move(name)), time_source_(time_source), durations_(std::move(durations)) {}

void HeadlessAudioBackend::SetClip(const std::string& uri) {
  playing_ = false;
  position_s_ = 0.0;
  duration_s_ = 0.0;
  clip_uri_ = uri;
  if (clip_uri_.empty()) return;

  std::optional<double> duration;
  if (durations_) {
    duration = durations_(clip_uri_);
  }
  if (!duration.has_value() || *duration <= 0.0) {
    std::ostringstream oss;
    oss << "[HeadlessAudioBackend] CLIP_SILENT track=" << name_ << " uri=" << clip_uri_
        << " reason=no_duration";
    Logger::Warn(oss.str());
    return;
  }
  duration_s_ = *duration;
}

void HeadlessAudioBackend::Play() {
  if (clip_uri_.empty() || playing_) return;
  playing_ = true;
  play_start_ns_ = time_source_.NowMonotonicNs() -
                   static_cast<int64_t>(position_s_ * kNsPerSecond);
}

void HeadlessAudioBackend::Stop() {
  position_s_ = CurrentTime();
  playing_ = false;
}

void HeadlessAudioBackend::SetTime(double seconds) {
  const double clamped = std::clamp(seconds, 0.0, duration_s_);
  if (playing_) {
    play_start_ns_ = time_source_.NowMonotonicNs() -
                     static_cast<int64_t>(clamped * kNsPerSecond);
  } else {
    position_s_ = clamped;
  }
}

double HeadlessAudioBackend::CurrentTime() const {
  if (!playing_) return position_s_;
  return std::min(Elapsed(), duration_s_);
}

bool HeadlessAudioBackend::IsPlaying() const {
  return playing_ && Elapsed() < duration_s_;
}

double HeadlessAudioBackend::Elapsed() const {
  return static_cast<double>(time_source_.NowMonotonicNs() - play_start_ns_) / kNsPerSecond;
}

}  // namespace storyreel::backend
