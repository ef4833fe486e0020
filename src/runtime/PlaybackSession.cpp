// Repository: StoryReel
// Component: Playback Session
// Purpose: Multi-track playback protocol for one media bundle.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/PlaybackSession.h"

#include <sstream>
#include <utility>

#include "storyreel/captions/CaptionParser.hpp"
#include "storyreel/util/Logger.hpp"

namespace storyreel::runtime {

using storyreel::util::Logger;

const char* CaptionClockName(CaptionClock clock) {
  switch (clock) {
    case CaptionClock::kNarration: return "narration";
    case CaptionClock::kVideo: return "video";
  }
  return "unknown";
}

const char* SessionStateName(PlaybackSession::State state) {
  switch (state) {
    case PlaybackSession::State::kIdle: return "IDLE";
    case PlaybackSession::State::kPreparing: return "PREPARING";
    case PlaybackSession::State::kPlaying: return "PLAYING";
  }
  return "UNKNOWN";
}

PlaybackSession::PlaybackSession(backend::IVideoBackend& video,
                                 backend::IAudioBackend& narration,
                                 backend::IAudioBackend& music,
                                 SubtitleDriver& subtitles,
                                 CaptionSourceFn caption_source,
                                 PlaybackSessionConfig config)
    : video_(video),
      narration_(narration),
      music_(music),
      subtitles_(subtitles),
      caption_source_(std::move(caption_source)),
      config_(config) {}

PlaybackSession::LoadResult PlaybackSession::Load(const MediaBundle& bundle,
                                                  Phase phase,
                                                  int32_t question_index) {
  if (!bundle.HasVideo()) {
    ++loads_rejected_;
    std::ostringstream oss;
    oss << "[PlaybackSession] LOAD_REJECTED error="
        << FlowErrorToString(FlowError::kMissingBundleVideo)
        << " phase=" << PhaseName(phase)
        << " question_index=" << question_index;
    Logger::Warn(oss.str());
    return LoadResult::Failure(FlowError::kMissingBundleVideo);
  }

  // No overlap: the previous bundle is fully stopped before anything is assigned.
  StopTracks();
  if (state_ != State::kIdle) {
    FinalizeSummary(false);
  }

  narration_.SetClip(bundle.narration_uri);
  music_.SetClip(bundle.music_uri);
  if (narration_.HasClip()) narration_.SetTime(0.0);
  if (music_.HasClip()) music_.SetTime(0.0);

  token_ = next_token_++;
  phase_ = phase;
  question_index_ = question_index;
  state_ = State::kPreparing;
  ++loads_total_;

  summary_ = trace::BundlePlaybackSummary();
  summary_.token = token_;
  summary_.phase = phase;
  summary_.question_index = question_index;
  summary_.video_uri = bundle.video_uri;
  summary_.narration = bundle.HasNarration();
  summary_.music = bundle.HasMusic();

  video_.SetClip(bundle.video_uri);
  LoadCaptions(bundle);
  caption_changes_at_load_ = subtitles_.caption_changes();

  {
    std::ostringstream oss;
    oss << "[PlaybackSession] BUNDLE_LOAD token=" << token_
        << " phase=" << PhaseName(phase)
        << " question_index=" << question_index
        << " video=" << bundle.video_uri
        << " narration=" << (bundle.HasNarration() ? bundle.narration_uri : "-")
        << " music=" << (bundle.HasMusic() ? bundle.music_uri : "-")
        << " cues=" << summary_.cue_count;
    Logger::Info(oss.str());
  }

  video_.Prepare(token_);
  return LoadResult::Success(token_);
}

bool PlaybackSession::OnPrepared(BundleToken token) {
  if (state_ != State::kPreparing || token != token_) {
    DiscardStale("prepared", token);
    return false;
  }

  // All three tracks start inside this call so skew stays below one tick.
  if (narration_.HasClip()) narration_.SetTime(0.0);
  if (music_.HasClip()) music_.SetTime(0.0);
  video_.Play();
  if (narration_.HasClip()) narration_.Play();
  if (music_.HasClip()) music_.Play();
  state_ = State::kPlaying;

  std::ostringstream oss;
  oss << "[PlaybackSession] PLAY_ALL token=" << token_
      << " phase=" << PhaseName(phase_)
      << " question_index=" << question_index_;
  Logger::Info(oss.str());
  return true;
}

std::optional<BundleFinished> PlaybackSession::OnFinished(BundleToken token) {
  if (state_ != State::kPlaying || token != token_) {
    DiscardStale("finished", token);
    return std::nullopt;
  }

  BundleFinished finished;
  finished.token = token_;
  finished.phase = phase_;
  finished.question_index = question_index_;

  // Audio tracks run out on their own; the next Load stops them.
  state_ = State::kIdle;
  FinalizeSummary(true);
  return finished;
}

void PlaybackSession::Stop() {
  StopTracks();
  if (state_ != State::kIdle) {
    FinalizeSummary(false);
  }
  state_ = State::kIdle;
  token_ = 0;
  subtitles_.Clear();
}

void PlaybackSession::OnTick() {
  if (state_ == State::kPlaying) {
    ++summary_.ticks_played;
  }
}

std::optional<double> PlaybackSession::PlaybackClockSeconds() const {
  if (state_ != State::kPlaying) {
    return std::nullopt;
  }
  if (config_.caption_clock == CaptionClock::kNarration &&
      narration_.HasClip() && narration_.IsPlaying()) {
    return narration_.CurrentTime();
  }
  return video_.CurrentTime();
}

PlaybackSession::MetricsSnapshot PlaybackSession::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.loads_total = loads_total_;
  snapshot.loads_rejected = loads_rejected_;
  snapshot.stale_signals_discarded = stale_signals_discarded_;
  snapshot.bundles_completed = bundles_completed_;
  snapshot.bundles_superseded = bundles_superseded_;
  snapshot.state = state_;
  return snapshot;
}

void PlaybackSession::StopTracks() {
  video_.Stop();
  if (narration_.IsPlaying()) narration_.Stop();
  if (music_.IsPlaying()) music_.Stop();
}

void PlaybackSession::LoadCaptions(const MediaBundle& bundle) {
  if (!bundle.HasCaptions()) {
    subtitles_.Clear();
    return;
  }

  std::optional<std::string> document;
  if (caption_source_) {
    document = caption_source_(bundle.captions_uri);
  }
  if (!document.has_value()) {
    std::ostringstream oss;
    oss << "[PlaybackSession] CAPTIONS_UNAVAILABLE uri=" << bundle.captions_uri
        << " token=" << token_;
    Logger::Warn(oss.str());
    subtitles_.Clear();
    return;
  }

  summary_.captions_crc32 = trace::CRC32CaptionDocument(*document);
  auto cues = captions::ParseCaptions(*document);
  summary_.cue_count = static_cast<int64_t>(cues.size());
  subtitles_.LoadCues(std::move(cues));
}

void PlaybackSession::FinalizeSummary(bool completed) {
  summary_.completed = completed;
  summary_.caption_changes = subtitles_.caption_changes() - caption_changes_at_load_;
  if (completed) {
    ++bundles_completed_;
  } else {
    ++bundles_superseded_;
  }
  Logger::Info("[PlaybackSession] BUNDLE_SUMMARY " + trace::FormatBundleSummary(summary_));
  last_summary_ = summary_;
}

void PlaybackSession::DiscardStale(const char* signal, BundleToken token) {
  ++stale_signals_discarded_;
  std::ostringstream oss;
  oss << "[PlaybackSession] STALE_SIGNAL_DISCARDED signal=" << signal
      << " token=" << token
      << " current_token=" << token_
      << " state=" << SessionStateName(state_);
  Logger::Debug(oss.str());
}

}  // namespace storyreel::runtime
