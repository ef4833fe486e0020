// Repository: StoryReel
// Component: Playback Session
// Purpose: Multi-track playback protocol for one media bundle.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_PLAYBACK_SESSION_H_
#define STORYREEL_RUNTIME_PLAYBACK_SESSION_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "storyreel/backend/IAudioBackend.hpp"
#include "storyreel/backend/IVideoBackend.hpp"
#include "storyreel/runtime/FlowTypes.h"
#include "storyreel/runtime/MediaBundle.h"
#include "storyreel/runtime/SubtitleDriver.h"
#include "storyreel/trace/PlaybackTraceTypes.hpp"

namespace storyreel::runtime {

// Which track position drives captions.
enum class CaptionClock {
  kNarration,  // narration position while it plays, else video position
  kVideo,
};

const char* CaptionClockName(CaptionClock clock);

// Resolves a caption reference to its document text; nullopt if unreadable.
using CaptionSourceFn =
    std::function<std::optional<std::string>(const std::string& uri)>;

struct PlaybackSessionConfig {
  CaptionClock caption_clock = CaptionClock::kNarration;
};

// PlaybackSession
//
// Drives one bundle at a time through:
//   Load      → stop previous, assign audio clips, load captions, Prepare(token)
//   kPreparing → OnPrepared(token): rewind audio, start video+narration+music
//   kPlaying  → OnFinished(token): emit BundleFinished, back to kIdle
//
// Every load issues a fresh token. Prepared/finished signals carrying any
// other token belong to a superseded load and are discarded. A prepare that
// never completes leaves the session in kPreparing until the next Load/Stop.
//
// Not thread-safe: all calls happen on the tick thread.
class PlaybackSession {
 public:
  enum class State {
    kIdle,
    kPreparing,
    kPlaying,
  };

  struct LoadResult {
    bool success;
    FlowError error;
    BundleToken token;  // 0 on failure

    static LoadResult Success(BundleToken t) { return {true, FlowError::kNone, t}; }
    static LoadResult Failure(FlowError e) { return {false, e, 0}; }
  };

  struct MetricsSnapshot {
    uint64_t loads_total = 0;
    uint64_t loads_rejected = 0;
    uint64_t stale_signals_discarded = 0;
    uint64_t bundles_completed = 0;
    uint64_t bundles_superseded = 0;
    State state = State::kIdle;
  };

  PlaybackSession(backend::IVideoBackend& video,
                  backend::IAudioBackend& narration,
                  backend::IAudioBackend& music,
                  SubtitleDriver& subtitles,
                  CaptionSourceFn caption_source,
                  PlaybackSessionConfig config = PlaybackSessionConfig());

  PlaybackSession(const PlaybackSession&) = delete;
  PlaybackSession& operator=(const PlaybackSession&) = delete;

  // Rejects a bundle without video before touching any track.
  LoadResult Load(const MediaBundle& bundle, Phase phase, int32_t question_index);

  // Returns false (and changes nothing) for a stale or unexpected signal.
  bool OnPrepared(BundleToken token);

  // Returns the finished event, or nullopt for a stale or unexpected signal.
  std::optional<BundleFinished> OnFinished(BundleToken token);

  // Stop all tracks, clear captions and invalidate the current token.
  void Stop();

  // Called once per host tick; accounts playing time for the trace.
  void OnTick();

  // Authoritative caption clock while playing; nullopt otherwise.
  [[nodiscard]] std::optional<double> PlaybackClockSeconds() const;

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] BundleToken current_token() const { return token_; }
  [[nodiscard]] Phase active_phase() const { return phase_; }
  [[nodiscard]] int32_t active_question_index() const { return question_index_; }
  [[nodiscard]] MetricsSnapshot Snapshot() const;

  // Summary of the most recently finished or superseded bundle.
  [[nodiscard]] const std::optional<trace::BundlePlaybackSummary>& last_summary() const {
    return last_summary_;
  }

 private:
  void StopTracks();
  void LoadCaptions(const MediaBundle& bundle);
  void FinalizeSummary(bool completed);
  void DiscardStale(const char* signal, BundleToken token);

  backend::IVideoBackend& video_;
  backend::IAudioBackend& narration_;
  backend::IAudioBackend& music_;
  SubtitleDriver& subtitles_;
  CaptionSourceFn caption_source_;
  PlaybackSessionConfig config_;

  State state_ = State::kIdle;
  BundleToken next_token_ = 1;
  BundleToken token_ = 0;  // 0 = no live load
  Phase phase_ = Phase::kQuestion;
  int32_t question_index_ = 0;

  trace::BundlePlaybackSummary summary_;
  int64_t caption_changes_at_load_ = 0;
  std::optional<trace::BundlePlaybackSummary> last_summary_;

  uint64_t loads_total_ = 0;
  uint64_t loads_rejected_ = 0;
  uint64_t stale_signals_discarded_ = 0;
  uint64_t bundles_completed_ = 0;
  uint64_t bundles_superseded_ = 0;
};

const char* SessionStateName(PlaybackSession::State state);

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_PLAYBACK_SESSION_H_
