// Repository: StoryReel
// Component: Story Player
// Purpose: Wires the event queue, playback session, flow state machine and
//          subtitle driver behind one tick-driven facade.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_STORY_PLAYER_H_
#define STORYREEL_RUNTIME_STORY_PLAYER_H_

#include <atomic>
#include <cstdint>
#include <functional>

#include "storyreel/backend/IAudioBackend.hpp"
#include "storyreel/backend/ICaptionDisplay.hpp"
#include "storyreel/backend/IChoiceUi.hpp"
#include "storyreel/backend/IVideoBackend.hpp"
#include "storyreel/runtime/FlowEventQueue.h"
#include "storyreel/runtime/FlowStateMachine.h"
#include "storyreel/runtime/PlaybackSession.h"
#include "storyreel/runtime/SequenceConfig.h"
#include "storyreel/runtime/SubtitleDriver.h"
#include "storyreel/timing/TickClock.hpp"

namespace storyreel::runtime {

// StoryPlayer
//
// All state changes happen inside Tick(), on the thread that calls it:
//   1. drain the event queue (prepared, finished, choice) in arrival order
//   2. account the tick in the session trace
//   3. poll the caption clock and update the caption display
//
// The video backend's signals and the UI's choices may arrive on any thread;
// they are queued and applied at the start of the next tick.
class StoryPlayer : public backend::IMediaEventSink {
 public:
  enum class RunOutcome {
    kComplete,       // sequence finished
    kTickCeiling,    // max_ticks reached first
    kStopRequested,  // RequestStop() observed
  };

  // Called after every tick with the tick index; lets the host advance
  // backends (e.g. emit finished signals) between ticks.
  using TickHook = std::function<void(int64_t tick_index)>;

  // Backends, display and choice UI are owned by the host and must outlive
  // the player. choice_ui may be null.
  StoryPlayer(const SequenceConfig& config,
              backend::IVideoBackend& video,
              backend::IAudioBackend& narration,
              backend::IAudioBackend& music,
              backend::ICaptionDisplay& display,
              backend::IChoiceUi* choice_ui,
              CaptionSourceFn caption_source);

  ~StoryPlayer() override;

  StoryPlayer(const StoryPlayer&) = delete;
  StoryPlayer& operator=(const StoryPlayer&) = delete;

  FlowStateMachine::StartResult Start();

  // Thread-safe. Applied on the next tick.
  void PostChoice(Choice choice);

  // IMediaEventSink. Thread-safe.
  void OnVideoPrepared(BundleToken token) override;
  void OnVideoFinished(BundleToken token) override;

  // One scheduling step.
  void Tick();

  // Paces Tick() with the clock until completion, max_ticks (0 = no limit)
  // or RequestStop().
  RunOutcome Run(timing::TickClock& clock, int64_t max_ticks,
                 const TickHook& after_tick = TickHook());

  // Thread-safe (signal handlers call it through the host).
  void RequestStop() { stop_requested_.store(true, std::memory_order_release); }

  [[nodiscard]] bool IsComplete() const { return flow_.IsComplete(); }
  [[nodiscard]] int64_t ticks() const { return ticks_; }

  [[nodiscard]] const FlowStateMachine& flow() const { return flow_; }
  [[nodiscard]] const PlaybackSession& session() const { return session_; }
  [[nodiscard]] const SubtitleDriver& subtitles() const { return subtitles_; }

 private:
  void Dispatch(const FlowEvent& event);

  backend::IVideoBackend& video_;
  FlowEventQueue queue_;
  SubtitleDriver subtitles_;
  PlaybackSession session_;
  FlowStateMachine flow_;

  int64_t ticks_ = 0;
  std::atomic<bool> stop_requested_{false};
};

const char* RunOutcomeName(StoryPlayer::RunOutcome outcome);

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_STORY_PLAYER_H_
