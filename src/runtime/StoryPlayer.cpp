// Repository: StoryReel
// Component: Story Player
// Purpose: Wires the event queue, playback session, flow state machine and
//          subtitle driver behind one tick-driven facade.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/StoryPlayer.h"

#include <sstream>
#include <utility>

#include "storyreel/util/Logger.hpp"

namespace storyreel::runtime {

using storyreel::util::Logger;

const char* RunOutcomeName(StoryPlayer::RunOutcome outcome) {
  switch (outcome) {
    case StoryPlayer::RunOutcome::kComplete: return "COMPLETE";
    case StoryPlayer::RunOutcome::kTickCeiling: return "TICK_CEILING";
    case StoryPlayer::RunOutcome::kStopRequested: return "STOP_REQUESTED";
  }
  return "UNKNOWN";
}

StoryPlayer::StoryPlayer(const SequenceConfig& config,
                         backend::IVideoBackend& video,
                         backend::IAudioBackend& narration,
                         backend::IAudioBackend& music,
                         backend::ICaptionDisplay& display,
                         backend::IChoiceUi* choice_ui,
                         CaptionSourceFn caption_source)
    : video_(video),
      subtitles_(display, config.subtitle_config()),
      session_(video, narration, music, subtitles_, std::move(caption_source),
               config.session_config()),
      flow_(config.questions, session_, choice_ui, config.flow_config()) {
  video_.SetEventSink(this);
}

StoryPlayer::~StoryPlayer() {
  video_.SetEventSink(nullptr);
}

FlowStateMachine::StartResult StoryPlayer::Start() {
  return flow_.Start();
}

void StoryPlayer::PostChoice(Choice choice) {
  queue_.Push(FlowEvent::ChoiceMade(choice));
}

void StoryPlayer::OnVideoPrepared(BundleToken token) {
  queue_.Push(FlowEvent::Prepared(token));
}

void StoryPlayer::OnVideoFinished(BundleToken token) {
  queue_.Push(FlowEvent::Finished(token));
}

void StoryPlayer::Tick() {
  for (const FlowEvent& event : queue_.Drain()) {
    Dispatch(event);
  }
  session_.OnTick();
  subtitles_.Tick(session_.PlaybackClockSeconds());
  ++ticks_;
}

StoryPlayer::RunOutcome StoryPlayer::Run(timing::TickClock& clock, int64_t max_ticks,
                                         const TickHook& after_tick) {
  clock.Start();
  int64_t tick_index = 0;
  RunOutcome outcome = RunOutcome::kComplete;
  while (true) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      outcome = RunOutcome::kStopRequested;
      break;
    }
    if (flow_.IsComplete()) {
      outcome = RunOutcome::kComplete;
      break;
    }
    if (max_ticks > 0 && tick_index >= max_ticks) {
      outcome = RunOutcome::kTickCeiling;
      break;
    }
    clock.WaitForTick(tick_index);
    Tick();
    if (after_tick) {
      after_tick(tick_index);
    }
    ++tick_index;
  }

  std::ostringstream oss;
  oss << "[StoryPlayer] RUN_END outcome=" << RunOutcomeName(outcome)
      << " ticks=" << tick_index
      << " index=" << flow_.current_index()
      << " state=" << FlowStateName(flow_.state());
  Logger::Info(oss.str());
  return outcome;
}

void StoryPlayer::Dispatch(const FlowEvent& event) {
  {
    std::ostringstream oss;
    oss << "[StoryPlayer] EVENT type=" << FlowEventTypeName(event.type);
    if (event.type == FlowEvent::Type::kChoiceMade) {
      oss << " choice=" << ChoiceName(event.choice);
    } else {
      oss << " token=" << event.token;
    }
    Logger::Debug(oss.str());
  }
  switch (event.type) {
    case FlowEvent::Type::kVideoPrepared:
      session_.OnPrepared(event.token);
      break;
    case FlowEvent::Type::kVideoFinished: {
      auto finished = session_.OnFinished(event.token);
      if (finished.has_value()) {
        flow_.OnBundleFinished(*finished);
      }
      break;
    }
    case FlowEvent::Type::kChoiceMade:
      flow_.OnChoiceMade(event.choice);
      break;
  }
}

}  // namespace storyreel::runtime
