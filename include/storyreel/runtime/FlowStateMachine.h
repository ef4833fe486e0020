// Repository: StoryReel
// Component: Flow State Machine
// Purpose: Question/outcome sequencing over a PlaybackSession.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_FLOW_STATE_MACHINE_H_
#define STORYREEL_RUNTIME_FLOW_STATE_MACHINE_H_

#include <cstdint>
#include <map>
#include <utility>

#include "storyreel/backend/IChoiceUi.hpp"
#include "storyreel/runtime/FlowTypes.h"
#include "storyreel/runtime/MediaBundle.h"
#include "storyreel/runtime/PlaybackSession.h"

namespace storyreel::runtime {

struct FlowConfig {
  // 0 = a failure outcome always replays the same question.
  // N > 0 = after N replays of one question, the next finished failure
  // outcome advances as a success outcome would.
  int32_t max_failure_retries = 0;
};

// FlowStateMachine
//
// Owns current_index and phase. Transitions:
//   Start                    → load Question[0]
//   choice SUCCESS (awaiting) → load OutcomeSuccess[index]
//   choice FAILURE (awaiting) → load OutcomeFailure[index]
//   finished Question         → awaiting choice, choice UI shown
//   finished OutcomeSuccess   → index+1; load Question[index] or complete
//   finished OutcomeFailure   → reload Question[index]
//
// Choices outside the awaiting state are ignored; the choice UI is hidden
// whenever a bundle is loaded. Awaiting a choice never times out.
class FlowStateMachine {
 public:
  enum class State {
    kNotStarted = 0,
    kPlayingBundle = 1,
    kAwaitingChoice = 2,
    kComplete = 3,
  };

  struct StartResult {
    bool success;
    FlowError error;

    static StartResult Success() { return {true, FlowError::kNone}; }
    static StartResult Failure(FlowError e) { return {false, e}; }
  };

  struct MetricsSnapshot {
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t bundles_loaded = 0;
    uint64_t load_failures = 0;
    uint64_t choices_accepted = 0;
    uint64_t choices_ignored = 0;
    uint64_t finished_ignored = 0;
    uint64_t failure_retries = 0;
    int32_t current_index = 0;
    Phase phase = Phase::kQuestion;
    State state = State::kNotStarted;
  };

  // choice_ui may be null (headless use).
  FlowStateMachine(Sequence sequence,
                   PlaybackSession& session,
                   backend::IChoiceUi* choice_ui,
                   FlowConfig config = FlowConfig());

  FlowStateMachine(const FlowStateMachine&) = delete;
  FlowStateMachine& operator=(const FlowStateMachine&) = delete;

  StartResult Start();

  // Returns false when the choice was ignored or its bundle failed to load.
  bool OnChoiceMade(Choice choice);

  // Returns false when the event does not match the bundle in flight.
  bool OnBundleFinished(const BundleFinished& finished);

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] int32_t current_index() const { return current_index_; }
  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] bool IsAwaitingChoice() const { return state_ == State::kAwaitingChoice; }
  [[nodiscard]] bool IsComplete() const { return state_ == State::kComplete; }
  [[nodiscard]] int32_t failures_at_current_index() const { return failures_at_index_; }
  [[nodiscard]] std::size_t sequence_length() const { return sequence_.size(); }
  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  bool LoadBundle(Phase phase);
  void Advance();
  void Complete();
  void TransitionTo(State to);
  void ShowChoices();
  void HideChoices();

  Sequence sequence_;
  PlaybackSession& session_;
  backend::IChoiceUi* choice_ui_;
  FlowConfig config_;

  State state_ = State::kNotStarted;
  int32_t current_index_ = 0;
  Phase phase_ = Phase::kQuestion;
  int32_t failures_at_index_ = 0;

  std::map<std::pair<State, State>, uint64_t> transitions_;
  uint64_t bundles_loaded_ = 0;
  uint64_t load_failures_ = 0;
  uint64_t choices_accepted_ = 0;
  uint64_t choices_ignored_ = 0;
  uint64_t finished_ignored_ = 0;
  uint64_t failure_retries_ = 0;
};

const char* FlowStateName(FlowStateMachine::State state);

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_FLOW_STATE_MACHINE_H_
