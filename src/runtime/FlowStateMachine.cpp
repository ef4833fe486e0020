// Repository: StoryReel
// Component: Flow State Machine
// Purpose: Question/outcome sequencing over a PlaybackSession.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/FlowStateMachine.h"

#include <sstream>

#include "storyreel/util/Logger.hpp"

namespace storyreel::runtime {

using storyreel::util::Logger;

const char* FlowStateName(FlowStateMachine::State state) {
  switch (state) {
    case FlowStateMachine::State::kNotStarted: return "NOT_STARTED";
    case FlowStateMachine::State::kPlayingBundle: return "PLAYING_BUNDLE";
    case FlowStateMachine::State::kAwaitingChoice: return "AWAITING_CHOICE";
    case FlowStateMachine::State::kComplete: return "COMPLETE";
  }
  return "UNKNOWN";
}

FlowStateMachine::FlowStateMachine(Sequence sequence,
                                   PlaybackSession& session,
                                   backend::IChoiceUi* choice_ui,
                                   FlowConfig config)
    : sequence_(std::move(sequence)),
      session_(session),
      choice_ui_(choice_ui),
      config_(config) {}

FlowStateMachine::StartResult FlowStateMachine::Start() {
  if (state_ == State::kComplete) {
    return StartResult::Failure(FlowError::kSequenceComplete);
  }
  if (state_ != State::kNotStarted) {
    return StartResult::Failure(FlowError::kAlreadyStarted);
  }

  FlowError error = FlowError::kNone;
  if (sequence_.empty()) {
    error = FlowError::kEmptySequence;
  } else if (!sequence_[0].BundleFor(Phase::kQuestion).HasVideo()) {
    error = FlowError::kMissingQuestionVideo;
  }
  if (error != FlowError::kNone) {
    std::ostringstream oss;
    oss << "[FlowStateMachine] START_REJECTED error=" << FlowErrorToString(error)
        << " questions=" << sequence_.size();
    Logger::Error(oss.str());
    return StartResult::Failure(error);
  }

  current_index_ = 0;
  failures_at_index_ = 0;
  HideChoices();
  {
    std::ostringstream oss;
    oss << "[FlowStateMachine] START questions=" << sequence_.size()
        << " max_failure_retries=" << config_.max_failure_retries;
    Logger::Info(oss.str());
  }
  if (!LoadBundle(Phase::kQuestion)) {
    return StartResult::Failure(FlowError::kMissingQuestionVideo);
  }
  return StartResult::Success();
}

bool FlowStateMachine::OnChoiceMade(Choice choice) {
  if (state_ != State::kAwaitingChoice) {
    ++choices_ignored_;
    std::ostringstream oss;
    oss << "[FlowStateMachine] CHOICE_IGNORED choice=" << ChoiceName(choice)
        << " state=" << FlowStateName(state_);
    Logger::Debug(oss.str());
    return false;
  }

  const Phase outcome =
      choice == Choice::kSuccess ? Phase::kOutcomeSuccess : Phase::kOutcomeFailure;
  {
    std::ostringstream oss;
    oss << "[FlowStateMachine] CHOICE choice=" << ChoiceName(choice)
        << " question_index=" << current_index_;
    Logger::Info(oss.str());
  }
  if (!LoadBundle(outcome)) {
    // Nothing to play for this outcome; the controls stay up.
    return false;
  }
  ++choices_accepted_;
  return true;
}

bool FlowStateMachine::OnBundleFinished(const BundleFinished& finished) {
  if (state_ != State::kPlayingBundle || finished.phase != phase_ ||
      finished.question_index != current_index_) {
    ++finished_ignored_;
    std::ostringstream oss;
    oss << "[FlowStateMachine] FINISHED_IGNORED phase=" << PhaseName(finished.phase)
        << " question_index=" << finished.question_index
        << " state=" << FlowStateName(state_);
    Logger::Debug(oss.str());
    return false;
  }

  switch (phase_) {
    case Phase::kQuestion: {
      TransitionTo(State::kAwaitingChoice);
      ShowChoices();
      std::ostringstream oss;
      oss << "[FlowStateMachine] AWAITING_CHOICE question_index=" << current_index_;
      Logger::Info(oss.str());
      break;
    }
    case Phase::kOutcomeSuccess:
      Advance();
      break;
    case Phase::kOutcomeFailure:
      ++failures_at_index_;
      if (config_.max_failure_retries > 0 &&
          failures_at_index_ > config_.max_failure_retries) {
        std::ostringstream oss;
        oss << "[FlowStateMachine] RETRY_LIMIT_REACHED question_index=" << current_index_
            << " failures=" << failures_at_index_;
        Logger::Info(oss.str());
        Advance();
      } else {
        ++failure_retries_;
        // Question video at this index was checked when it was first loaded.
        LoadBundle(Phase::kQuestion);
      }
      break;
  }
  return true;
}

FlowStateMachine::MetricsSnapshot FlowStateMachine::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.transitions = transitions_;
  snapshot.bundles_loaded = bundles_loaded_;
  snapshot.load_failures = load_failures_;
  snapshot.choices_accepted = choices_accepted_;
  snapshot.choices_ignored = choices_ignored_;
  snapshot.finished_ignored = finished_ignored_;
  snapshot.failure_retries = failure_retries_;
  snapshot.current_index = current_index_;
  snapshot.phase = phase_;
  snapshot.state = state_;
  return snapshot;
}

bool FlowStateMachine::LoadBundle(Phase phase) {
  const MediaBundle& bundle =
      sequence_[static_cast<std::size_t>(current_index_)].BundleFor(phase);
  auto result = session_.Load(bundle, phase, current_index_);
  if (!result.success) {
    ++load_failures_;
    std::ostringstream oss;
    oss << "[FlowStateMachine] LOAD_FAILED error=" << FlowErrorToString(result.error)
        << " phase=" << PhaseName(phase)
        << " question_index=" << current_index_;
    Logger::Error(oss.str());
    return false;
  }

  ++bundles_loaded_;
  phase_ = phase;
  HideChoices();
  TransitionTo(State::kPlayingBundle);
  return true;
}

void FlowStateMachine::Advance() {
  ++current_index_;
  failures_at_index_ = 0;
  const auto index = static_cast<std::size_t>(current_index_);
  if (index < sequence_.size() &&
      sequence_[index].BundleFor(Phase::kQuestion).HasVideo()) {
    LoadBundle(Phase::kQuestion);
    return;
  }
  if (index < sequence_.size()) {
    std::ostringstream oss;
    oss << "[FlowStateMachine] SEQUENCE_TRUNCATED question_index=" << current_index_
        << " error=" << FlowErrorToString(FlowError::kMissingQuestionVideo);
    Logger::Warn(oss.str());
    // Completion is always reported as current_index == sequence length.
    current_index_ = static_cast<int32_t>(sequence_.size());
  }
  Complete();
}

void FlowStateMachine::Complete() {
  session_.Stop();
  HideChoices();
  TransitionTo(State::kComplete);
  std::ostringstream oss;
  oss << "[FlowStateMachine] SEQUENCE_COMPLETE questions_played=" << current_index_
      << " bundles_loaded=" << bundles_loaded_
      << " failure_retries=" << failure_retries_;
  Logger::Info(oss.str());
}

void FlowStateMachine::TransitionTo(State to) {
  ++transitions_[{state_, to}];
  state_ = to;
}

void FlowStateMachine::ShowChoices() {
  if (choice_ui_) choice_ui_->Show();
}

void FlowStateMachine::HideChoices() {
  if (choice_ui_) choice_ui_->Hide();
}

}  // namespace storyreel::runtime
