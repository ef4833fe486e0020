// Repository: StoryReel
// Component: Flow Types
// Purpose: Phase, choice and error vocabulary shared by the runtime.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_FLOW_TYPES_H_
#define STORYREEL_RUNTIME_FLOW_TYPES_H_

#include <cstddef>
#include <cstdint>

#include "storyreel/backend/IVideoBackend.hpp"

namespace storyreel::runtime {

using backend::BundleToken;

// Which part of the current question is active. Doubles as the index into
// QuestionSet::bundles.
enum class Phase : int32_t {
  kQuestion = 0,
  kOutcomeSuccess = 1,
  kOutcomeFailure = 2,
};

constexpr std::size_t kPhaseCount = 3;

enum class Choice : int32_t {
  kSuccess = 0,
  kFailure = 1,
};

enum class FlowError {
  kNone = 0,

  // Sequence has no questions.
  kEmptySequence,

  // Question bundle at the start index has no video reference.
  kMissingQuestionVideo,

  // A bundle handed to the session has no video reference.
  kMissingBundleVideo,

  // Start() called on a running flow.
  kAlreadyStarted,

  // Start() called after the sequence completed.
  kSequenceComplete,
};

const char* FlowErrorToString(FlowError error);
const char* PhaseName(Phase phase);
const char* ChoiceName(Choice choice);

// Emitted by the session when the active bundle's clip reaches its end.
struct BundleFinished {
  BundleToken token = 0;
  Phase phase = Phase::kQuestion;
  int32_t question_index = 0;
};

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_FLOW_TYPES_H_
