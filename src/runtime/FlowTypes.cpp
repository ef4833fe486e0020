// Repository: StoryReel
// Component: Flow Types
// Purpose: String conversions for logging.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/FlowTypes.h"

namespace storyreel::runtime {

const char* FlowErrorToString(FlowError error) {
  switch (error) {
    case FlowError::kNone: return "NONE";
    case FlowError::kEmptySequence: return "EMPTY_SEQUENCE";
    case FlowError::kMissingQuestionVideo: return "MISSING_QUESTION_VIDEO";
    case FlowError::kMissingBundleVideo: return "MISSING_BUNDLE_VIDEO";
    case FlowError::kAlreadyStarted: return "ALREADY_STARTED";
    case FlowError::kSequenceComplete: return "SEQUENCE_COMPLETE";
  }
  return "UNKNOWN";
}

const char* PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kQuestion: return "QUESTION";
    case Phase::kOutcomeSuccess: return "OUTCOME_SUCCESS";
    case Phase::kOutcomeFailure: return "OUTCOME_FAILURE";
  }
  return "UNKNOWN";
}

const char* ChoiceName(Choice choice) {
  switch (choice) {
    case Choice::kSuccess: return "SUCCESS";
    case Choice::kFailure: return "FAILURE";
  }
  return "UNKNOWN";
}

}  // namespace storyreel::runtime
