// Repository: StoryReel
// Component: Flow Event Queue
// Purpose: Hand-off of backend and UI signals onto the tick thread.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/FlowEventQueue.h"

#include <utility>

namespace storyreel::runtime {

const char* FlowEventTypeName(FlowEvent::Type type) {
  switch (type) {
    case FlowEvent::Type::kVideoPrepared: return "VIDEO_PREPARED";
    case FlowEvent::Type::kVideoFinished: return "VIDEO_FINISHED";
    case FlowEvent::Type::kChoiceMade: return "CHOICE_MADE";
  }
  return "UNKNOWN";
}

void FlowEventQueue::Push(const FlowEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<FlowEvent> FlowEventQueue::Drain() {
  std::vector<FlowEvent> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(events_);
  }
  return drained;
}

std::size_t FlowEventQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

}  // namespace storyreel::runtime
