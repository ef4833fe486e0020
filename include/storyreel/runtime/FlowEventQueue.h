// Repository: StoryReel
// Component: Flow Event Queue
// Purpose: Hand-off of backend and UI signals onto the tick thread.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_FLOW_EVENT_QUEUE_H_
#define STORYREEL_RUNTIME_FLOW_EVENT_QUEUE_H_

#include <cstddef>
#include <mutex>
#include <vector>

#include "storyreel/runtime/FlowTypes.h"

namespace storyreel::runtime {

struct FlowEvent {
  enum class Type {
    kVideoPrepared,
    kVideoFinished,
    kChoiceMade,
  };

  Type type = Type::kVideoPrepared;
  BundleToken token = 0;            // kVideoPrepared / kVideoFinished
  Choice choice = Choice::kSuccess;  // kChoiceMade

  static FlowEvent Prepared(BundleToken t) { return {Type::kVideoPrepared, t, Choice::kSuccess}; }
  static FlowEvent Finished(BundleToken t) { return {Type::kVideoFinished, t, Choice::kSuccess}; }
  static FlowEvent ChoiceMade(Choice c) { return {Type::kChoiceMade, 0, c}; }
};

const char* FlowEventTypeName(FlowEvent::Type type);

// Multi-producer, single-consumer. Producers may be backend worker threads
// or UI callbacks; the tick thread drains everything at the start of a tick
// and processes it in arrival order.
class FlowEventQueue {
 public:
  FlowEventQueue() = default;

  FlowEventQueue(const FlowEventQueue&) = delete;
  FlowEventQueue& operator=(const FlowEventQueue&) = delete;

  void Push(const FlowEvent& event);

  // Moves out every queued event, oldest first.
  std::vector<FlowEvent> Drain();

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<FlowEvent> events_;
};

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_FLOW_EVENT_QUEUE_H_
