// Repository: StoryReel
// Component: Media Bundle
// Purpose: Passive records of the media references for one narrative step.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_RUNTIME_MEDIA_BUNDLE_H_
#define STORYREEL_RUNTIME_MEDIA_BUNDLE_H_

#include <array>
#include <string>
#include <vector>

#include "storyreel/runtime/FlowTypes.h"

namespace storyreel::runtime {

// References for one phase of one question. Empty string = absent.
// Only the video is required to play; absent optional tracks stay silent.
struct MediaBundle {
  std::string video_uri;
  std::string narration_uri;
  std::string music_uri;
  std::string captions_uri;

  bool HasVideo() const { return !video_uri.empty(); }
  bool HasNarration() const { return !narration_uri.empty(); }
  bool HasMusic() const { return !music_uri.empty(); }
  bool HasCaptions() const { return !captions_uri.empty(); }
};

// One narrative step: question plus its two outcomes, indexed by Phase.
// Invariant (checked by SequenceConfig::IsValid and FlowStateMachine::Start):
// the question bundle has a video.
struct QuestionSet {
  std::array<MediaBundle, kPhaseCount> bundles;

  const MediaBundle& BundleFor(Phase phase) const {
    return bundles[static_cast<std::size_t>(phase)];
  }
  MediaBundle& BundleFor(Phase phase) {
    return bundles[static_cast<std::size_t>(phase)];
  }
};

using Sequence = std::vector<QuestionSet>;

}  // namespace storyreel::runtime

#endif  // STORYREEL_RUNTIME_MEDIA_BUNDLE_H_
