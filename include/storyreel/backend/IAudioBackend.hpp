// Repository: StoryReel
// Component: Audio Backend Interface
// Purpose: Transport contract for one external audio track (narration or music).
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_IAUDIO_BACKEND_HPP_
#define STORYREEL_BACKEND_IAUDIO_BACKEND_HPP_

#include <string>

namespace storyreel::backend {

class IAudioBackend {
 public:
  virtual ~IAudioBackend() = default;

  // Empty uri means "no clip"; Play() is then a no-op.
  virtual void SetClip(const std::string& uri) = 0;
  virtual bool HasClip() const = 0;

  virtual void Play() = 0;
  virtual void Stop() = 0;
  virtual void SetTime(double seconds) = 0;
  virtual double CurrentTime() const = 0;
  virtual bool IsPlaying() const = 0;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_IAUDIO_BACKEND_HPP_
