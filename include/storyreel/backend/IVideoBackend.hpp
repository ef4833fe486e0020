// Repository: StoryReel
// Component: Video Backend Interface
// Purpose: Transport contract for the external video decode/render backend.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_IVIDEO_BACKEND_HPP_
#define STORYREEL_BACKEND_IVIDEO_BACKEND_HPP_

#include <cstdint>
#include <string>

namespace storyreel::backend {

// Identity of one bundle load. Every prepare/finish signal carries the token
// of the load that requested it; the session discards mismatches.
using BundleToken = uint64_t;

// Receives the backend's single-shot asynchronous signals. May be invoked
// from any thread; implementations hand off to the tick thread.
class IMediaEventSink {
 public:
  virtual ~IMediaEventSink() = default;
  virtual void OnVideoPrepared(BundleToken token) = 0;
  virtual void OnVideoFinished(BundleToken token) = 0;
};

// IVideoBackend is owned by the host; the session only issues transport
// calls. Prepare() must not block. The backend reports OnVideoPrepared with
// the same token once the clip is ready, and OnVideoFinished with that token
// when playback reaches the clip end.
class IVideoBackend {
 public:
  virtual ~IVideoBackend() = default;

  virtual void SetEventSink(IMediaEventSink* sink) = 0;

  virtual void SetClip(const std::string& uri) = 0;
  virtual void Prepare(BundleToken token) = 0;
  virtual void Play() = 0;
  virtual void Stop() = 0;
  virtual bool IsPlaying() const = 0;

  // Seconds from the start of the clip.
  virtual double CurrentTime() const = 0;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_IVIDEO_BACKEND_HPP_
