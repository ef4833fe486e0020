// Repository: StoryReel
// Component: Headless Video Backend
// Purpose: Clock-driven stand-in for a real video backend (no decode, no render).
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_HEADLESS_VIDEO_BACKEND_HPP_
#define STORYREEL_BACKEND_HEADLESS_VIDEO_BACKEND_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "storyreel/backend/IVideoBackend.hpp"
#include "storyreel/timing/ITimeSource.hpp"

namespace storyreel::backend {

// Resolves a clip reference to its duration in seconds; nullopt if unknown.
using ClipDurationFn = std::function<std::optional<double>(const std::string& uri)>;

// Resolves every non-empty reference once, up front, and returns a lookup
// over the results. References outside the list resolve to nullopt.
ClipDurationFn CacheClipDurations(const std::vector<std::string>& uris,
                                  const ClipDurationFn& resolve);

// HeadlessVideoBackend
//
// Prepare() resolves the clip duration on a worker thread and then reports
// OnVideoPrepared(token) to the sink. Prepare() never waits on an earlier
// worker: a superseded worker is kept aside, its result is dropped by the
// token check, and it is joined once it has exited. While playing, the position is the
// elapsed time on the time source, clamped to the duration. The host calls
// Poll() once per tick; the first Poll() at or past the clip end reports
// OnVideoFinished(token).
//
// A clip whose duration cannot be resolved is never reported prepared.
class HeadlessVideoBackend : public IVideoBackend {
 public:
  HeadlessVideoBackend(const timing::ITimeSource& time_source, ClipDurationFn durations);
  ~HeadlessVideoBackend() override;

  HeadlessVideoBackend(const HeadlessVideoBackend&) = delete;
  HeadlessVideoBackend& operator=(const HeadlessVideoBackend&) = delete;

  void SetEventSink(IMediaEventSink* sink) override;
  void SetClip(const std::string& uri) override;
  void Prepare(BundleToken token) override;
  void Play() override;
  void Stop() override;
  bool IsPlaying() const override;
  double CurrentTime() const override;

  void Poll();

  // Blocks until every prepare worker, current or superseded, has exited.
  void WaitForPrepare();

  std::optional<double> duration() const;

 private:
  struct PrepareWorkerHandle {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void PrepareWorker(std::string uri, BundleToken token);
  void ReapSupersededWorkers();
  void PostPrepared(BundleToken token);
  void PostFinished(BundleToken token);
  double ElapsedLocked() const;

  const timing::ITimeSource& time_source_;
  ClipDurationFn durations_;

  std::mutex sink_mutex_;
  IMediaEventSink* sink_ = nullptr;

  mutable std::mutex mutex_;
  std::string clip_uri_;
  BundleToken token_ = 0;
  std::optional<double> duration_s_;
  bool playing_ = false;
  int64_t play_start_ns_ = 0;
  double position_s_ = 0.0;

  // Tick thread only.
  std::optional<PrepareWorkerHandle> current_worker_;
  std::vector<PrepareWorkerHandle> superseded_workers_;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_HEADLESS_VIDEO_BACKEND_HPP_
