// Repository: StoryReel
// Component: Headless Video Backend
// Purpose: Clock-driven stand-in for a real video backend (no decode, no render).
// Copyright (c) 2025 StoryReel

#include "storyreel/backend/HeadlessVideoBackend.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <sstream>
#include <utility>

#include "storyreel/util/Logger.hpp"

namespace storyreel::backend {

using storyreel::util::Logger;

namespace {
constexpr double kNsPerSecond = 1'000'000'000.0;
}  // namespace

ClipDurationFn CacheClipDurations(const std::vector<std::string>& uris,
                                  const ClipDurationFn& resolve) {
  auto table = std::make_shared<std::map<std::string, std::optional<double>>>();
  for (const auto& uri : uris) {
    if (uri.empty() || table->count(uri) > 0) continue;
    (*table)[uri] = resolve ? resolve(uri) : std::nullopt;
  }
  return [table](const std::string& uri) -> std::optional<double> {
    auto it = table->find(uri);
    if (it == table->end()) return std::nullopt;
    return it->second;
  };
}

HeadlessVideoBackend::HeadlessVideoBackend(const timing::ITimeSource& time_source,
                                           ClipDurationFn durations)
    : time_source_(time_source), durations_(std::move(durations)) {}

HeadlessVideoBackend::~HeadlessVideoBackend() {
  WaitForPrepare();
}

void HeadlessVideoBackend::SetEventSink(IMediaEventSink* sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = sink;
}

void HeadlessVideoBackend::SetClip(const std::string& uri) {
  std::lock_guard<std::mutex> lock(mutex_);
  clip_uri_ = uri;
  duration_s_.reset();
  playing_ = false;
  position_s_ = 0.0;
}

void HeadlessVideoBackend::Prepare(BundleToken token) {
  ReapSupersededWorkers();
  if (current_worker_.has_value()) {
    superseded_workers_.push_back(std::move(*current_worker_));
    current_worker_.reset();
  }
  std::string uri;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = token;
    duration_s_.reset();
    playing_ = false;
    position_s_ = 0.0;
    uri = clip_uri_;
  }
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([this, done, uri = std::move(uri), token]() mutable {
    PrepareWorker(std::move(uri), token);
    done->store(true, std::memory_order_release);
  });
  current_worker_ = PrepareWorkerHandle{std::move(worker), std::move(done)};
}

void HeadlessVideoBackend::Play() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!duration_s_.has_value()) {
    Logger::Warn("[HeadlessVideoBackend] PLAY_IGNORED reason=not_prepared uri=" + clip_uri_);
    return;
  }
  if (playing_) return;
  playing_ = true;
  play_start_ns_ = time_source_.NowMonotonicNs() -
                   static_cast<int64_t>(position_s_ * kNsPerSecond);
}

void HeadlessVideoBackend::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  playing_ = false;
  position_s_ = 0.0;
}

bool HeadlessVideoBackend::IsPlaying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return playing_;
}

double HeadlessVideoBackend::CurrentTime() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!playing_) return position_s_;
  return std::min(ElapsedLocked(), duration_s_.value_or(0.0));
}

void HeadlessVideoBackend::Poll() {
  BundleToken finished_token = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!playing_ || !duration_s_.has_value()) return;
    if (ElapsedLocked() < *duration_s_) return;
    playing_ = false;
    position_s_ = *duration_s_;
    finished_token = token_;
  }
  PostFinished(finished_token);
}

void HeadlessVideoBackend::WaitForPrepare() {
  for (auto& worker : superseded_workers_) {
    if (worker.thread.joinable()) worker.thread.join();
  }
  superseded_workers_.clear();
  if (current_worker_.has_value()) {
    if (current_worker_->thread.joinable()) current_worker_->thread.join();
    current_worker_.reset();
  }
}

void HeadlessVideoBackend::ReapSupersededWorkers() {
  auto it = superseded_workers_.begin();
  while (it != superseded_workers_.end()) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) it->thread.join();
      it = superseded_workers_.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<double> HeadlessVideoBackend::duration() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return duration_s_;
}

void HeadlessVideoBackend::PrepareWorker(std::string uri, BundleToken token) {
  std::optional<double> duration;
  if (durations_) {
    duration = durations_(uri);
  }
  if (!duration.has_value() || *duration <= 0.0) {
    std::ostringstream oss;
    oss << "[HeadlessVideoBackend] PREPARE_FAILED uri=" << uri << " token=" << token
        << " reason=no_duration";
    Logger::Warn(oss.str());
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token != token_) return;  // superseded by a later Prepare
    duration_s_ = duration;
  }
  PostPrepared(token);
}

void HeadlessVideoBackend::PostPrepared(BundleToken token) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  if (sink_) sink_->OnVideoPrepared(token);
}

void HeadlessVideoBackend::PostFinished(BundleToken token) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  if (sink_) sink_->OnVideoFinished(token);
}

double HeadlessVideoBackend::ElapsedLocked() const {
  return static_cast<double>(time_source_.NowMonotonicNs() - play_start_ns_) / kNsPerSecond;
}

}  // namespace storyreel::backend
