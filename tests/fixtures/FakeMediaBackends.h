// Repository: StoryReel
// Component: Fake Media Backends
// Purpose: Recording test doubles for the video, audio, caption and choice seams.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_TESTS_FIXTURES_FAKE_MEDIA_BACKENDS_H_
#define STORYREEL_TESTS_FIXTURES_FAKE_MEDIA_BACKENDS_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "storyreel/backend/IAudioBackend.hpp"
#include "storyreel/backend/ICaptionDisplay.hpp"
#include "storyreel/backend/IChoiceUi.hpp"
#include "storyreel/backend/IVideoBackend.hpp"

namespace storyreel::tests::fixtures
{

  // Shared, ordered record of transport calls across all fakes, e.g.
  // "video.Play", "narration.SetTime(0)".
  using CallJournal = std::vector<std::string>;

  // FakeVideoBackend never signals on its own. Tests deliver prepared and
  // finished through EmitPrepared/EmitFinished with any token they like.
  class FakeVideoBackend : public backend::IVideoBackend
  {
  public:
    explicit FakeVideoBackend(CallJournal* journal = nullptr) : journal_(journal) {}

    void SetEventSink(backend::IMediaEventSink* sink) override { sink_ = sink; }

    void SetClip(const std::string& uri) override
    {
      clip_ = uri;
      Record("video.SetClip(" + uri + ")");
    }

    void Prepare(backend::BundleToken token) override
    {
      prepare_tokens_.push_back(token);
      Record("video.Prepare(" + std::to_string(token) + ")");
    }

    void Play() override
    {
      playing_ = true;
      Record("video.Play");
    }

    void Stop() override
    {
      playing_ = false;
      Record("video.Stop");
    }

    bool IsPlaying() const override { return playing_; }
    double CurrentTime() const override { return time_s_; }

    // Test controls.
    void SetCurrentTime(double seconds) { time_s_ = seconds; }
    void EmitPrepared(backend::BundleToken token)
    {
      if (sink_) sink_->OnVideoPrepared(token);
    }
    void EmitFinished(backend::BundleToken token)
    {
      playing_ = false;
      if (sink_) sink_->OnVideoFinished(token);
    }

    backend::IMediaEventSink* sink() const { return sink_; }
    const std::string& clip() const { return clip_; }
    const std::vector<backend::BundleToken>& prepare_tokens() const { return prepare_tokens_; }
    backend::BundleToken last_prepare_token() const
    {
      return prepare_tokens_.empty() ? 0 : prepare_tokens_.back();
    }

  private:
    void Record(const std::string& call)
    {
      if (journal_) journal_->push_back(call);
    }

    CallJournal* journal_;
    backend::IMediaEventSink* sink_ = nullptr;
    std::string clip_;
    std::vector<backend::BundleToken> prepare_tokens_;
    bool playing_ = false;
    double time_s_ = 0.0;
  };

  class FakeAudioBackend : public backend::IAudioBackend
  {
  public:
    FakeAudioBackend(std::string name, CallJournal* journal = nullptr)
        : name_(std::move(name)), journal_(journal) {}

    void SetClip(const std::string& uri) override
    {
      clip_ = uri;
      playing_ = false;
      Record("SetClip(" + uri + ")");
    }

    bool HasClip() const override { return !clip_.empty(); }

    void Play() override
    {
      if (clip_.empty()) return;
      playing_ = true;
      ++play_calls_;
      Record("Play");
    }

    void Stop() override
    {
      playing_ = false;
      ++stop_calls_;
      Record("Stop");
    }

    void SetTime(double seconds) override
    {
      time_s_ = seconds;
      Record("SetTime(" + std::to_string(static_cast<int>(seconds)) + ")");
    }

    double CurrentTime() const override { return time_s_; }
    bool IsPlaying() const override { return playing_; }

    // Test controls.
    void SetCurrentTime(double seconds) { time_s_ = seconds; }
    void RunOut() { playing_ = false; }

    const std::string& clip() const { return clip_; }
    int play_calls() const { return play_calls_; }
    int stop_calls() const { return stop_calls_; }

  private:
    void Record(const std::string& call)
    {
      if (journal_) journal_->push_back(name_ + "." + call);
    }

    std::string name_;
    CallJournal* journal_;
    std::string clip_;
    bool playing_ = false;
    double time_s_ = 0.0;
    int play_calls_ = 0;
    int stop_calls_ = 0;
  };

  // Records every SetText call, including clears.
  class RecordingCaptionDisplay : public backend::ICaptionDisplay
  {
  public:
    void SetText(const std::string& text) override
    {
      text_ = text;
      history_.push_back(text);
    }

    const std::string& text() const { return text_; }
    const std::vector<std::string>& history() const { return history_; }
    void ClearHistory() { history_.clear(); }

  private:
    std::string text_;
    std::vector<std::string> history_;
  };

  class FakeChoiceUi : public backend::IChoiceUi
  {
  public:
    void Show() override
    {
      visible_ = true;
      ++shows_;
    }

    void Hide() override
    {
      visible_ = false;
      ++hides_;
    }

    bool visible() const { return visible_; }
    int shows() const { return shows_; }
    int hides() const { return hides_; }

  private:
    bool visible_ = false;
    int shows_ = 0;
    int hides_ = 0;
  };

} // namespace storyreel::tests::fixtures

#endif // STORYREEL_TESTS_FIXTURES_FAKE_MEDIA_BACKENDS_H_
