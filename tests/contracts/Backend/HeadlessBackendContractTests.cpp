// Repository: StoryReel
// Component: Headless Backend Contract Tests
// Purpose: Clock-driven video/audio stand-ins, console captions and scripted choices.
// Copyright (c) 2025 StoryReel

#include <gtest/gtest.h>

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "storyreel/backend/ConsoleCaptionDisplay.hpp"
#include "storyreel/backend/HeadlessAudioBackend.hpp"
#include "storyreel/backend/HeadlessVideoBackend.hpp"
#include "storyreel/backend/ScriptedChoiceUi.hpp"
#include "storyreel/util/Logger.hpp"

namespace storyreel::backend {
namespace {

using storyreel::timing::DeterministicTimeSource;

class RecordingSink : public IMediaEventSink {
 public:
  void OnVideoPrepared(BundleToken token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    prepared_.push_back(token);
  }
  void OnVideoFinished(BundleToken token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.push_back(token);
  }
  std::vector<BundleToken> prepared() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prepared_;
  }
  std::vector<BundleToken> finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<BundleToken> prepared_;
  std::vector<BundleToken> finished_;
};

ClipDurationFn TableDurations(std::map<std::string, double> table) {
  return [table](const std::string& uri) -> std::optional<double> {
    auto it = table.find(uri);
    if (it == table.end()) return std::nullopt;
    return it->second;
  };
}

TEST(HeadlessVideoBackendTest, PrepareReportsTokenFromWorker) {
  DeterministicTimeSource ts;
  RecordingSink sink;
  HeadlessVideoBackend video(ts, TableDurations({{"a.mp4", 2.0}}));
  video.SetEventSink(&sink);

  video.SetClip("a.mp4");
  video.Prepare(5);
  video.WaitForPrepare();

  ASSERT_EQ(sink.prepared().size(), 1u);
  EXPECT_EQ(sink.prepared()[0], 5u);
  ASSERT_TRUE(video.duration().has_value());
  EXPECT_DOUBLE_EQ(*video.duration(), 2.0);
}

TEST(HeadlessVideoBackendTest, UnknownDurationNeverPrepares) {
  DeterministicTimeSource ts;
  RecordingSink sink;
  HeadlessVideoBackend video(ts, TableDurations({}));
  video.SetEventSink(&sink);

  video.SetClip("missing.mp4");
  video.Prepare(1);
  video.WaitForPrepare();
  EXPECT_TRUE(sink.prepared().empty());

  video.Play();
  EXPECT_FALSE(video.IsPlaying());
}

TEST(HeadlessVideoBackendTest, PlaysToEndThenReportsFinishedOnce) {
  DeterministicTimeSource ts;
  RecordingSink sink;
  HeadlessVideoBackend video(ts, TableDurations({{"a.mp4", 2.0}}));
  video.SetEventSink(&sink);
  video.SetClip("a.mp4");
  video.Prepare(3);
  video.WaitForPrepare();

  video.Play();
  EXPECT_TRUE(video.IsPlaying());
  ts.AdvanceMs(500);
  EXPECT_DOUBLE_EQ(video.CurrentTime(), 0.5);
  video.Poll();
  EXPECT_TRUE(sink.finished().empty());

  ts.AdvanceMs(1600);
  EXPECT_DOUBLE_EQ(video.CurrentTime(), 2.0);  // clamped
  video.Poll();
  video.Poll();
  ASSERT_EQ(sink.finished().size(), 1u);
  EXPECT_EQ(sink.finished()[0], 3u);
  EXPECT_FALSE(video.IsPlaying());
}

TEST(HeadlessVideoBackendTest, DetachedSinkReceivesNothing) {
  DeterministicTimeSource ts;
  RecordingSink sink;
  HeadlessVideoBackend video(ts, TableDurations({{"a.mp4", 1.0}}));
  video.SetEventSink(&sink);
  video.SetEventSink(nullptr);

  video.SetClip("a.mp4");
  video.Prepare(1);
  video.WaitForPrepare();
  EXPECT_TRUE(sink.prepared().empty());
}

TEST(HeadlessVideoBackendTest, PrepareDoesNotWaitForSupersededWorker) {
  DeterministicTimeSource ts;
  RecordingSink sink;
  std::promise<void> release_slow;
  std::shared_future<void> slow_gate = release_slow.get_future().share();
  HeadlessVideoBackend video(ts, [slow_gate](const std::string& uri) -> std::optional<double> {
    if (uri == "slow.mp4") {
      slow_gate.wait();
    }
    return 1.0;
  });
  video.SetEventSink(&sink);

  video.SetClip("slow.mp4");
  video.Prepare(1);
  // The first worker is still blocked; this call must return regardless.
  video.SetClip("fast.mp4");
  video.Prepare(2);

  release_slow.set_value();
  video.WaitForPrepare();

  ASSERT_EQ(sink.prepared().size(), 1u);
  EXPECT_EQ(sink.prepared()[0], 2u);
}

TEST(CacheClipDurationsTest, ResolvesEachReferenceOnce) {
  int resolve_calls = 0;
  ClipDurationFn resolve = [&resolve_calls](const std::string& uri) -> std::optional<double> {
    ++resolve_calls;
    if (uri == "a.mp4") return 2.0;
    return std::nullopt;
  };

  ClipDurationFn cached = CacheClipDurations({"a.mp4", "", "b.mp3", "a.mp4"}, resolve);
  EXPECT_EQ(resolve_calls, 2);

  ASSERT_TRUE(cached("a.mp4").has_value());
  EXPECT_DOUBLE_EQ(*cached("a.mp4"), 2.0);
  EXPECT_FALSE(cached("b.mp3").has_value());
  EXPECT_FALSE(cached("other.mp4").has_value());
  EXPECT_EQ(resolve_calls, 2);
}

TEST(HeadlessAudioBackendTest, RunsOutAtClipEnd) {
  DeterministicTimeSource ts;
  HeadlessAudioBackend audio("narration", ts, TableDurations({{"vo.mp3", 1.5}}));

  audio.SetClip("vo.mp3");
  ASSERT_TRUE(audio.HasClip());
  audio.SetTime(0.0);
  audio.Play();
  ts.AdvanceMs(1000);
  EXPECT_TRUE(audio.IsPlaying());
  EXPECT_DOUBLE_EQ(audio.CurrentTime(), 1.0);

  ts.AdvanceMs(1000);
  EXPECT_FALSE(audio.IsPlaying());
  EXPECT_DOUBLE_EQ(audio.CurrentTime(), 1.5);
}

TEST(HeadlessAudioBackendTest, SetTimeWhilePlayingRewinds) {
  DeterministicTimeSource ts;
  HeadlessAudioBackend audio("music", ts, TableDurations({{"bed.mp3", 10.0}}));
  audio.SetClip("bed.mp3");
  audio.Play();
  ts.AdvanceMs(3000);
  audio.SetTime(0.0);
  EXPECT_DOUBLE_EQ(audio.CurrentTime(), 0.0);
  ts.AdvanceMs(250);
  EXPECT_DOUBLE_EQ(audio.CurrentTime(), 0.25);
}

TEST(HeadlessAudioBackendTest, EmptyClipIsSilent) {
  DeterministicTimeSource ts;
  HeadlessAudioBackend audio("music", ts, TableDurations({}));
  audio.SetClip("");
  EXPECT_FALSE(audio.HasClip());
  audio.Play();
  EXPECT_FALSE(audio.IsPlaying());
}

TEST(HeadlessAudioBackendTest, StopHoldsPosition) {
  DeterministicTimeSource ts;
  HeadlessAudioBackend audio("narration", ts, TableDurations({{"vo.mp3", 5.0}}));
  audio.SetClip("vo.mp3");
  audio.Play();
  ts.AdvanceMs(2000);
  audio.Stop();
  ts.AdvanceMs(2000);
  EXPECT_FALSE(audio.IsPlaying());
  EXPECT_DOUBLE_EQ(audio.CurrentTime(), 2.0);
}

TEST(ConsoleCaptionDisplayTest, LogsShowAndClear) {
  std::vector<std::string> lines;
  util::Logger::SetInfoSink([&](const std::string& line) { lines.push_back(line); });

  ConsoleCaptionDisplay display;
  display.SetText("first\nsecond");
  display.SetText("");

  util::Logger::SetInfoSink(nullptr);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "[Caption] SHOW text=\"first / second\"");
  EXPECT_EQ(lines[1], "[Caption] CLEAR");
  EXPECT_EQ(display.updates(), 2);
  EXPECT_EQ(display.text(), "");
}

TEST(ScriptedChoiceUiTest, ParseScript) {
  auto script = ScriptedChoiceUi::ParseScript("s,f,success,failure");
  ASSERT_TRUE(script.has_value());
  ASSERT_EQ(script->size(), 4u);
  EXPECT_EQ((*script)[0], runtime::Choice::kSuccess);
  EXPECT_EQ((*script)[1], runtime::Choice::kFailure);
  EXPECT_EQ((*script)[2], runtime::Choice::kSuccess);
  EXPECT_EQ((*script)[3], runtime::Choice::kFailure);

  auto empty = ScriptedChoiceUi::ParseScript("");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());

  EXPECT_FALSE(ScriptedChoiceUi::ParseScript("s,maybe").has_value());
  EXPECT_FALSE(ScriptedChoiceUi::ParseScript("s,,f").has_value());
}

TEST(ScriptedChoiceUiTest, EachShowSubmitsNextChoiceUntilExhausted) {
  ScriptedChoiceUi ui({runtime::Choice::kFailure, runtime::Choice::kSuccess});
  std::vector<runtime::Choice> submitted;
  ui.SetSubmit([&](runtime::Choice c) { submitted.push_back(c); });

  ui.Show();
  EXPECT_TRUE(ui.visible());
  ui.Hide();
  EXPECT_FALSE(ui.visible());
  ui.Show();
  ui.Show();

  ASSERT_EQ(submitted.size(), 2u);
  EXPECT_EQ(submitted[0], runtime::Choice::kFailure);
  EXPECT_EQ(submitted[1], runtime::Choice::kSuccess);
  EXPECT_EQ(ui.prompts(), 3u);
  EXPECT_EQ(ui.remaining(), 0u);
}

}  // namespace
}  // namespace storyreel::backend
