// Repository: StoryReel
// Component: Story Player Contract Tests
// Purpose: Event hand-off onto the tick thread, same-tick track start,
//          caption polling and the paced run loop.
// Copyright (c) 2025 StoryReel

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "DeterministicTimeSource.hpp"
#include "VirtualTickWaiter.hpp"
#include "fixtures/FakeMediaBackends.h"
#include "storyreel/runtime/StoryPlayer.h"

namespace storyreel::runtime {
namespace {

using tests::fixtures::FakeAudioBackend;
using tests::fixtures::FakeChoiceUi;
using tests::fixtures::FakeVideoBackend;
using tests::fixtures::RecordingCaptionDisplay;

SequenceConfig MakeConfig(int questions) {
  SequenceConfig config;
  for (int i = 0; i < questions; ++i) {
    const std::string stem = "q" + std::to_string(i);
    QuestionSet set;
    set.BundleFor(Phase::kQuestion).video_uri = stem + ".mp4";
    set.BundleFor(Phase::kQuestion).narration_uri = stem + "_vo.mp3";
    set.BundleFor(Phase::kQuestion).music_uri = "bed.mp3";
    set.BundleFor(Phase::kQuestion).captions_uri = stem + ".srt";
    set.BundleFor(Phase::kOutcomeSuccess).video_uri = stem + "_ok.mp4";
    set.BundleFor(Phase::kOutcomeFailure).video_uri = stem + "_ko.mp4";
    config.questions.push_back(set);
  }
  return config;
}

class StoryPlayerContractTest : public ::testing::Test {
 protected:
  StoryPlayerContractTest() : narration_("narration"), music_("music") {
    documents_["q0.srt"] =
        "1\n00:00:00,000 --> 00:00:02,000\nA\n\n"
        "2\n00:00:02,500 --> 00:00:04,000\nB\n";
  }

  std::unique_ptr<StoryPlayer> MakePlayer(const SequenceConfig& config) {
    return std::make_unique<StoryPlayer>(
        config, video_, narration_, music_, display_, &ui_,
        [this](const std::string& uri) -> std::optional<std::string> {
          auto it = documents_.find(uri);
          if (it == documents_.end()) return std::nullopt;
          return it->second;
        });
  }

  FakeVideoBackend video_;
  FakeAudioBackend narration_;
  FakeAudioBackend music_;
  RecordingCaptionDisplay display_;
  FakeChoiceUi ui_;
  std::map<std::string, std::string> documents_;
};

TEST_F(StoryPlayerContractTest, RegistersAndReleasesEventSink) {
  {
    auto player = MakePlayer(MakeConfig(1));
    EXPECT_EQ(video_.sink(), player.get());
  }
  EXPECT_EQ(video_.sink(), nullptr);
}

TEST_F(StoryPlayerContractTest, PreparedAppliedOnNextTickStartingAllTracks) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);

  video_.EmitPrepared(video_.last_prepare_token());
  EXPECT_EQ(player->session().state(), PlaybackSession::State::kPreparing);
  EXPECT_FALSE(video_.IsPlaying());

  player->Tick();
  EXPECT_EQ(player->session().state(), PlaybackSession::State::kPlaying);
  EXPECT_TRUE(video_.IsPlaying());
  EXPECT_TRUE(narration_.IsPlaying());
  EXPECT_TRUE(music_.IsPlaying());
}

TEST_F(StoryPlayerContractTest, StaleSignalsFromSupersededLoadIgnored) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);
  const BundleToken question = video_.last_prepare_token();
  video_.EmitPrepared(question);
  player->Tick();
  video_.EmitFinished(question);
  player->Tick();
  ASSERT_TRUE(player->flow().IsAwaitingChoice());

  player->PostChoice(Choice::kFailure);
  player->Tick();
  const BundleToken outcome = video_.last_prepare_token();
  ASSERT_NE(outcome, question);

  // Late duplicates of the question's signals.
  video_.EmitPrepared(question);
  video_.EmitFinished(question);
  player->Tick();
  EXPECT_EQ(player->session().state(), PlaybackSession::State::kPreparing);
  EXPECT_EQ(player->flow().phase(), Phase::kOutcomeFailure);
  EXPECT_EQ(player->session().Snapshot().stale_signals_discarded, 2u);
}

TEST_F(StoryPlayerContractTest, EventsProcessedInArrivalOrder) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);
  const BundleToken token = video_.last_prepare_token();

  // Prepared, finished and a choice all land within one tick.
  video_.EmitPrepared(token);
  video_.EmitFinished(token);
  player->PostChoice(Choice::kSuccess);
  player->Tick();

  EXPECT_EQ(player->flow().phase(), Phase::kOutcomeSuccess);
  EXPECT_EQ(video_.clip(), "q0_ok.mp4");
}

TEST_F(StoryPlayerContractTest, ChoicePostedFromAnotherThread) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);
  const BundleToken token = video_.last_prepare_token();
  video_.EmitPrepared(token);
  player->Tick();
  video_.EmitFinished(token);
  player->Tick();
  ASSERT_TRUE(ui_.visible());

  std::thread ui_thread([&] { player->PostChoice(Choice::kSuccess); });
  ui_thread.join();
  player->Tick();
  EXPECT_EQ(player->flow().phase(), Phase::kOutcomeSuccess);
  EXPECT_FALSE(ui_.visible());
}

TEST_F(StoryPlayerContractTest, CaptionsFollowNarrationClock) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);
  EXPECT_EQ(player->subtitles().cue_count(), 2u);

  narration_.SetCurrentTime(1.0);
  player->Tick();  // not prepared yet: no clock
  EXPECT_EQ(display_.text(), "");

  video_.EmitPrepared(video_.last_prepare_token());
  player->Tick();
  EXPECT_EQ(display_.text(), "A");

  narration_.SetCurrentTime(2.2);
  player->Tick();
  EXPECT_EQ(display_.text(), "");

  narration_.SetCurrentTime(3.0);
  player->Tick();
  EXPECT_EQ(display_.text(), "B");
}

TEST_F(StoryPlayerContractTest, CaptionsFollowVideoClockWhenConfigured) {
  SequenceConfig config = MakeConfig(1);
  config.caption_clock = CaptionClock::kVideo;
  config.caption_time_offset_s = 0.5;
  auto player = MakePlayer(config);
  ASSERT_TRUE(player->Start().success);

  video_.EmitPrepared(video_.last_prepare_token());
  narration_.SetCurrentTime(0.0);
  video_.SetCurrentTime(2.0);
  player->Tick();
  EXPECT_EQ(display_.text(), "B");
}

TEST_F(StoryPlayerContractTest, RunStopsAtTickCeiling) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);

  auto ts = std::make_shared<timing::DeterministicTimeSource>();
  timing::TickClock clock(30, 1, std::make_shared<timing::VirtualTickWaiter>(ts));

  auto outcome = player->Run(clock, 10);
  EXPECT_EQ(outcome, StoryPlayer::RunOutcome::kTickCeiling);
  EXPECT_EQ(player->ticks(), 10);
  EXPECT_EQ(ts->NowMonotonicNs(), clock.DeadlineOffsetNs(9).count());
}

TEST_F(StoryPlayerContractTest, RunCompletesWhenHookDrivesBackend) {
  auto player = MakePlayer(MakeConfig(2));
  ASSERT_TRUE(player->Start().success);

  auto ts = std::make_shared<timing::DeterministicTimeSource>();
  timing::TickClock clock(30, 1, std::make_shared<timing::VirtualTickWaiter>(ts));

  // Every bundle prepares one tick after loading and finishes one tick after
  // starting; every prompt is answered with success.
  auto hook = [&](int64_t) {
    const auto state = player->session().state();
    if (state == PlaybackSession::State::kPreparing) {
      video_.EmitPrepared(video_.last_prepare_token());
    } else if (state == PlaybackSession::State::kPlaying) {
      video_.EmitFinished(video_.last_prepare_token());
    } else if (player->flow().IsAwaitingChoice()) {
      player->PostChoice(Choice::kSuccess);
    }
  };

  auto outcome = player->Run(clock, 1000, hook);
  EXPECT_EQ(outcome, StoryPlayer::RunOutcome::kComplete);
  EXPECT_TRUE(player->IsComplete());
  EXPECT_EQ(player->flow().current_index(), 2);
  // Per question: prepare, finish, choice, prepare, finish; the last finish
  // completes the sequence on tick 10.
  EXPECT_EQ(player->ticks(), 11);
}

TEST_F(StoryPlayerContractTest, RunHonorsStopRequest) {
  auto player = MakePlayer(MakeConfig(1));
  ASSERT_TRUE(player->Start().success);

  auto ts = std::make_shared<timing::DeterministicTimeSource>();
  timing::TickClock clock(30, 1, std::make_shared<timing::VirtualTickWaiter>(ts));

  auto outcome = player->Run(clock, 0, [&](int64_t tick) {
    if (tick == 4) player->RequestStop();
  });
  EXPECT_EQ(outcome, StoryPlayer::RunOutcome::kStopRequested);
  EXPECT_EQ(player->ticks(), 5);
}

}  // namespace
}  // namespace storyreel::runtime
