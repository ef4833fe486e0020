// Repository: StoryReel
// Component: Playback Trace Contract Tests
// Purpose: Caption fingerprinting and summary formatting.
// Copyright (c) 2025 StoryReel

#include <gtest/gtest.h>

#include <string>

#include "storyreel/trace/PlaybackTraceTypes.hpp"

namespace storyreel::trace {
namespace {

TEST(PlaybackTraceContractTest, Crc32MatchesReferenceValue) {
  // Standard CRC-32 check value.
  EXPECT_EQ(CRC32CaptionDocument("123456789"), 0xCBF43926u);
}

TEST(PlaybackTraceContractTest, Crc32EmptyDocumentIsZero) {
  EXPECT_EQ(CRC32CaptionDocument(""), 0u);
}

TEST(PlaybackTraceContractTest, Crc32DistinguishesDocuments) {
  const std::string a = "1\n00:00:00,000 --> 00:00:01,000\nHello\n";
  const std::string b = "1\n00:00:00,000 --> 00:00:01,000\nHellO\n";
  EXPECT_NE(CRC32CaptionDocument(a), CRC32CaptionDocument(b));
  EXPECT_EQ(CRC32CaptionDocument(a), CRC32CaptionDocument(a));
}

TEST(PlaybackTraceContractTest, SummaryFormatCarriesAllFields) {
  BundlePlaybackSummary s;
  s.token = 7;
  s.phase = runtime::Phase::kOutcomeFailure;
  s.question_index = 2;
  s.video_uri = "q2_ko.mp4";
  s.narration = true;
  s.captions_crc32 = 0xABCDu;
  s.cue_count = 4;
  s.caption_changes = 9;
  s.ticks_played = 120;
  s.completed = true;

  const std::string line = FormatBundleSummary(s);
  EXPECT_NE(line.find("token=7"), std::string::npos);
  EXPECT_NE(line.find("phase=OUTCOME_FAILURE"), std::string::npos);
  EXPECT_NE(line.find("question_index=2"), std::string::npos);
  EXPECT_NE(line.find("video=q2_ko.mp4"), std::string::npos);
  EXPECT_NE(line.find("narration=Y"), std::string::npos);
  EXPECT_NE(line.find("music=N"), std::string::npos);
  EXPECT_NE(line.find("captions_crc32=0xabcd"), std::string::npos);
  EXPECT_NE(line.find("cues=4"), std::string::npos);
  EXPECT_NE(line.find("caption_changes=9"), std::string::npos);
  EXPECT_NE(line.find("ticks_played=120"), std::string::npos);
  EXPECT_NE(line.find("completed=Y"), std::string::npos);
}

}  // namespace
}  // namespace storyreel::trace
