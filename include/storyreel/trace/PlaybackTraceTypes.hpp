// Repository: StoryReel
// Component: Playback Trace Types
// Purpose: Header-only per-bundle execution summaries. The caption track is
//          fingerprinted with CRC32 so logs identify exactly which document
//          drove the captions for a bundle.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_TRACE_PLAYBACK_TRACE_TYPES_HPP_
#define STORYREEL_TRACE_PLAYBACK_TRACE_TYPES_HPP_

#include <cstdint>
#include <sstream>
#include <string>

#include <zlib.h>

#include "storyreel/runtime/FlowTypes.h"

namespace storyreel::trace {

// CRC32 of the raw caption document bytes. 0 for an empty document.
inline uint32_t CRC32CaptionDocument(const std::string& document) {
  if (document.empty()) return 0;
  uLong crc = crc32(0L, Z_NULL, 0);
  // zlib takes uInt lengths; feed large documents in chunks.
  const auto* data = reinterpret_cast<const Bytef*>(document.data());
  std::size_t remaining = document.size();
  constexpr std::size_t kChunk = 1u << 30;
  while (remaining > 0) {
    const std::size_t len = remaining < kChunk ? remaining : kChunk;
    crc = crc32(crc, data, static_cast<uInt>(len));
    data += len;
    remaining -= len;
  }
  return static_cast<uint32_t>(crc);
}

// Aggregated record for one bundle load, finalized when the bundle finishes
// or is superseded.
struct BundlePlaybackSummary {
  runtime::BundleToken token = 0;
  runtime::Phase phase = runtime::Phase::kQuestion;
  int32_t question_index = 0;
  std::string video_uri;
  bool narration = false;
  bool music = false;
  uint32_t captions_crc32 = 0;
  int64_t cue_count = 0;
  int64_t caption_changes = 0;  // SetText calls while the bundle was active
  int64_t ticks_played = 0;     // ticks between prepared and finished
  bool completed = false;       // false when superseded before finishing
};

inline std::string FormatBundleSummary(const BundlePlaybackSummary& s) {
  std::ostringstream oss;
  oss << "token=" << s.token
      << " phase=" << runtime::PhaseName(s.phase)
      << " question_index=" << s.question_index
      << " video=" << s.video_uri
      << " narration=" << (s.narration ? "Y" : "N")
      << " music=" << (s.music ? "Y" : "N")
      << " captions_crc32=0x" << std::hex << s.captions_crc32 << std::dec
      << " cues=" << s.cue_count
      << " caption_changes=" << s.caption_changes
      << " ticks_played=" << s.ticks_played
      << " completed=" << (s.completed ? "Y" : "N");
  return oss.str();
}

}  // namespace storyreel::trace

#endif  // STORYREEL_TRACE_PLAYBACK_TRACE_TYPES_HPP_
