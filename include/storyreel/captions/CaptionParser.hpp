// Repository: StoryReel
// Component: Caption Parser
// Purpose: Parse SRT-style caption documents into sorted cue lists.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_CAPTIONS_CAPTION_PARSER_HPP_
#define STORYREEL_CAPTIONS_CAPTION_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "storyreel/captions/Cue.hpp"

namespace storyreel::captions {

struct CaptionParseResult {
  CueList cues;
  int32_t blocks_total = 0;    // blank-line separated blocks seen
  int32_t blocks_dropped = 0;  // blocks rejected by the grammar or timing
};

// Parses a caption document. Never fails: malformed blocks are dropped and
// parsing resumes at the next blank-line boundary.
//
// Accepted block:
//   [index line of digits]
//   HH:MM:SS,mmm --> HH:MM:SS,mmm
//   text line
//   [more text lines]
//
// CRLF and lone CR line endings are normalized and a leading UTF-8 BOM is
// stripped. Blocks with end < start or without text are dropped. Text lines
// are joined with '\n' and trimmed. The result is stable-sorted by start.
CaptionParseResult ParseCaptionDocument(const std::string& document);

// Convenience form returning only the cues.
CueList ParseCaptions(const std::string& document);

// "HH:MM:SS,mmm" -> seconds. nullopt when the text does not match exactly.
std::optional<double> ParseCaptionTimestamp(const std::string& timestamp);

}  // namespace storyreel::captions

#endif  // STORYREEL_CAPTIONS_CAPTION_PARSER_HPP_
