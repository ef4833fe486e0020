// Repository: StoryReel
// Component: Caption Parser
// Purpose: Parse SRT-style caption documents into sorted cue lists.
// Copyright (c) 2025 StoryReel

#include "storyreel/captions/CaptionParser.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <vector>

#include "storyreel/util/Logger.hpp"

namespace storyreel::captions {

namespace {

using storyreel::util::Logger;

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

std::string Trim(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && IsSpace(s[begin])) ++begin;
  while (end > begin && IsSpace(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

bool IsBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), IsSpace);
}

bool IsIndexLine(const std::string& line) {
  const std::string trimmed = Trim(line);
  return !trimmed.empty() &&
         std::all_of(trimmed.begin(), trimmed.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

// \r\n and lone \r -> \n, leading BOM removed.
std::string Normalize(const std::string& document) {
  std::string body;
  body.reserve(document.size());
  std::size_t i = 0;
  if (document.compare(0, 3, kUtf8Bom) == 0) {
    i = 3;
  }
  for (; i < document.size(); ++i) {
    const char c = document[i];
    if (c == '\r') {
      body.push_back('\n');
      if (i + 1 < document.size() && document[i + 1] == '\n') {
        ++i;
      }
    } else {
      body.push_back(c);
    }
  }
  return body;
}

std::vector<std::vector<std::string>> SplitBlocks(const std::string& body) {
  std::vector<std::vector<std::string>> blocks;
  std::vector<std::string> current;
  std::istringstream in(body);
  std::string line;
  while (std::getline(in, line)) {
    if (IsBlank(line)) {
      if (!current.empty()) {
        blocks.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(line);
  }
  if (!current.empty()) {
    blocks.push_back(std::move(current));
  }
  return blocks;
}

// Returns the cue for one block, or nullopt when the block is malformed.
std::optional<Cue> ParseBlock(const std::vector<std::string>& lines) {
  static const std::regex kTimingLine(
      R"(^\s*(\d{2}:\d{2}:\d{2},\d{3})[ \t]+-->[ \t]+(\d{2}:\d{2}:\d{2},\d{3})[ \t]*$)");

  std::size_t pos = 0;
  if (pos < lines.size() && IsIndexLine(lines[pos])) {
    ++pos;
  }
  if (pos >= lines.size()) {
    return std::nullopt;
  }

  std::smatch match;
  if (!std::regex_match(lines[pos], match, kTimingLine)) {
    return std::nullopt;
  }
  auto start = ParseCaptionTimestamp(match[1].str());
  auto end = ParseCaptionTimestamp(match[2].str());
  if (!start.has_value() || !end.has_value() || *end < *start) {
    return std::nullopt;
  }
  ++pos;

  std::string text;
  for (; pos < lines.size(); ++pos) {
    if (!text.empty()) text.push_back('\n');
    text += lines[pos];
  }
  text = Trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  Cue cue;
  cue.start_s = *start;
  cue.end_s = *end;
  cue.text = std::move(text);
  return cue;
}

}  // namespace

std::optional<double> ParseCaptionTimestamp(const std::string& timestamp) {
  static const std::regex kTimestamp(R"((\d{2}):(\d{2}):(\d{2}),(\d{3}))");
  std::smatch match;
  if (!std::regex_match(timestamp, match, kTimestamp)) {
    return std::nullopt;
  }
  // Fixed-width digit groups cannot overflow int.
  const int h = std::stoi(match[1].str());
  const int m = std::stoi(match[2].str());
  const int s = std::stoi(match[3].str());
  const int ms = std::stoi(match[4].str());
  return static_cast<double>(h * 3600 + m * 60 + s) + ms / 1000.0;
}

CaptionParseResult ParseCaptionDocument(const std::string& document) {
  CaptionParseResult result;
  const auto blocks = SplitBlocks(Normalize(document));
  result.blocks_total = static_cast<int32_t>(blocks.size());

  for (const auto& block : blocks) {
    auto cue = ParseBlock(block);
    if (!cue.has_value()) {
      ++result.blocks_dropped;
      continue;
    }
    result.cues.push_back(std::move(*cue));
  }

  // Authoring order is not trusted.
  std::stable_sort(result.cues.begin(), result.cues.end(),
                   [](const Cue& a, const Cue& b) { return a.start_s < b.start_s; });

  if (result.cues.empty() && result.blocks_total > 0) {
    std::ostringstream oss;
    oss << "[CaptionParser] NO_CUES blocks_total=" << result.blocks_total
        << " blocks_dropped=" << result.blocks_dropped;
    Logger::Warn(oss.str());
  } else if (result.blocks_dropped > 0) {
    std::ostringstream oss;
    oss << "[CaptionParser] BLOCKS_DROPPED dropped=" << result.blocks_dropped
        << " kept=" << result.cues.size();
    Logger::Debug(oss.str());
  }

  return result;
}

CueList ParseCaptions(const std::string& document) {
  return ParseCaptionDocument(document).cues;
}

}  // namespace storyreel::captions
