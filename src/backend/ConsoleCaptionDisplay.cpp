// Repository: StoryReel
// Component: Console Caption Display
// Purpose: Caption display that writes each change as a log line.
// Copyright (c) 2025 StoryReel

#include "storyreel/backend/ConsoleCaptionDisplay.hpp"

#include "storyreel/util/Logger.hpp"

namespace storyreel::backend {

using storyreel::util::Logger;

void ConsoleCaptionDisplay::SetText(const std::string& text) {
  text_ = text;
  ++updates_;
  if (text.empty()) {
    Logger::Info("[Caption] CLEAR");
    return;
  }
  std::string one_line;
  one_line.reserve(text.size());
  for (char c : text) {
    if (c == '\n') {
      one_line += " / ";
    } else {
      one_line.push_back(c);
    }
  }
  Logger::Info("[Caption] SHOW text=\"" + one_line + "\"");
}

}  // namespace storyreel::backend
