// Repository: StoryReel
// Component: Console Caption Display
// Purpose: Caption display that writes each change as a log line.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_CONSOLE_CAPTION_DISPLAY_HPP_
#define STORYREEL_BACKEND_CONSOLE_CAPTION_DISPLAY_HPP_

#include <cstdint>
#include <string>

#include "storyreel/backend/ICaptionDisplay.hpp"

namespace storyreel::backend {

// Multi-line captions are logged on one line with " / " between lines.
class ConsoleCaptionDisplay : public ICaptionDisplay {
 public:
  void SetText(const std::string& text) override;

  const std::string& text() const { return text_; }
  int64_t updates() const { return updates_; }

 private:
  std::string text_;
  int64_t updates_ = 0;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_CONSOLE_CAPTION_DISPLAY_HPP_
