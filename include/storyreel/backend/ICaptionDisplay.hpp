// Repository: StoryReel
// Component: Caption Display Interface
// Purpose: On-screen caption text sink.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_ICAPTION_DISPLAY_HPP_
#define STORYREEL_BACKEND_ICAPTION_DISPLAY_HPP_

#include <string>

namespace storyreel::backend {

class ICaptionDisplay {
 public:
  virtual ~ICaptionDisplay() = default;
  // Empty text clears the display.
  virtual void SetText(const std::string& text) = 0;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_ICAPTION_DISPLAY_HPP_
