// Repository: StoryReel
// Component: Choice UI Interface
// Purpose: Success/failure choice controls owned by the host UI.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_ICHOICE_UI_HPP_
#define STORYREEL_BACKEND_ICHOICE_UI_HPP_

namespace storyreel::backend {

// Shown only while the flow awaits a choice. The UI reports a click through
// StoryPlayer::PostChoice().
class IChoiceUi {
 public:
  virtual ~IChoiceUi() = default;
  virtual void Show() = 0;
  virtual void Hide() = 0;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_ICHOICE_UI_HPP_
