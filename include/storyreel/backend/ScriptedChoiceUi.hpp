// Repository: StoryReel
// Component: Scripted Choice UI
// Purpose: Choice UI that answers each prompt from a fixed script.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_BACKEND_SCRIPTED_CHOICE_UI_HPP_
#define STORYREEL_BACKEND_SCRIPTED_CHOICE_UI_HPP_

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "storyreel/backend/IChoiceUi.hpp"
#include "storyreel/runtime/FlowTypes.h"

namespace storyreel::backend {

// Each Show() submits the next scripted choice. Once the script is exhausted
// the prompt stays open and nothing is submitted.
class ScriptedChoiceUi : public IChoiceUi {
 public:
  using SubmitFn = std::function<void(runtime::Choice)>;

  explicit ScriptedChoiceUi(std::vector<runtime::Choice> script);

  // Must be set before the first Show().
  void SetSubmit(SubmitFn submit) { submit_ = std::move(submit); }

  void Show() override;
  void Hide() override;

  bool visible() const { return visible_; }
  std::size_t prompts() const { return prompts_; }
  std::size_t remaining() const { return script_.size() - next_; }

  // Parses "s,f,success,failure" (case-sensitive). Empty text is an empty
  // script. Returns empty optional on an unknown token.
  static std::optional<std::vector<runtime::Choice>> ParseScript(const std::string& text);

 private:
  std::vector<runtime::Choice> script_;
  std::size_t next_ = 0;
  std::size_t prompts_ = 0;
  bool visible_ = false;
  SubmitFn submit_;
};

}  // namespace storyreel::backend

#endif  // STORYREEL_BACKEND_SCRIPTED_CHOICE_UI_HPP_
