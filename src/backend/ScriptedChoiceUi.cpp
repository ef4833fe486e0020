// Repository: StoryReel
// Component: Scripted Choice UI
// Purpose: Choice UI that answers each prompt from a fixed script.
// Copyright (c) 2025 StoryReel

#include "storyreel/backend/ScriptedChoiceUi.hpp"

#include <sstream>
#include <utility>

#include "storyreel/util/Logger.hpp"

namespace storyreel::backend {

using storyreel::util::Logger;

ScriptedChoiceUi::ScriptedChoiceUi(std::vector<runtime::Choice> script)
    : script_(std::move(script)) {}

void ScriptedChoiceUi::Show() {
  visible_ = true;
  ++prompts_;
  if (next_ >= script_.size()) {
    Logger::Info("[ChoiceUi] SHOW prompt=" + std::to_string(prompts_) + " script_exhausted");
    return;
  }
  const runtime::Choice choice = script_[next_++];
  std::ostringstream oss;
  oss << "[ChoiceUi] SHOW prompt=" << prompts_ << " scripted=" << runtime::ChoiceName(choice);
  Logger::Info(oss.str());
  if (submit_) {
    submit_(choice);
  }
}

void ScriptedChoiceUi::Hide() {
  visible_ = false;
}

std::optional<std::vector<runtime::Choice>> ScriptedChoiceUi::ParseScript(
    const std::string& text) {
  std::vector<runtime::Choice> script;
  if (text.empty()) return script;

  std::istringstream stream(text);
  std::string token;
  while (std::getline(stream, token, ',')) {
    if (token == "s" || token == "success") {
      script.push_back(runtime::Choice::kSuccess);
    } else if (token == "f" || token == "failure") {
      script.push_back(runtime::Choice::kFailure);
    } else {
      return std::nullopt;
    }
  }
  return script;
}

}  // namespace storyreel::backend
