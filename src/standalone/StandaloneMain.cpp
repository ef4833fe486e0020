// Repository: StoryReel
// Component: Standalone Sequence Harness
// Purpose: Plays a sequence config headlessly for diagnostics.
// Copyright (c) 2025 StoryReel
//
// Video and audio are clock-driven stand-ins whose clip durations come from
// an FFmpeg container probe run once at startup. Captions go to the console; choices come from
// --choices. No window, no audio device.

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "storyreel/backend/ConsoleCaptionDisplay.hpp"
#include "storyreel/backend/HeadlessAudioBackend.hpp"
#include "storyreel/backend/HeadlessVideoBackend.hpp"
#include "storyreel/backend/ScriptedChoiceUi.hpp"
#include "storyreel/decode/FFmpegMediaProbe.h"
#include "storyreel/runtime/SequenceConfig.h"
#include "storyreel/runtime/StoryPlayer.h"
#include "storyreel/timing/ITimeSource.hpp"
#include "storyreel/timing/TickClock.hpp"
#include "storyreel/util/Logger.hpp"

namespace {

using storyreel::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string config_path;
  std::string choices;
  int64_t max_ticks = 0;            // 0 = unlimited
  double default_duration_s = 0.0;  // 0 = unprobeable clips never prepare
  bool diagnostic = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --config PATH [OPTIONS]\n"
            << "\n"
            << "Plays a StoryReel sequence headlessly and logs flow, captions and\n"
            << "per-bundle summaries.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --config PATH          Sequence config JSON (required)\n"
            << "  --choices LIST         Scripted answers, e.g. s,f,s (s=success, f=failure)\n"
            << "  --max-ticks N          Stop after N ticks (default: unlimited)\n"
            << "  --default-duration S   Clip duration when a clip cannot be probed\n"
            << "  --diagnostic           Print config header and run summary\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "EXIT CODES:\n"
            << "  0  sequence complete\n"
            << "  1  configuration or argument error\n"
            << "  2  tick ceiling reached or interrupted\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --config sequence.json --choices f,s,s --max-ticks 9000\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    try {
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--config" && i + 1 < argc) {
        args.config_path = argv[++i];
      } else if (arg == "--choices" && i + 1 < argc) {
        args.choices = argv[++i];
      } else if (arg == "--max-ticks" && i + 1 < argc) {
        args.max_ticks = std::stoll(argv[++i]);
      } else if (arg == "--default-duration" && i + 1 < argc) {
        args.default_duration_s = std::stod(argv[++i]);
      } else if (arg == "--diagnostic") {
        args.diagnostic = true;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    } catch (const std::logic_error&) {
      args.error = "Invalid value for " + arg;
      return args;
    }
  }

  if (args.config_path.empty()) {
    args.error = "Must specify --config";
    return args;
  }
  if (args.max_ticks < 0) {
    args.error = "--max-ticks must be non-negative";
    return args;
  }
  if (args.default_duration_s < 0.0) {
    args.error = "--default-duration must be non-negative";
    return args;
  }

  args.valid = true;
  return args;
}

std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// Relative references are relative to the config file's directory.
void ResolveReferences(storyreel::runtime::Sequence& questions,
                       const std::filesystem::path& base_dir) {
  auto resolve = [&](std::string& uri) {
    if (uri.empty()) return;
    std::filesystem::path path(uri);
    if (path.is_relative()) {
      uri = (base_dir / path).lexically_normal().string();
    }
  };
  for (auto& set : questions) {
    for (auto& bundle : set.bundles) {
      resolve(bundle.video_uri);
      resolve(bundle.narration_uri);
      resolve(bundle.music_uri);
      resolve(bundle.captions_uri);
    }
  }
}

std::vector<std::string> MediaReferences(const storyreel::runtime::Sequence& questions) {
  std::vector<std::string> uris;
  for (const auto& set : questions) {
    for (const auto& bundle : set.bundles) {
      uris.push_back(bundle.video_uri);
      uris.push_back(bundle.narration_uri);
      uris.push_back(bundle.music_uri);
    }
  }
  return uris;
}

void PrintDiagnosticHeader(const storyreel::runtime::SequenceConfig& config,
                           const CliArgs& args) {
  using storyreel::runtime::CaptionClockName;
  using storyreel::runtime::Phase;

  std::cout << "=== StoryReel Standalone ===\n"
            << "Config:         " << args.config_path << "\n"
            << "Questions:      " << config.questions.size() << "\n"
            << "Tick rate:      " << config.tick_rate.ToString() << "\n"
            << "Caption clock:  " << CaptionClockName(config.caption_clock) << "\n"
            << "Caption offset: " << config.caption_time_offset_s << "s\n"
            << "Clear in gaps:  " << (config.clear_captions_in_gaps ? "yes" : "no") << "\n"
            << "Retry cap:      " << config.max_failure_retries
            << (config.max_failure_retries == 0 ? " (unlimited)" : "") << "\n"
            << "Choices:        " << (args.choices.empty() ? "(none)" : args.choices) << "\n"
            << "Max ticks:      " << (args.max_ticks == 0 ? std::string("unlimited")
                                                          : std::to_string(args.max_ticks))
            << "\n";
  for (std::size_t i = 0; i < config.questions.size(); ++i) {
    const auto& set = config.questions[i];
    std::cout << "  [" << i << "] question=" << set.BundleFor(Phase::kQuestion).video_uri
              << " success=" << set.BundleFor(Phase::kOutcomeSuccess).video_uri
              << " failure=" << set.BundleFor(Phase::kOutcomeFailure).video_uri << "\n";
  }
  std::cout << "\n";
}

void PrintRunSummary(const storyreel::runtime::StoryPlayer& player,
                     storyreel::runtime::StoryPlayer::RunOutcome outcome) {
  using namespace storyreel::runtime;

  const auto flow = player.flow().Snapshot();
  const auto session = player.session().Snapshot();

  std::cout << "\n=== Run Summary ===\n"
            << "Outcome:            " << RunOutcomeName(outcome) << "\n"
            << "Ticks:              " << player.ticks() << "\n"
            << "Flow state:         " << FlowStateName(flow.state) << "\n"
            << "Question index:     " << flow.current_index << "/"
            << player.flow().sequence_length() << "\n"
            << "Bundles loaded:     " << flow.bundles_loaded << "\n"
            << "Bundles completed:  " << session.bundles_completed << "\n"
            << "Bundles superseded: " << session.bundles_superseded << "\n"
            << "Choices accepted:   " << flow.choices_accepted << "\n"
            << "Choices ignored:    " << flow.choices_ignored << "\n"
            << "Failure retries:    " << flow.failure_retries << "\n"
            << "Stale signals:      " << session.stale_signals_discarded << "\n"
            << "Caption changes:    " << player.subtitles().caption_changes() << "\n"
            << "Transitions:\n";
  for (const auto& [edge, count] : flow.transitions) {
    std::cout << "  " << FlowStateName(edge.first) << " -> " << FlowStateName(edge.second)
              << ": " << count << "\n";
  }
}

int Run(const CliArgs& args) {
  using namespace storyreel;

  auto config_json = ReadFile(args.config_path);
  if (!config_json.has_value()) {
    Logger::Error("[HARNESS] CONFIG_UNREADABLE path=" + args.config_path);
    return 1;
  }
  auto config = runtime::SequenceConfig::FromJson(*config_json);
  if (!config.has_value()) {
    Logger::Error("[HARNESS] CONFIG_INVALID path=" + args.config_path);
    return 1;
  }
  auto choices = backend::ScriptedChoiceUi::ParseScript(args.choices);
  if (!choices.has_value()) {
    Logger::Error("[HARNESS] CHOICES_INVALID value=" + args.choices);
    return 1;
  }

  ResolveReferences(config->questions,
                    std::filesystem::path(args.config_path).parent_path());

  if (args.diagnostic) {
    PrintDiagnosticHeader(*config, args);
  }

  const double default_duration_s = args.default_duration_s;
  backend::ClipDurationFn probe =
      [default_duration_s](const std::string& uri) -> std::optional<double> {
    auto info = decode::FFmpegMediaProbe::Probe(uri);
    if (info.has_value()) {
      return info->duration_s;
    }
    if (default_duration_s > 0.0) {
      return default_duration_s;
    }
    return std::nullopt;
  };
  // All clips are probed before the first tick; bundle loads only look up.
  backend::ClipDurationFn durations =
      backend::CacheClipDurations(MediaReferences(config->questions), probe);

  timing::SystemTimeSource time_source;
  backend::HeadlessVideoBackend video(time_source, durations);
  backend::HeadlessAudioBackend narration("narration", time_source, durations);
  backend::HeadlessAudioBackend music("music", time_source, durations);
  backend::ConsoleCaptionDisplay display;
  backend::ScriptedChoiceUi choice_ui(std::move(*choices));

  auto caption_source = [](const std::string& uri) { return ReadFile(uri); };

  runtime::StoryPlayer player(*config, video, narration, music, display, &choice_ui,
                              caption_source);
  choice_ui.SetSubmit([&player](runtime::Choice choice) { player.PostChoice(choice); });

  auto start = player.Start();
  if (!start.success) {
    Logger::Error(std::string("[HARNESS] START_FAILED error=") +
                  runtime::FlowErrorToString(start.error));
    return 1;
  }

  timing::TickClock clock(config->tick_rate.num, config->tick_rate.den);
  auto outcome = player.Run(clock, args.max_ticks, [&](int64_t) {
    video.Poll();
    if (g_termination_requested.load(std::memory_order_acquire)) {
      player.RequestStop();
    }
  });

  if (args.diagnostic) {
    PrintRunSummary(player, outcome);
  }

  return outcome == runtime::StoryPlayer::RunOutcome::kComplete ? 0 : 2;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(args);
}
