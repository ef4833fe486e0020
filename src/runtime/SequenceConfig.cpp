// Repository: StoryReel
// Component: SequenceConfig Domain Implementation
// Purpose: Parse and validate SequenceConfig from JSON.
// Copyright (c) 2025 StoryReel

#include "storyreel/runtime/SequenceConfig.h"

#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace storyreel::runtime {

namespace {
  // The schema is small and fixed, so it is scanned directly rather than
  // through a JSON library. Keys are matched by exact quoted name; the
  // top-level key names are distinct from the bundle key names.

  constexpr const char* kPhaseKeys[kPhaseCount] = {"question", "success", "failure"};

  bool HasKey(const std::string& json, const std::string& field_name) {
    return json.find("\"" + field_name + "\"") != std::string::npos;
  }

  // Position of the bracket closing the one at open_pos, skipping string
  // literals. npos when unbalanced.
  size_t FindClosing(const std::string& json, size_t open_pos, char open, char close) {
    int depth = 0;
    bool in_string = false;
    for (size_t pos = open_pos; pos < json.size(); ++pos) {
      const char c = json[pos];
      if (in_string) {
        if (c == '\\') {
          ++pos;
        } else if (c == '"') {
          in_string = false;
        }
        continue;
      }
      if (c == '"') {
        in_string = true;
      } else if (c == open) {
        ++depth;
      } else if (c == close) {
        if (--depth == 0) return pos;
      }
    }
    return std::string::npos;
  }

  // Extract a nested object or array value, brackets included.
  bool ExtractContainer(const std::string& json, const std::string& field_name,
                        char open, char close, std::string& out_json) {
    const std::string open_pattern = open == '{' ? "\\{" : "\\[";
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*" + open_pattern);
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    const size_t start_pos = static_cast<size_t>(match.position() + match.length() - 1);
    const size_t end_pos = FindClosing(json, start_pos, open, close);
    if (end_pos == std::string::npos) {
      return false;
    }
    out_json = json.substr(start_pos, end_pos - start_pos + 1);
    return true;
  }

  // Decodes the JSON short escapes. \u escapes are not supported and fail.
  bool Unescape(const std::string& raw, std::string& out) {
    out.clear();
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
      if (raw[i] != '\\') {
        out.push_back(raw[i]);
        continue;
      }
      if (++i >= raw.size()) {
        return false;
      }
      switch (raw[i]) {
        case '"':  out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        default:
          return false;
      }
    }
    return true;
  }

  std::string Escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
      switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:   out.push_back(c); break;
      }
    }
    return out;
  }

  bool ExtractString(const std::string& json, const std::string& field_name,
                     std::string& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    return Unescape(match[1].str(), out_value);
  }

  bool ExtractDouble(const std::string& json, const std::string& field_name,
                     double& out_value) {
    std::regex pattern("\"" + field_name +
                       "\"\\s*:\\s*(-?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][-+]?\\d+)?)");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    try {
      out_value = std::stod(match[1].str());
    } catch (const std::out_of_range&) {
      return false;
    }
    return true;
  }

  bool ExtractInt(const std::string& json, const std::string& field_name,
                  int32_t& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(-?\\d+)\\s*[,}\\n]");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return false;
    }
    try {
      out_value = std::stoi(match[1].str());
    } catch (const std::out_of_range&) {
      return false;
    }
    return true;
  }

  bool ExtractBool(const std::string& json, const std::string& field_name,
                   bool& out_value) {
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(true|false)");
    std::smatch match;
    if (std::regex_search(json, match, pattern)) {
      out_value = match[1].str() == "true";
      return true;
    }
    return false;
  }

  // Splits the body of a JSON array into its top-level object elements.
  bool SplitObjects(const std::string& array_json, std::vector<std::string>& out) {
    // array_json includes the surrounding brackets.
    size_t pos = 1;
    const size_t end = array_json.size() - 1;
    while (pos < end) {
      const char c = array_json[pos];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
        ++pos;
        continue;
      }
      if (c != '{') {
        return false;
      }
      const size_t close = FindClosing(array_json, pos, '{', '}');
      if (close == std::string::npos || close >= end) {
        return false;
      }
      out.push_back(array_json.substr(pos, close - pos + 1));
      pos = close + 1;
    }
    return true;
  }

  bool ParseBundle(const std::string& bundle_json, MediaBundle& out) {
    struct Field {
      const char* key;
      std::string* target;
    };
    const Field fields[] = {
        {"video", &out.video_uri},
        {"narration", &out.narration_uri},
        {"music", &out.music_uri},
        {"captions", &out.captions_uri},
    };
    for (const auto& field : fields) {
      if (!HasKey(bundle_json, field.key)) continue;
      if (!ExtractString(bundle_json, field.key, *field.target)) {
        return false;
      }
    }
    return true;
  }

  bool ParseQuestionSet(const std::string& question_json, QuestionSet& out) {
    for (std::size_t i = 0; i < kPhaseCount; ++i) {
      std::string bundle_json;
      if (!ExtractContainer(question_json, kPhaseKeys[i], '{', '}', bundle_json)) {
        continue;  // absent phase: empty bundle
      }
      if (!ParseBundle(bundle_json, out.bundles[i])) {
        return false;
      }
    }
    return true;
  }
}  // namespace

std::string TickRate::ToString() const {
  std::ostringstream oss;
  oss << num << "/" << den;
  return oss.str();
}

std::optional<TickRate> TickRate::Parse(const std::string& text) {
  std::regex pattern(R"((\d+)/(\d+))");
  std::smatch match;
  if (!std::regex_match(text, match, pattern)) {
    return std::nullopt;
  }
  TickRate rate;
  try {
    rate.num = std::stoll(match[1].str());
    rate.den = std::stoll(match[2].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (!rate.IsValid()) {
    return std::nullopt;
  }
  return rate;
}

std::optional<SequenceConfig> SequenceConfig::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  SequenceConfig config;

  std::string questions_json;
  if (!ExtractContainer(json_str, "questions", '[', ']', questions_json)) {
    return std::nullopt;
  }
  std::vector<std::string> question_objects;
  if (!SplitObjects(questions_json, question_objects)) {
    return std::nullopt;
  }
  for (const auto& question_json : question_objects) {
    QuestionSet set;
    if (!ParseQuestionSet(question_json, set)) {
      return std::nullopt;
    }
    config.questions.push_back(std::move(set));
  }

  // Optional keys: absent means default, present but malformed is an error.
  if (HasKey(json_str, "caption_time_offset_s") &&
      !ExtractDouble(json_str, "caption_time_offset_s", config.caption_time_offset_s)) {
    return std::nullopt;
  }
  if (HasKey(json_str, "clear_captions_in_gaps") &&
      !ExtractBool(json_str, "clear_captions_in_gaps", config.clear_captions_in_gaps)) {
    return std::nullopt;
  }
  if (HasKey(json_str, "max_failure_retries") &&
      !ExtractInt(json_str, "max_failure_retries", config.max_failure_retries)) {
    return std::nullopt;
  }
  if (HasKey(json_str, "caption_clock")) {
    std::string clock;
    if (!ExtractString(json_str, "caption_clock", clock)) {
      return std::nullopt;
    }
    if (clock == "narration") {
      config.caption_clock = CaptionClock::kNarration;
    } else if (clock == "video") {
      config.caption_clock = CaptionClock::kVideo;
    } else {
      return std::nullopt;
    }
  }
  if (HasKey(json_str, "tick_rate")) {
    std::string rate_text;
    if (!ExtractString(json_str, "tick_rate", rate_text)) {
      return std::nullopt;
    }
    auto rate = TickRate::Parse(rate_text);
    if (!rate.has_value()) {
      return std::nullopt;
    }
    config.tick_rate = *rate;
  }

  if (!config.IsValid()) {
    return std::nullopt;
  }
  return config;
}

std::string SequenceConfig::ToJson() const {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10);
  oss << "{"
      << "\"caption_time_offset_s\":" << caption_time_offset_s << ","
      << "\"clear_captions_in_gaps\":" << (clear_captions_in_gaps ? "true" : "false") << ","
      << "\"caption_clock\":\"" << CaptionClockName(caption_clock) << "\","
      << "\"max_failure_retries\":" << max_failure_retries << ","
      << "\"tick_rate\":\"" << tick_rate.ToString() << "\","
      << "\"questions\":[";
  for (std::size_t q = 0; q < questions.size(); ++q) {
    if (q > 0) oss << ",";
    oss << "{";
    for (std::size_t i = 0; i < kPhaseCount; ++i) {
      const MediaBundle& b = questions[q].bundles[i];
      if (i > 0) oss << ",";
      oss << "\"" << kPhaseKeys[i] << "\":{"
          << "\"video\":\"" << Escape(b.video_uri) << "\","
          << "\"narration\":\"" << Escape(b.narration_uri) << "\","
          << "\"music\":\"" << Escape(b.music_uri) << "\","
          << "\"captions\":\"" << Escape(b.captions_uri) << "\""
          << "}";
    }
    oss << "}";
  }
  oss << "]}";
  return oss.str();
}

bool SequenceConfig::IsValid() const {
  if (questions.empty()) {
    return false;
  }
  if (!questions.front().BundleFor(Phase::kQuestion).HasVideo()) {
    return false;
  }
  if (!tick_rate.IsValid()) {
    return false;
  }
  if (max_failure_retries < 0) {
    return false;
  }
  return true;
}

SubtitleDriverConfig SequenceConfig::subtitle_config() const {
  SubtitleDriverConfig config;
  config.time_offset_s = caption_time_offset_s;
  config.clear_in_gaps = clear_captions_in_gaps;
  return config;
}

PlaybackSessionConfig SequenceConfig::session_config() const {
  PlaybackSessionConfig config;
  config.caption_clock = caption_clock;
  return config;
}

FlowConfig SequenceConfig::flow_config() const {
  FlowConfig config;
  config.max_failure_retries = max_failure_retries;
  return config;
}

}  // namespace storyreel::runtime
