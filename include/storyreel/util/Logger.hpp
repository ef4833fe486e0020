// Repository: StoryReel
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for the tick thread and backend workers.
// Copyright (c) 2025 StoryReel

#ifndef STORYREEL_UTIL_LOGGER_HPP_
#define STORYREEL_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace storyreel::util {

// Logger serializes whole-line emission behind a single static mutex so that
// backend prepare workers and the tick thread never interleave output.
//
// Info  → stdout (flow transitions, bundle summaries)
// Debug → stdout only when STORYREEL_DEBUG env is set (stale signals, ignored choices)
// Warn  → stderr (dropped caption data, rejected loads)
// Error → stderr (configuration errors)
//
// Test-only: the sinks receive every line of their level in addition to the
// console. Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace storyreel::util

#endif  // STORYREEL_UTIL_LOGGER_HPP_
