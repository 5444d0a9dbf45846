// Repository: AdReel
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, campaign-tagged log emission shared by the
//          pipeline, compositor and CLI.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_UTIL_LOGGER_HPP_
#define ADREEL_UTIL_LOGGER_HPP_

#include <functional>
#include <string>

namespace adreel::util {

enum class LogLevel {
  kDebug,  // stdout, only when ADREEL_DEBUG is set
  kInfo,   // stdout
  kWarn,   // stderr: one scene failed, the batch goes on
  kError,  // stderr: illegal transitions, export failures
};

const char* LogLevelToString(LogLevel level);

// Logger writes one full line per call under a single mutex. While a
// campaign is active every line carries its tag:
//
//   [campaign=trail_runner_shoes] [ScenePipeline] scene=1 kind=image status=complete
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Empty clears the tag.
  static void SetCampaignTag(const std::string& tag);
  static std::string CampaignTag();

  // Receives every emitted line, tag included, besides the console. Call with
  // nullptr to clear. Used by tests.
  static void SetSink(Sink sink);

  static bool DebugEnabled();

 private:
  static void Emit(LogLevel level, const std::string& line);
};

}  // namespace adreel::util

#endif  // ADREEL_UTIL_LOGGER_HPP_
