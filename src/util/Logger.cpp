// Repository: AdReel
// Component: Thread-Safe Logger
// Purpose: Campaign tag, level routing and the test sink.
// Copyright (c) 2026 AdReel

#include "adreel/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace adreel::util {

namespace {

struct LoggerState {
  std::mutex mutex;
  std::string campaign_tag;
  Logger::Sink sink;
};

LoggerState& State() {
  static LoggerState state;
  return state;
}

}  // namespace

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::SetCampaignTag(const std::string& tag) {
  LoggerState& s = State();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.campaign_tag = tag;
}

std::string Logger::CampaignTag() {
  LoggerState& s = State();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.campaign_tag;
}

void Logger::SetSink(Sink sink) {
  LoggerState& s = State();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sink = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("ADREEL_DEBUG") != nullptr;
}

void Logger::Emit(LogLevel level, const std::string& line) {
  LoggerState& s = State();
  std::lock_guard<std::mutex> lock(s.mutex);
  const std::string tagged =
      s.campaign_tag.empty() ? line : "[campaign=" + s.campaign_tag + "] " + line;
  if (s.sink) s.sink(level, tagged);

  std::ostream& out =
      (level == LogLevel::kWarn || level == LogLevel::kError) ? std::cerr : std::cout;
  out << tagged << '\n';
  out.flush();
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

}  // namespace adreel::util
