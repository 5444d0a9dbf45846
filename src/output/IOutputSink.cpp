// Repository: AdReel
// Component: IOutputSink Interface
// Purpose: Sink status names.
// Copyright (c) 2026 AdReel

#include "adreel/output/IOutputSink.hpp"

namespace adreel::output {

const char* SinkStatusToString(SinkStatus status) {
  switch (status) {
    case SinkStatus::kIdle: return "IDLE";
    case SinkStatus::kStarting: return "STARTING";
    case SinkStatus::kRunning: return "RUNNING";
    case SinkStatus::kError: return "ERROR";
    case SinkStatus::kStopping: return "STOPPING";
    case SinkStatus::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

}  // namespace adreel::output
