// Repository: AdReel
// Component: Asset State
// Purpose: Central transition table for scene asset generation status.
// Copyright (c) 2026 AdReel

#include "adreel/campaign/AssetState.hpp"

#include "adreel/util/Logger.hpp"

namespace adreel::campaign {

const char* AssetKindToString(AssetKind kind) {
  switch (kind) {
    case AssetKind::kImage: return "image";
    case AssetKind::kVoiceover: return "voiceover";
    case AssetKind::kVideo: return "video";
  }
  return "unknown";
}

const char* AssetStatusToString(AssetStatus status) {
  switch (status) {
    case AssetStatus::kReady: return "ready";
    case AssetStatus::kGenerating: return "generating";
    case AssetStatus::kComplete: return "complete";
    case AssetStatus::kFailed: return "failed";
  }
  return "unknown";
}

bool IsLegalTransition(AssetStatus from, AssetStatus to) {
  switch (from) {
    case AssetStatus::kReady:
      return to == AssetStatus::kGenerating;
    case AssetStatus::kGenerating:
      return to == AssetStatus::kComplete || to == AssetStatus::kFailed;
    case AssetStatus::kFailed:
      return to == AssetStatus::kGenerating;
    case AssetStatus::kComplete:
      return false;
  }
  return false;
}

AssetState::AssetState(AssetKind kind) : kind_(kind) {}

bool AssetState::TransitionTo(AssetStatus to, const std::string& error_message) {
  if (!IsLegalTransition(status_, to)) {
    RecordIllegalTransition(to);
    return false;
  }
  status_ = to;
  if (to == AssetStatus::kFailed) {
    error_ = error_message;
  } else {
    error_.clear();
  }
  return true;
}

void AssetState::RecordIllegalTransition(AssetStatus attempted_to) {
  ++illegal_transition_count_;
  util::Logger::Error(std::string("[AssetState] ILLEGAL_TRANSITION kind=") +
                      AssetKindToString(kind_) +
                      " from=" + AssetStatusToString(status_) +
                      " to=" + AssetStatusToString(attempted_to));
}

}  // namespace adreel::campaign
