// Repository: AdReel
// Component: Asset State
// Purpose: Per-asset-kind status with a single, validated transition table.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_CAMPAIGN_ASSET_STATE_HPP_
#define ADREEL_CAMPAIGN_ASSET_STATE_HPP_

#include <cstdint>
#include <string>

namespace adreel::campaign {

enum class AssetKind {
  kImage,
  kVoiceover,
  kVideo,
};

enum class AssetStatus {
  kReady,
  kGenerating,
  kComplete,
  kFailed,
};

const char* AssetKindToString(AssetKind kind);
const char* AssetStatusToString(AssetStatus status);

// Legal edges:
//   ready      -> generating
//   generating -> complete
//   generating -> failed
//   failed     -> generating   (manual retry)
// Everything else, including self-transitions, is illegal.
bool IsLegalTransition(AssetStatus from, AssetStatus to);

// AssetState is the only place an asset's status changes. An illegal request
// leaves the state untouched, is logged as an error and counted.
class AssetState {
 public:
  explicit AssetState(AssetKind kind);

  AssetKind kind() const { return kind_; }
  AssetStatus status() const { return status_; }

  // Last failure message; empty unless status() == kFailed.
  const std::string& error() const { return error_; }

  // error_message is recorded only when entering kFailed.
  bool TransitionTo(AssetStatus to, const std::string& error_message = "");

  uint64_t illegal_transition_count() const { return illegal_transition_count_; }

 private:
  void RecordIllegalTransition(AssetStatus attempted_to);

  AssetKind kind_;
  AssetStatus status_ = AssetStatus::kReady;
  std::string error_;
  uint64_t illegal_transition_count_ = 0;
};

}  // namespace adreel::campaign

#endif  // ADREEL_CAMPAIGN_ASSET_STATE_HPP_
