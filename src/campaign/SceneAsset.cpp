// Repository: AdReel
// Component: Scene Assets
// Purpose: Gated per-kind transitions and readiness predicates.
// Copyright (c) 2026 AdReel

#include "adreel/campaign/SceneAsset.hpp"

namespace adreel::campaign {

const char* BeginResultToString(BeginResult result) {
  switch (result) {
    case BeginResult::kStarted: return "STARTED";
    case BeginResult::kAlreadyComplete: return "ALREADY_COMPLETE";
    case BeginResult::kPrerequisiteMissing: return "PREREQUISITE_MISSING";
    case BeginResult::kIllegal: return "ILLEGAL";
  }
  return "UNKNOWN";
}

SceneAsset::SceneAsset()
    : image_(AssetKind::kImage),
      voiceover_(AssetKind::kVoiceover),
      video_(AssetKind::kVideo) {}

const AssetState& SceneAsset::state(AssetKind kind) const {
  switch (kind) {
    case AssetKind::kImage: return image_;
    case AssetKind::kVoiceover: return voiceover_;
    case AssetKind::kVideo: return video_;
  }
  return image_;
}

AssetState& SceneAsset::mutable_state(AssetKind kind) {
  switch (kind) {
    case AssetKind::kImage: return image_;
    case AssetKind::kVoiceover: return voiceover_;
    case AssetKind::kVideo: return video_;
  }
  return image_;
}

BeginResult SceneAsset::Begin(AssetKind kind) {
  AssetState& s = mutable_state(kind);
  if (s.status() == AssetStatus::kComplete) {
    return BeginResult::kAlreadyComplete;
  }
  if (kind == AssetKind::kVideo &&
      (image_.status() != AssetStatus::kComplete || !image_bytes_)) {
    return BeginResult::kPrerequisiteMissing;
  }
  if (!s.TransitionTo(AssetStatus::kGenerating)) {
    return BeginResult::kIllegal;
  }
  return BeginResult::kStarted;
}

bool SceneAsset::CompleteImage(media::MediaHandle raw,
                               media::MediaHandle renderable) {
  if (!raw || !renderable) return false;
  if (!image_.TransitionTo(AssetStatus::kComplete)) return false;
  image_bytes_ = std::move(raw);
  image_url_ = std::move(renderable);
  return true;
}

bool SceneAsset::CompleteVoiceover(media::MediaHandle audio) {
  if (!audio) return false;
  if (!voiceover_.TransitionTo(AssetStatus::kComplete)) return false;
  audio_url_ = std::move(audio);
  return true;
}

bool SceneAsset::CompleteVideo(media::MediaHandle clip) {
  if (!clip) return false;
  if (!video_.TransitionTo(AssetStatus::kComplete)) return false;
  video_url_ = std::move(clip);
  return true;
}

bool SceneAsset::Fail(AssetKind kind, const std::string& message) {
  if (!mutable_state(kind).TransitionTo(AssetStatus::kFailed, message)) {
    return false;
  }
  switch (kind) {
    case AssetKind::kImage:
      image_bytes_.reset();
      image_url_.reset();
      break;
    case AssetKind::kVoiceover:
      audio_url_.reset();
      break;
    case AssetKind::kVideo:
      video_url_.reset();
      break;
  }
  return true;
}

uint64_t SceneAsset::illegal_transition_count() const {
  return image_.illegal_transition_count() +
         voiceover_.illegal_transition_count() +
         video_.illegal_transition_count();
}

SceneAsset* CampaignAssetSet::Get(size_t index) {
  return index < assets_.size() ? &assets_[index] : nullptr;
}

const SceneAsset* CampaignAssetSet::Get(size_t index) const {
  return index < assets_.size() ? &assets_[index] : nullptr;
}

bool CampaignAssetSet::AllComplete(AssetKind kind) const {
  if (assets_.empty()) return false;
  for (const auto& asset : assets_) {
    if (asset.status(kind) != AssetStatus::kComplete) return false;
  }
  return true;
}

bool CampaignAssetSet::ReadyForExport() const {
  return AllComplete(AssetKind::kVideo) && AllComplete(AssetKind::kVoiceover);
}

size_t CampaignAssetSet::CountWithStatus(AssetKind kind,
                                         AssetStatus status) const {
  size_t n = 0;
  for (const auto& asset : assets_) {
    if (asset.status(kind) == status) ++n;
  }
  return n;
}

}  // namespace adreel::campaign
