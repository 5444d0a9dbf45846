// Repository: AdReel
// Component: Scene Assets
// Purpose: Per-scene generated media plus the campaign-wide asset set and its
//          readiness predicates.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_CAMPAIGN_SCENE_ASSET_HPP_
#define ADREEL_CAMPAIGN_SCENE_ASSET_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "adreel/campaign/AssetState.hpp"
#include "adreel/media/MediaBlob.hpp"

namespace adreel::campaign {

enum class BeginResult {
  kStarted,
  kAlreadyComplete,       // idempotent skip, nothing changed
  kPrerequisiteMissing,   // video requested before the image is complete
  kIllegal,               // e.g. already generating
};

const char* BeginResultToString(BeginResult result);

// SceneAsset holds three independent asset states and their payload handles.
// Payloads are set only together with a transition into kComplete and are
// cleared when the kind fails.
class SceneAsset {
 public:
  SceneAsset();

  const AssetState& state(AssetKind kind) const;
  AssetStatus status(AssetKind kind) const { return state(kind).status(); }
  const std::string& error(AssetKind kind) const { return state(kind).error(); }

  // Moves kind into kGenerating. Video is gated on a complete image.
  BeginResult Begin(AssetKind kind);

  bool CompleteImage(media::MediaHandle raw, media::MediaHandle renderable);
  bool CompleteVoiceover(media::MediaHandle audio);
  bool CompleteVideo(media::MediaHandle clip);
  bool Fail(AssetKind kind, const std::string& message);

  // Raw, unwatermarked generator output (input to video generation).
  const media::MediaHandle& image_bytes() const { return image_bytes_; }
  // Watermarked still for display.
  const media::MediaHandle& image_url() const { return image_url_; }
  const media::MediaHandle& audio_url() const { return audio_url_; }
  const media::MediaHandle& video_url() const { return video_url_; }

  uint64_t illegal_transition_count() const;

 private:
  AssetState& mutable_state(AssetKind kind);

  AssetState image_;
  AssetState voiceover_;
  AssetState video_;

  media::MediaHandle image_bytes_;
  media::MediaHandle image_url_;
  media::MediaHandle audio_url_;
  media::MediaHandle video_url_;
};

// Index-aligned with the accepted storyboard; the length is fixed at
// construction and never changes.
class CampaignAssetSet {
 public:
  CampaignAssetSet() = default;
  explicit CampaignAssetSet(size_t scene_count) : assets_(scene_count) {}

  size_t size() const { return assets_.size(); }
  bool empty() const { return assets_.empty(); }

  // nullptr when index is out of range.
  SceneAsset* Get(size_t index);
  const SceneAsset* Get(size_t index) const;

  bool AllComplete(AssetKind kind) const;
  bool AllImagesComplete() const { return AllComplete(AssetKind::kImage); }
  bool AllVoiceoversComplete() const { return AllComplete(AssetKind::kVoiceover); }
  bool AllVideosComplete() const { return AllComplete(AssetKind::kVideo); }

  // Every scene has both a clip and a voice-over.
  bool ReadyForExport() const;

  size_t CountWithStatus(AssetKind kind, AssetStatus status) const;

 private:
  std::vector<SceneAsset> assets_;
};

}  // namespace adreel::campaign

#endif  // ADREEL_CAMPAIGN_SCENE_ASSET_HPP_
