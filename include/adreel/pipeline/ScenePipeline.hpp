// Repository: AdReel
// Component: Scene Pipeline
// Purpose: Generates each scene's image, voice-over and video through the
//          provider interfaces, one step at a time, recording every outcome
//          on the campaign's asset set.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PIPELINE_SCENE_PIPELINE_HPP_
#define ADREEL_PIPELINE_SCENE_PIPELINE_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "adreel/campaign/Campaign.hpp"
#include "adreel/media/ImageCodec.hpp"
#include "adreel/pipeline/IWaitStrategy.hpp"
#include "adreel/pipeline/JobPoller.hpp"
#include "adreel/providers/GenerationProviders.hpp"
#include "adreel/render/TextPainter.hpp"

namespace adreel::pipeline {

enum class StepOutcome {
  kCompleted,
  kFailed,
  kSkippedComplete,       // already complete, provider not called
  kSkippedPrerequisite,   // video without a complete image
  kRejected,              // index out of range or illegal state
};

const char* StepOutcomeToString(StepOutcome outcome);

struct StatusEvent {
  size_t scene_index = 0;
  campaign::AssetKind kind = campaign::AssetKind::kImage;
  campaign::AssetStatus status = campaign::AssetStatus::kReady;
  std::string error;
};

using StatusObserver = std::function<void(const StatusEvent&)>;

struct BatchReport {
  campaign::AssetKind kind = campaign::AssetKind::kImage;
  std::vector<StepOutcome> outcomes;  // index-aligned with scenes

  size_t CountOf(StepOutcome outcome) const;
};

// Non-owning; every pointer must outlive the pipeline.
struct PipelineServices {
  providers::IImageGenerator* images = nullptr;
  providers::ISpeechSynthesizer* speech = nullptr;
  providers::IVideoJobService* video_jobs = nullptr;
  media::IImageCodec* image_codec = nullptr;
  render::ITextPainter* text_painter = nullptr;
  IWaitStrategy* wait = nullptr;

  bool IsComplete() const {
    return images && speech && video_jobs && image_codec && text_painter && wait;
  }
};

struct PipelineConfig {
  std::chrono::milliseconds poll_interval = kDefaultPollInterval;
  std::optional<std::chrono::milliseconds> max_video_wait;
  const std::atomic<bool>* stop_requested = nullptr;
  render::FontConfig fonts;
};

// The logo placement sentence is only added when a logo accompanies the request.
std::string BuildImagePrompt(const std::string& visual_prompt, bool with_logo);
std::string BuildVideoPrompt(const std::string& visual_prompt);

class ScenePipeline {
 public:
  ScenePipeline(PipelineServices services, PipelineConfig config);

  void SetStatusObserver(StatusObserver observer);

  // Single steps. A complete asset is never regenerated; a failed one is
  // retried through generating.
  StepOutcome GenerateImage(campaign::Campaign& campaign, size_t index);
  StepOutcome GenerateVoiceover(campaign::Campaign& campaign, size_t index);
  StepOutcome GenerateVideo(campaign::Campaign& campaign, size_t index);

  // Strictly sequential over all scenes in storyboard order. A failing
  // scene is recorded and the batch moves on.
  BatchReport GenerateAllImages(campaign::Campaign& campaign);
  BatchReport GenerateAllVoiceovers(campaign::Campaign& campaign);
  BatchReport GenerateAllVideos(campaign::Campaign& campaign);

 private:
  using StepFn = StepOutcome (ScenePipeline::*)(campaign::Campaign&, size_t);

  BatchReport RunBatch(campaign::Campaign& campaign, campaign::AssetKind kind,
                       StepFn step);
  // Begin() with outcome mapping and notification.
  std::optional<StepOutcome> BeginStep(campaign::SceneAsset& asset, size_t index,
                                       campaign::AssetKind kind);
  StepOutcome RejectMissingServices() const;
  StepOutcome FailStep(campaign::SceneAsset& asset, size_t index,
                       campaign::AssetKind kind, const std::string& message);
  StepOutcome CompleteStep(const campaign::SceneAsset& asset, size_t index,
                           campaign::AssetKind kind, bool stored);
  void Notify(size_t index, campaign::AssetKind kind,
              const campaign::SceneAsset& asset);

  PipelineServices services_;
  PipelineConfig config_;
  StatusObserver observer_;
};

}  // namespace adreel::pipeline

#endif  // ADREEL_PIPELINE_SCENE_PIPELINE_HPP_
