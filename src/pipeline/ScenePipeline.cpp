// Repository: AdReel
// Component: Scene Pipeline
// Purpose: Per-scene generation steps and sequential batches.
// Copyright (c) 2026 AdReel

#include "adreel/pipeline/ScenePipeline.hpp"

#include "adreel/render/Watermark.hpp"
#include "adreel/util/Logger.hpp"

namespace adreel::pipeline {

using campaign::AssetKind;
using campaign::AssetStatus;
using campaign::BeginResult;

const char* StepOutcomeToString(StepOutcome outcome) {
  switch (outcome) {
    case StepOutcome::kCompleted: return "COMPLETED";
    case StepOutcome::kFailed: return "FAILED";
    case StepOutcome::kSkippedComplete: return "SKIPPED_COMPLETE";
    case StepOutcome::kSkippedPrerequisite: return "SKIPPED_PREREQUISITE";
    case StepOutcome::kRejected: return "REJECTED";
  }
  return "UNKNOWN";
}

size_t BatchReport::CountOf(StepOutcome outcome) const {
  size_t n = 0;
  for (StepOutcome o : outcomes) {
    if (o == outcome) ++n;
  }
  return n;
}

std::string BuildImagePrompt(const std::string& visual_prompt, bool with_logo) {
  std::string prompt =
      "Generate a photorealistic image based on this description: \"" +
      visual_prompt + "\".";
  if (with_logo) {
    prompt +=
        " The second image provided is a logo. Please place this logo "
        "naturally and realistically onto the main product described in the "
        "scene.";
  }
  return prompt;
}

std::string BuildVideoPrompt(const std::string& visual_prompt) {
  return "Animate this image according to the following description: \"" +
         visual_prompt + "\"";
}

ScenePipeline::ScenePipeline(PipelineServices services, PipelineConfig config)
    : services_(services), config_(std::move(config)) {}

void ScenePipeline::SetStatusObserver(StatusObserver observer) {
  observer_ = std::move(observer);
}

void ScenePipeline::Notify(size_t index, AssetKind kind,
                           const campaign::SceneAsset& asset) {
  StatusEvent event;
  event.scene_index = index;
  event.kind = kind;
  event.status = asset.status(kind);
  event.error = asset.error(kind);

  std::string line = std::string("[ScenePipeline] scene=") + std::to_string(index) +
                     " kind=" + campaign::AssetKindToString(kind) +
                     " status=" + campaign::AssetStatusToString(event.status);
  if (event.status == AssetStatus::kFailed) {
    util::Logger::Warn(line + " error=" + event.error);
  } else {
    util::Logger::Info(line);
  }
  if (observer_) observer_(event);
}

std::optional<StepOutcome> ScenePipeline::BeginStep(campaign::SceneAsset& asset,
                                                    size_t index, AssetKind kind) {
  switch (asset.Begin(kind)) {
    case BeginResult::kStarted:
      Notify(index, kind, asset);
      return std::nullopt;
    case BeginResult::kAlreadyComplete:
      util::Logger::Debug(std::string("[ScenePipeline] scene=") + std::to_string(index) +
                          " kind=" + campaign::AssetKindToString(kind) +
                          " already complete, skipping");
      return StepOutcome::kSkippedComplete;
    case BeginResult::kPrerequisiteMissing:
      util::Logger::Debug("[ScenePipeline] scene=" + std::to_string(index) +
                          " video skipped: image not complete");
      return StepOutcome::kSkippedPrerequisite;
    case BeginResult::kIllegal:
      util::Logger::Error(std::string("[ScenePipeline] scene=") + std::to_string(index) +
                          " kind=" + campaign::AssetKindToString(kind) + " begin " +
                          campaign::BeginResultToString(BeginResult::kIllegal));
      return StepOutcome::kRejected;
  }
  return StepOutcome::kRejected;
}

StepOutcome ScenePipeline::RejectMissingServices() const {
  util::Logger::Error("[ScenePipeline] Step rejected: provider services not configured");
  return StepOutcome::kRejected;
}

StepOutcome ScenePipeline::FailStep(campaign::SceneAsset& asset, size_t index,
                                    AssetKind kind, const std::string& message) {
  if (!asset.Fail(kind, message)) return StepOutcome::kRejected;
  Notify(index, kind, asset);
  return StepOutcome::kFailed;
}

StepOutcome ScenePipeline::CompleteStep(const campaign::SceneAsset& asset,
                                        size_t index, AssetKind kind,
                                        bool stored) {
  if (!stored) return StepOutcome::kRejected;
  Notify(index, kind, asset);
  return StepOutcome::kCompleted;
}

StepOutcome ScenePipeline::GenerateImage(campaign::Campaign& campaign,
                                         size_t index) {
  campaign::SceneAsset* asset = campaign.assets.Get(index);
  if (!asset || index >= campaign.scenes.size()) return StepOutcome::kRejected;
  if (!services_.IsComplete()) return RejectMissingServices();
  if (auto early = BeginStep(*asset, index, AssetKind::kImage)) return *early;

  providers::ImageRequest request;
  const media::MediaHandle& logo = campaign.branding.logo_source;
  const bool with_logo = logo && !logo->empty();
  request.prompt = BuildImagePrompt(campaign.scenes[index].visual_prompt, with_logo);
  if (with_logo) request.logo = logo;

  auto generated = services_.images->GenerateImage(request);
  if (!generated.ok) {
    return FailStep(*asset, index, AssetKind::kImage, generated.error);
  }
  if (!generated.value || generated.value->empty()) {
    return FailStep(*asset, index, AssetKind::kImage,
                    "Model returned an empty image payload.");
  }
  media::MediaHandle raw = generated.value;

  auto decoded = services_.image_codec->Decode(raw);
  if (!decoded.ok) {
    return FailStep(*asset, index, AssetKind::kImage,
                    "Generated image could not be decoded: " + decoded.error);
  }

  media::MediaHandle renderable = raw;
  const std::string& watermark = campaign.branding.watermark_text;
  if (!watermark.empty()) {
    auto stamped = render::ApplyWatermark(decoded.value, watermark,
                                          *services_.text_painter, config_.fonts);
    if (!stamped.ok) {
      return FailStep(*asset, index, AssetKind::kImage, stamped.error);
    }
    auto png = services_.image_codec->EncodePng(stamped.value);
    if (!png.ok) {
      return FailStep(*asset, index, AssetKind::kImage, png.error);
    }
    renderable = png.value;
  }

  return CompleteStep(*asset, index, AssetKind::kImage,
                      asset->CompleteImage(raw, renderable));
}

StepOutcome ScenePipeline::GenerateVoiceover(campaign::Campaign& campaign,
                                             size_t index) {
  campaign::SceneAsset* asset = campaign.assets.Get(index);
  if (!asset || index >= campaign.scenes.size()) return StepOutcome::kRejected;
  if (!services_.IsComplete()) return RejectMissingServices();
  if (auto early = BeginStep(*asset, index, AssetKind::kVoiceover)) return *early;

  providers::SpeechRequest request;
  request.text = campaign.scenes[index].voiceover_text;
  if (!campaign.voice_id.empty()) request.voice_id = campaign.voice_id;

  auto audio = services_.speech->Synthesize(request);
  if (!audio.ok) {
    return FailStep(*asset, index, AssetKind::kVoiceover, audio.error);
  }
  if (!audio.value || audio.value->empty()) {
    return FailStep(*asset, index, AssetKind::kVoiceover,
                    "TTS provider returned empty audio");
  }
  return CompleteStep(*asset, index, AssetKind::kVoiceover,
                      asset->CompleteVoiceover(audio.value));
}

StepOutcome ScenePipeline::GenerateVideo(campaign::Campaign& campaign,
                                         size_t index) {
  campaign::SceneAsset* asset = campaign.assets.Get(index);
  if (!asset || index >= campaign.scenes.size()) return StepOutcome::kRejected;
  if (!services_.IsComplete()) return RejectMissingServices();
  if (auto early = BeginStep(*asset, index, AssetKind::kVideo)) return *early;

  providers::VideoJobRequest request;
  request.prompt = BuildVideoPrompt(campaign.scenes[index].visual_prompt);
  request.image = asset->image_bytes();

  PollOptions options;
  options.interval = config_.poll_interval;
  options.max_wait = config_.max_video_wait;
  options.stop_requested = config_.stop_requested;

  JobPoller poller(*services_.video_jobs, *services_.wait);
  PollOutcome polled = poller.Run(request, options);
  if (!polled.ok) {
    util::Logger::Warn(std::string("[ScenePipeline] scene=") + std::to_string(index) +
                       " video job " + PollErrorToString(polled.error) +
                       " after polls=" + std::to_string(polled.poll_count));
    return FailStep(*asset, index, AssetKind::kVideo, polled.detail);
  }

  auto clip = services_.video_jobs->Fetch(polled.result_uri);
  if (!clip.ok) {
    return FailStep(*asset, index, AssetKind::kVideo,
                    "Failed to download video: " + clip.error);
  }
  if (!clip.value || clip.value->empty()) {
    return FailStep(*asset, index, AssetKind::kVideo,
                    "Failed to download video: empty response body");
  }
  return CompleteStep(*asset, index, AssetKind::kVideo,
                      asset->CompleteVideo(clip.value));
}

BatchReport ScenePipeline::RunBatch(campaign::Campaign& campaign, AssetKind kind,
                                    StepFn step) {
  BatchReport report;
  report.kind = kind;
  report.outcomes.reserve(campaign.scenes.size());
  for (size_t i = 0; i < campaign.scenes.size(); ++i) {
    report.outcomes.push_back((this->*step)(campaign, i));
    util::Logger::Debug(std::string("[ScenePipeline] scene=") + std::to_string(i) +
                        " kind=" + campaign::AssetKindToString(kind) + " outcome=" +
                        StepOutcomeToString(report.outcomes.back()));
  }
  util::Logger::Info(std::string("[ScenePipeline] Batch ") +
                     campaign::AssetKindToString(kind) + " done completed=" +
                     std::to_string(report.CountOf(StepOutcome::kCompleted)) +
                     " failed=" + std::to_string(report.CountOf(StepOutcome::kFailed)) +
                     " skipped=" +
                     std::to_string(report.CountOf(StepOutcome::kSkippedComplete) +
                                    report.CountOf(StepOutcome::kSkippedPrerequisite)));
  return report;
}

BatchReport ScenePipeline::GenerateAllImages(campaign::Campaign& campaign) {
  return RunBatch(campaign, AssetKind::kImage, &ScenePipeline::GenerateImage);
}

BatchReport ScenePipeline::GenerateAllVoiceovers(campaign::Campaign& campaign) {
  return RunBatch(campaign, AssetKind::kVoiceover, &ScenePipeline::GenerateVoiceover);
}

BatchReport ScenePipeline::GenerateAllVideos(campaign::Campaign& campaign) {
  return RunBatch(campaign, AssetKind::kVideo, &ScenePipeline::GenerateVideo);
}

}  // namespace adreel::pipeline
