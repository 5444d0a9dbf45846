// Repository: AdReel
// Component: Fake Generation Providers
// Purpose: Fake provider implementations.
// Copyright (c) 2026 AdReel

#include "harness/FakeProviders.hpp"

#include "harness/FakeMedia.hpp"

namespace adreel::testing {

const std::string* FailureRules::Match(const std::string& text) {
  for (auto& rule : rules_) {
    if (rule.remaining == 0) continue;
    if (text.find(rule.needle) != std::string::npos) {
      if (rule.remaining > 0) --rule.remaining;
      return &rule.message;
    }
  }
  return nullptr;
}

// =============================================================================
// FakeImageGenerator
// =============================================================================

util::Result<media::MediaHandle> FakeImageGenerator::GenerateImage(
    const providers::ImageRequest& request) {
  ++calls_;
  requests_.push_back(request);
  if (const std::string* message = failures_.Match(request.prompt)) {
    return util::Result<media::MediaHandle>::Failure(*message);
  }
  if (return_empty_) {
    return util::Result<media::MediaHandle>::Success(
        media::MakeMediaHandle("image/png", {}));
  }
  return util::Result<media::MediaHandle>::Success(
      MakeBlob("image/png", "generated-" + std::to_string(calls_)));
}

// =============================================================================
// FakeSpeechSynthesizer
// =============================================================================

util::Result<media::MediaHandle> FakeSpeechSynthesizer::Synthesize(
    const providers::SpeechRequest& request) {
  ++calls_;
  requests_.push_back(request);
  if (const std::string* message = failures_.Match(request.text)) {
    return util::Result<media::MediaHandle>::Failure(*message);
  }
  if (return_empty_) {
    return util::Result<media::MediaHandle>::Success(
        media::MakeMediaHandle("audio/mpeg", {}));
  }
  return util::Result<media::MediaHandle>::Success(MakeVoiceBlob(frames_per_clip_));
}

// =============================================================================
// FakeVideoJobService
// =============================================================================

FakeJobBehavior FakeVideoJobService::BehaviorFor(const std::string& prompt) const {
  for (const auto& rule : behaviors_) {
    if (prompt.find(rule.needle) != std::string::npos) return rule.behavior;
  }
  return FakeJobBehavior::kSucceed;
}

providers::JobHandle FakeVideoJobService::Snapshot(const std::string& name,
                                                   const Job& job) const {
  providers::JobHandle handle;
  handle.name = name;
  handle.done = job.remaining_polls <= 0;
  if (!handle.done) return handle;

  switch (job.behavior) {
    case FakeJobBehavior::kJobError:
      handle.has_error = true;
      handle.error_message = "content policy violation";
      break;
    case FakeJobBehavior::kDoneWithoutUri:
      break;
    default:
      handle.result_uri = job.uri;
      break;
  }
  return handle;
}

util::Result<providers::JobHandle> FakeVideoJobService::Submit(
    const providers::VideoJobRequest& request) {
  ++submits_;
  requests_.push_back(request);

  Job job;
  job.behavior = BehaviorFor(request.prompt);
  if (job.behavior == FakeJobBehavior::kSubmitFails) {
    return util::Result<providers::JobHandle>::Failure("quota exceeded");
  }
  job.remaining_polls = polls_until_done_;
  job.uri = "mem://videos/" + std::to_string(submits_) +
            (job.behavior == FakeJobBehavior::kFetchFails ? "/missing" : "");

  const std::string name = "operations/job-" + std::to_string(submits_);
  jobs_[name] = job;
  return util::Result<providers::JobHandle>::Success(Snapshot(name, job));
}

util::Result<providers::JobHandle> FakeVideoJobService::Poll(
    const providers::JobHandle& handle) {
  ++polls_;
  auto it = jobs_.find(handle.name);
  if (it == jobs_.end()) {
    return util::Result<providers::JobHandle>::Failure("unknown job " + handle.name);
  }
  if (it->second.behavior == FakeJobBehavior::kPollFails) {
    return util::Result<providers::JobHandle>::Failure("gateway unavailable: reset");
  }
  if (it->second.remaining_polls > 0) --it->second.remaining_polls;
  return util::Result<providers::JobHandle>::Success(Snapshot(it->first, it->second));
}

util::Result<media::MediaHandle> FakeVideoJobService::Fetch(const std::string& uri) {
  ++fetches_;
  if (uri.find("/missing") != std::string::npos) {
    return util::Result<media::MediaHandle>::Failure("Not Found");
  }
  return util::Result<media::MediaHandle>::Success(MakeClipBlob(ClipSpec{}));
}

// =============================================================================
// FakeTextModel
// =============================================================================

util::Result<std::string> FakeTextModel::GenerateJson(const std::string& prompt) {
  prompts_.push_back(prompt);
  if (!failure_.empty()) return util::Result<std::string>::Failure(failure_);
  if (replies_.empty()) return util::Result<std::string>::Failure("no scripted reply");
  std::string reply = replies_.front();
  if (replies_.size() > 1) replies_.pop_front();
  return util::Result<std::string>::Success(reply);
}

// =============================================================================
// FakeStoryboardGenerator
// =============================================================================

util::Result<std::vector<campaign::Scene>> FakeStoryboardGenerator::GeneratePlan(
    const campaign::CampaignBrief& brief) {
  ++calls_;
  if (!failure_.empty()) {
    return util::Result<std::vector<campaign::Scene>>::Failure(failure_);
  }
  return util::Result<std::vector<campaign::Scene>>::Success(
      MakeScenes(static_cast<size_t>(brief.scene_count)));
}

// =============================================================================
// FakeImageCodec
// =============================================================================

util::Result<media::RgbaImage> FakeImageCodec::Decode(const media::MediaHandle& encoded) {
  ++decodes_;
  if (!encoded || encoded->empty()) {
    return util::Result<media::RgbaImage>::Failure("empty payload");
  }
  const auto& b = encoded->bytes;
  if (b.size() >= 3 && b[0] == 'B' && b[1] == 'A' && b[2] == 'D') {
    return util::Result<media::RgbaImage>::Failure("invalid data found");
  }
  return util::Result<media::RgbaImage>::Success(
      MakeSolidImage(64, 64, media::Rgba{128, 128, 128, 255}));
}

util::Result<media::MediaHandle> FakeImageCodec::EncodePng(const media::RgbaImage& image) {
  ++encodes_;
  if (image.IsEmpty()) {
    return util::Result<media::MediaHandle>::Failure("empty image");
  }
  return util::Result<media::MediaHandle>::Success(
      MakeBlob("image/png", "png " + std::to_string(image.width) + "x" +
                                std::to_string(image.height)));
}

}  // namespace adreel::testing
