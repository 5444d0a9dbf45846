// Repository: AdReel
// Component: Generation Providers
// Purpose: Collaborator interfaces for the remote generative services
//          (text model, storyboard planner, image, speech, video jobs).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PROVIDERS_GENERATION_PROVIDERS_HPP_
#define ADREEL_PROVIDERS_GENERATION_PROVIDERS_HPP_

#include <string>
#include <vector>

#include "adreel/campaign/CampaignTypes.hpp"
#include "adreel/media/MediaBlob.hpp"
#include "adreel/util/Result.hpp"

namespace adreel::providers {

constexpr const char* kDefaultVoiceId = "21m00Tcm4TlvDq8ikWAM";
constexpr const char* kDefaultSpeechModel = "eleven_multilingual_v2";
constexpr double kDefaultVoiceStability = 0.5;
constexpr double kDefaultVoiceSimilarityBoost = 0.75;

struct ImageRequest {
  std::string prompt;
  media::MediaHandle logo;  // optional reference image
};

struct SpeechRequest {
  std::string text;
  std::string voice_id = kDefaultVoiceId;
  std::string model_id = kDefaultSpeechModel;
  double stability = kDefaultVoiceStability;
  double similarity_boost = kDefaultVoiceSimilarityBoost;
};

struct VideoJobRequest {
  std::string prompt;
  media::MediaHandle image;
  int number_of_videos = 1;
};

// Opaque handle to a long-running remote job. Once done, exactly one of
// result_uri / error is meaningful; a done job with neither is malformed.
struct JobHandle {
  std::string name;
  bool done = false;
  std::string result_uri;
  bool has_error = false;
  std::string error_message;
};

// Black-box text model used in JSON response mode.
class ITextModel {
 public:
  virtual ~ITextModel() = default;
  virtual util::Result<std::string> GenerateJson(const std::string& prompt) = 0;
};

class IStoryboardGenerator {
 public:
  virtual ~IStoryboardGenerator() = default;
  virtual util::Result<std::vector<campaign::Scene>> GeneratePlan(
      const campaign::CampaignBrief& brief) = 0;
};

class IImageGenerator {
 public:
  virtual ~IImageGenerator() = default;
  virtual util::Result<media::MediaHandle> GenerateImage(
      const ImageRequest& request) = 0;
};

class ISpeechSynthesizer {
 public:
  virtual ~ISpeechSynthesizer() = default;
  virtual util::Result<media::MediaHandle> Synthesize(
      const SpeechRequest& request) = 0;
};

class IVideoJobService {
 public:
  virtual ~IVideoJobService() = default;
  virtual util::Result<JobHandle> Submit(const VideoJobRequest& request) = 0;
  virtual util::Result<JobHandle> Poll(const JobHandle& handle) = 0;
  virtual util::Result<media::MediaHandle> Fetch(const std::string& uri) = 0;
};

}  // namespace adreel::providers

#endif  // ADREEL_PROVIDERS_GENERATION_PROVIDERS_HPP_
