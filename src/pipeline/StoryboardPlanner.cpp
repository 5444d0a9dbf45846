// Repository: AdReel
// Component: Storyboard Planner
// Purpose: Creative-director prompt and storyboard JSON parsing.
// Copyright (c) 2026 AdReel

#include "adreel/pipeline/StoryboardPlanner.hpp"

#include <cctype>

#include <google/protobuf/util/json_util.h>
#include "adreel/campaign/v1/campaign.pb.h"

#include "adreel/util/Logger.hpp"

namespace adreel::pipeline {

namespace proto = adreel::campaign::v1;

namespace {

const char* PlatformText(campaign::AspectRatio ratio) {
  return ratio == campaign::AspectRatio::kPortrait9x16
             ? "Vertical Video (9:16) for platforms like TikTok/Reels"
             : "Square Video (1:1) for feed posts";
}

}  // namespace

std::string BuildPlanPrompt(const campaign::CampaignBrief& brief) {
  return std::string(
             "You are a world-class marketing creative director. Create a "
             "complete social ad campaign as a single, valid JSON object.\n\n") +
         "Product: " + brief.product_description + "\n" +
         "Primary audience: " + brief.target_audience + "\n" +
         "Ad Format: " + PlatformText(brief.aspect_ratio) + "\n" +
         "Total scenes desired: " + std::to_string(brief.scene_count) + "\n\n" +
         "The JSON object must have a \"storyboard\" key, which is an object "
         "containing a \"scenes\" array.\n"
         "Each scene in the array must be an object with these exact keys: "
         "\"id\" (1-based index), \"voiceover\" (a short, punchy line), "
         "\"on_screen_text\" (a few words, max 9), and \"visual_prompt\" (a "
         "rich, descriptive prompt for an image generation model, including "
         "camera shots, lighting, and mood, suitable for the chosen ad "
         "format).\n";
}

std::string StripJsonFence(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  std::string body = text.substr(begin, end - begin);

  if (body.compare(0, 3, "```") == 0) {
    size_t first_newline = body.find('\n');
    size_t closing = body.rfind("```");
    if (first_newline != std::string::npos && closing != std::string::npos &&
        closing > first_newline) {
      body = body.substr(first_newline + 1, closing - first_newline - 1);
    }
  }
  return body;
}

util::Result<std::vector<campaign::Scene>> ParseStoryboardJson(
    const std::string& json) {
  using R = util::Result<std::vector<campaign::Scene>>;

  proto::MarketingPlan plan;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(StripJsonFence(json),
                                                            &plan, options);
  if (!status.ok()) {
    return R::Failure("model did not return valid JSON: " + status.ToString());
  }
  if (!plan.has_storyboard() || plan.storyboard().scenes_size() == 0) {
    return R::Failure("storyboard has no scenes");
  }

  std::vector<campaign::Scene> scenes;
  scenes.reserve(static_cast<size_t>(plan.storyboard().scenes_size()));
  for (int i = 0; i < plan.storyboard().scenes_size(); ++i) {
    const proto::PlanScene& p = plan.storyboard().scenes(i);
    campaign::Scene scene;
    scene.id = p.id() > 0 ? p.id() : i + 1;
    scene.voiceover_text = p.voiceover();
    scene.on_screen_text = p.on_screen_text();
    scene.visual_prompt = p.visual_prompt();
    if (scene.visual_prompt.empty()) {
      return R::Failure("scene " + std::to_string(scene.id) + " has no visual_prompt");
    }
    scenes.push_back(std::move(scene));
  }
  return R::Success(std::move(scenes));
}

ModelStoryboardGenerator::ModelStoryboardGenerator(providers::ITextModel& model)
    : model_(model) {}

util::Result<std::vector<campaign::Scene>> ModelStoryboardGenerator::GeneratePlan(
    const campaign::CampaignBrief& brief) {
  using R = util::Result<std::vector<campaign::Scene>>;

  if (brief.scene_count < kMinSceneCount || brief.scene_count > kMaxSceneCount) {
    return R::Failure("plan generation failed: scene count must be between " +
                      std::to_string(kMinSceneCount) + " and " +
                      std::to_string(kMaxSceneCount));
  }

  auto text = model_.GenerateJson(BuildPlanPrompt(brief));
  if (!text.ok) {
    return R::Failure("plan generation failed: " + text.error);
  }

  auto parsed = ParseStoryboardJson(text.value);
  if (!parsed.ok) {
    util::Logger::Error("[StoryboardPlanner] Unparseable model response: " +
                        text.value.substr(0, 512));
    return R::Failure("plan generation failed: " + parsed.error);
  }
  util::Logger::Info("[StoryboardPlanner] Plan accepted scenes=" +
                     std::to_string(parsed.value.size()));
  return parsed;
}

}  // namespace adreel::pipeline
