// Repository: AdReel
// Component: Storyboard Planner
// Purpose: Turns a creative brief into an ordered scene list via the text model.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PIPELINE_STORYBOARD_PLANNER_HPP_
#define ADREEL_PIPELINE_STORYBOARD_PLANNER_HPP_

#include <string>
#include <vector>

#include "adreel/providers/GenerationProviders.hpp"

namespace adreel::pipeline {

constexpr int kMinSceneCount = 1;
constexpr int kMaxSceneCount = 10;

std::string BuildPlanPrompt(const campaign::CampaignBrief& brief);

// Model output (possibly wrapped in a ```json fence) -> scenes.
// Unknown keys are ignored; missing ids become the 1-based position.
util::Result<std::vector<campaign::Scene>> ParseStoryboardJson(
    const std::string& json);

// Strips surrounding whitespace and an optional markdown code fence.
std::string StripJsonFence(const std::string& text);

class ModelStoryboardGenerator : public providers::IStoryboardGenerator {
 public:
  explicit ModelStoryboardGenerator(providers::ITextModel& model);

  // Failures carry "plan generation failed: <reason>".
  util::Result<std::vector<campaign::Scene>> GeneratePlan(
      const campaign::CampaignBrief& brief) override;

 private:
  providers::ITextModel& model_;
};

}  // namespace adreel::pipeline

#endif  // ADREEL_PIPELINE_STORYBOARD_PLANNER_HPP_
