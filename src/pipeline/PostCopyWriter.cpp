// Repository: AdReel
// Component: Post Copy Writer
// Purpose: Post copy prompt and JSON parsing.
// Copyright (c) 2026 AdReel

#include "adreel/pipeline/PostCopyWriter.hpp"

#include <sstream>

#include <google/protobuf/util/json_util.h>
#include "adreel/campaign/v1/campaign.pb.h"

#include "adreel/pipeline/StoryboardPlanner.hpp"
#include "adreel/util/Logger.hpp"

namespace adreel::pipeline {

std::string PostCopy::Render() const {
  std::ostringstream out;
  out << caption << "\n\n";
  for (size_t i = 0; i < hashtags.size(); ++i) {
    if (i > 0) out << ' ';
    out << hashtags[i];
  }
  return out.str();
}

std::string BuildPostCopyPrompt(const campaign::CampaignBrief& brief,
                                const std::vector<campaign::Scene>& scenes) {
  const char* platform =
      brief.aspect_ratio == campaign::AspectRatio::kPortrait9x16
          ? "vertical video platforms like TikTok, Instagram Reels, and YouTube Shorts"
          : "feed-based platforms like Instagram and Facebook";

  std::ostringstream summary;
  for (size_t i = 0; i < scenes.size(); ++i) {
    if (i > 0) summary << "\n\n";
    summary << "Scene " << scenes[i].id << ":\n"
            << "- Visuals: " << scenes[i].visual_prompt << "\n"
            << "- Voiceover: " << scenes[i].voiceover_text << "\n"
            << "- On-screen text: " << scenes[i].on_screen_text;
  }

  std::ostringstream prompt;
  prompt << "You are a social media marketing expert specializing in creating viral "
            "short-form video content.\n"
         << "Based on the following ad campaign details, generate a compelling post "
            "copy and relevant hashtags.\n\n"
         << "**Campaign Details:**\n"
         << "- **Product:** " << brief.product_description << "\n"
         << "- **Target Audience:** " << brief.target_audience << "\n"
         << "- **Platform:** " << platform << "\n\n"
         << "**Video Storyboard Summary:**\n"
         << summary.str() << "\n\n"
         << "**Instructions:**\n"
         << "1.  Write a captivating and concise caption for the post. It should grab "
            "attention, explain the value proposition, and have a clear "
            "call-to-action.\n"
         << "2.  Provide a list of 5-7 highly relevant and trending hashtags.\n\n"
         << "Please format your response as a single, valid JSON object with two "
            "keys: \"caption\" (a string) and \"hashtags\" (an array of strings).\n";
  return prompt.str();
}

util::Result<PostCopy> ParsePostCopyJson(const std::string& json) {
  using R = util::Result<PostCopy>;

  adreel::campaign::v1::PostCopy message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(StripJsonFence(json),
                                                            &message, options);
  if (!status.ok()) {
    return R::Failure("model did not return valid JSON: " + status.ToString());
  }
  if (message.caption().empty()) {
    return R::Failure("post copy has no caption");
  }

  PostCopy copy;
  copy.caption = message.caption();
  copy.hashtags.assign(message.hashtags().begin(), message.hashtags().end());
  return R::Success(std::move(copy));
}

PostCopyWriter::PostCopyWriter(providers::ITextModel& model) : model_(model) {}

util::Result<PostCopy> PostCopyWriter::Generate(
    const campaign::CampaignBrief& brief,
    const std::vector<campaign::Scene>& scenes) {
  using R = util::Result<PostCopy>;

  auto text = model_.GenerateJson(BuildPostCopyPrompt(brief, scenes));
  if (!text.ok) {
    return R::Failure("post copy generation failed: " + text.error);
  }
  auto parsed = ParsePostCopyJson(text.value);
  if (!parsed.ok) {
    return R::Failure("post copy generation failed: " + parsed.error);
  }
  util::Logger::Info("[PostCopyWriter] Caption ready hashtags=" +
                     std::to_string(parsed.value.hashtags.size()));
  return parsed;
}

}  // namespace adreel::pipeline
