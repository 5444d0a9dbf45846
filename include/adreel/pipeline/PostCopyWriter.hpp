// Repository: AdReel
// Component: Post Copy Writer
// Purpose: Generates the social-media caption and hashtags for a finished
//          campaign from its brief and storyboard.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_PIPELINE_POST_COPY_WRITER_HPP_
#define ADREEL_PIPELINE_POST_COPY_WRITER_HPP_

#include <string>
#include <vector>

#include "adreel/providers/GenerationProviders.hpp"

namespace adreel::pipeline {

struct PostCopy {
  std::string caption;
  std::vector<std::string> hashtags;

  // caption, blank line, hashtags separated by single spaces.
  std::string Render() const;
};

std::string BuildPostCopyPrompt(const campaign::CampaignBrief& brief,
                                const std::vector<campaign::Scene>& scenes);

util::Result<PostCopy> ParsePostCopyJson(const std::string& json);

class PostCopyWriter {
 public:
  explicit PostCopyWriter(providers::ITextModel& model);

  util::Result<PostCopy> Generate(const campaign::CampaignBrief& brief,
                                  const std::vector<campaign::Scene>& scenes);

 private:
  providers::ITextModel& model_;
};

}  // namespace adreel::pipeline

#endif  // ADREEL_PIPELINE_POST_COPY_WRITER_HPP_
