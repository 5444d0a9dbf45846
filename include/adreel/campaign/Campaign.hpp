// Repository: AdReel
// Component: Campaign
// Purpose: Owned aggregate of one accepted plan: brief, scenes, assets, branding.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_CAMPAIGN_CAMPAIGN_HPP_
#define ADREEL_CAMPAIGN_CAMPAIGN_HPP_

#include <string>
#include <utility>
#include <vector>

#include "adreel/campaign/CampaignTypes.hpp"
#include "adreel/campaign/SceneAsset.hpp"

namespace adreel::campaign {

// A Campaign is created from an accepted storyboard and replaced wholesale
// when a new plan is accepted. assets.size() == scenes.size() always.
struct Campaign {
  CampaignBrief brief;
  std::vector<Scene> scenes;
  CampaignAssetSet assets;
  BrandingConfig branding;
  std::string voice_id;

  Campaign() = default;
  Campaign(CampaignBrief b, std::vector<Scene> s, BrandingConfig br,
           std::string voice)
      : brief(std::move(b)),
        scenes(std::move(s)),
        assets(scenes.size()),
        branding(std::move(br)),
        voice_id(std::move(voice)) {}

  bool IsAligned() const { return !scenes.empty() && scenes.size() == assets.size(); }
};

}  // namespace adreel::campaign

#endif  // ADREEL_CAMPAIGN_CAMPAIGN_HPP_
