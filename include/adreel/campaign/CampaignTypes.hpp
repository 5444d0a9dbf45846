// Repository: AdReel
// Component: Campaign Types
// Purpose: Storyboard scenes, creative brief and branding configuration.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_CAMPAIGN_CAMPAIGN_TYPES_HPP_
#define ADREEL_CAMPAIGN_CAMPAIGN_TYPES_HPP_

#include <optional>
#include <string>

#include "adreel/media/MediaBlob.hpp"
#include "adreel/media/RgbaImage.hpp"

namespace adreel::campaign {

// One storyboard beat. Immutable once a plan is accepted.
struct Scene {
  int id = 0;
  std::string voiceover_text;
  std::string on_screen_text;
  std::string visual_prompt;
};

enum class AspectRatio {
  kPortrait9x16,
  kSquare1x1,
};

// "9:16" / "1:1"
const char* AspectRatioToString(AspectRatio ratio);
bool ParseAspectRatio(const std::string& text, AspectRatio* out);

struct CampaignBrief {
  std::string product_description;
  std::string target_audience;
  AspectRatio aspect_ratio = AspectRatio::kPortrait9x16;
  int scene_count = 3;
};

// Branding applied to generated stills and the composed video.
// logo_source keeps the encoded logo for image generation requests;
// logo_image is its decoded form used for overlays and the end-card.
struct BrandingConfig {
  std::optional<media::RgbaImage> logo_image;
  media::MediaHandle logo_source;
  std::string watermark_text;
  AspectRatio aspect_ratio = AspectRatio::kPortrait9x16;

  bool HasLogo() const { return logo_image.has_value() && !logo_image->IsEmpty(); }
};

}  // namespace adreel::campaign

#endif  // ADREEL_CAMPAIGN_CAMPAIGN_TYPES_HPP_
