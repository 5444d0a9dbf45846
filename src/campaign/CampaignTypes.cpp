// Repository: AdReel
// Component: Campaign Types
// Purpose: Aspect ratio string conversions.
// Copyright (c) 2026 AdReel

#include "adreel/campaign/CampaignTypes.hpp"

namespace adreel::campaign {

const char* AspectRatioToString(AspectRatio ratio) {
  switch (ratio) {
    case AspectRatio::kPortrait9x16: return "9:16";
    case AspectRatio::kSquare1x1: return "1:1";
  }
  return "unknown";
}

bool ParseAspectRatio(const std::string& text, AspectRatio* out) {
  if (text == "9:16" || text == "portrait") {
    *out = AspectRatio::kPortrait9x16;
    return true;
  }
  if (text == "1:1" || text == "square") {
    *out = AspectRatio::kSquare1x1;
    return true;
  }
  return false;
}

}  // namespace adreel::campaign
