// Repository: AdReel
// Component: Overlay Renderer
// Purpose: Composes one output frame: background, cover-fit clip frame, corner
//          logo, watermark and caption; and the logo end-card.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_OVERLAY_RENDERER_HPP_
#define ADREEL_RENDER_OVERLAY_RENDERER_HPP_

#include <string>

#include "adreel/campaign/CampaignTypes.hpp"
#include "adreel/media/RgbaImage.hpp"
#include "adreel/render/OverlayLayout.hpp"
#include "adreel/render/TextPainter.hpp"

namespace adreel::render {

class OverlayRenderer {
 public:
  OverlayRenderer(CanvasSize canvas, const campaign::BrandingConfig& branding,
                  ITextPainter& painter, FontConfig fonts);

  // Pre-scales the logo for the corner and end-card placements.
  bool Prepare();

  // canvas is resized to the output size if needed and fully overwritten.
  bool ComposeSceneFrame(const media::RgbaImage& clip_frame,
                         const std::string& caption, media::RgbaImage& canvas);

  bool ComposeEndCard(media::RgbaImage& canvas);

  bool HasLogo() const { return branding_.HasLogo(); }
  CanvasSize canvas() const { return canvas_; }
  const std::string& LastError() const { return last_error_; }

 private:
  void ResetCanvas(media::RgbaImage& canvas) const;

  CanvasSize canvas_;
  const campaign::BrandingConfig& branding_;
  ITextPainter& painter_;
  FontConfig fonts_;

  media::ImageScaler clip_scaler_;
  media::RgbaImage scaled_clip_;
  media::RgbaImage corner_logo_;
  PixelRect corner_rect_;
  media::RgbaImage end_card_logo_;
  PixelRect end_card_rect_;
  bool prepared_ = false;
  std::string last_error_;
};

}  // namespace adreel::render

#endif  // ADREEL_RENDER_OVERLAY_RENDERER_HPP_
