// Repository: AdReel
// Component: Overlay Renderer
// Purpose: Per-frame composition of clip, logo, watermark and caption.
// Copyright (c) 2026 AdReel

#include "adreel/render/OverlayRenderer.hpp"

#include <algorithm>
#include <cmath>

#include "adreel/util/Logger.hpp"

namespace adreel::render {

namespace {

const media::Rgba kBackground{0, 0, 0, 255};

// Scaled logos use rounded sizes; placement keeps the layout origin.
PixelRect RoundedRect(const LayoutRect& r) {
  PixelRect p;
  p.x = static_cast<int>(std::lround(r.x));
  p.y = static_cast<int>(std::lround(r.y));
  p.width = std::max(1, static_cast<int>(std::lround(r.width)));
  p.height = std::max(1, static_cast<int>(std::lround(r.height)));
  return p;
}

}  // namespace

OverlayRenderer::OverlayRenderer(CanvasSize canvas,
                                 const campaign::BrandingConfig& branding,
                                 ITextPainter& painter, FontConfig fonts)
    : canvas_(canvas),
      branding_(branding),
      painter_(painter),
      fonts_(std::move(fonts)) {}

bool OverlayRenderer::Prepare() {
  prepared_ = true;
  if (!HasLogo()) return true;

  const media::RgbaImage& logo = *branding_.logo_image;
  corner_rect_ = RoundedRect(CornerLogoRect(logo.width, logo.height, canvas_));
  end_card_rect_ = RoundedRect(EndCardLogoRect(logo.width, logo.height, canvas_));

  media::ImageScaler scaler;
  if (!scaler.Scale(logo, corner_rect_.width, corner_rect_.height, corner_logo_) ||
      !scaler.Scale(logo, end_card_rect_.width, end_card_rect_.height,
                    end_card_logo_)) {
    last_error_ = "logo scaling failed: " + scaler.LastError();
    prepared_ = false;
    return false;
  }
  util::Logger::Debug("[OverlayRenderer] Logo corner=" +
                      std::to_string(corner_rect_.width) + "x" +
                      std::to_string(corner_rect_.height) + "@" +
                      std::to_string(corner_rect_.x) + "," +
                      std::to_string(corner_rect_.y));
  return true;
}

void OverlayRenderer::ResetCanvas(media::RgbaImage& canvas) const {
  if (canvas.width != canvas_.width || canvas.height != canvas_.height) {
    canvas = media::RgbaImage(canvas_.width, canvas_.height);
  }
  media::Fill(canvas, kBackground);
}

bool OverlayRenderer::ComposeSceneFrame(const media::RgbaImage& clip_frame,
                                        const std::string& caption,
                                        media::RgbaImage& canvas) {
  if (!prepared_) {
    last_error_ = "renderer not prepared";
    return false;
  }
  ResetCanvas(canvas);

  if (!clip_frame.IsEmpty()) {
    PixelRect cover =
        ToPixels(CoverRect(clip_frame.width, clip_frame.height, canvas_));
    if (!clip_scaler_.Scale(clip_frame, cover.width, cover.height, scaled_clip_)) {
      last_error_ = "clip scaling failed: " + clip_scaler_.LastError();
      return false;
    }
    media::CopyInto(canvas, scaled_clip_, cover.x, cover.y);
  }

  if (HasLogo()) {
    media::BlendOver(canvas, corner_logo_, corner_rect_.x, corner_rect_.y);
  }

  if (!branding_.watermark_text.empty()) {
    if (!painter_.Paint(canvas, VideoWatermarkSpec(branding_.watermark_text,
                                                   canvas_, fonts_))) {
      last_error_ = "watermark: " + painter_.LastError();
      return false;
    }
  }

  if (!caption.empty()) {
    if (!painter_.Paint(canvas, CaptionSpec(caption, canvas_, fonts_))) {
      last_error_ = "caption: " + painter_.LastError();
      return false;
    }
  }
  return true;
}

bool OverlayRenderer::ComposeEndCard(media::RgbaImage& canvas) {
  if (!prepared_) {
    last_error_ = "renderer not prepared";
    return false;
  }
  ResetCanvas(canvas);
  if (HasLogo()) {
    media::BlendOver(canvas, end_card_logo_, end_card_rect_.x, end_card_rect_.y);
  }
  return true;
}

}  // namespace adreel::render
