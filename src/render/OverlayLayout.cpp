// Repository: AdReel
// Component: Overlay Layout
// Purpose: Pure geometry for composited frames.
// Copyright (c) 2026 AdReel

#include "adreel/render/OverlayLayout.hpp"

#include <algorithm>
#include <cmath>

namespace adreel::render {

namespace {
const media::Rgba kWatermarkFill{255, 255, 255, 128};
const media::Rgba kCaptionFill{255, 255, 255, 255};
const media::Rgba kCaptionOutline{0, 0, 0, 204};
}  // namespace

CanvasSize CanvasSizeFor(campaign::AspectRatio ratio) {
  switch (ratio) {
    case campaign::AspectRatio::kPortrait9x16: return CanvasSize{720, 1280};
    case campaign::AspectRatio::kSquare1x1: return CanvasSize{1080, 1080};
  }
  return CanvasSize{720, 1280};
}

PixelRect ToPixels(const LayoutRect& rect) {
  PixelRect p;
  p.x = static_cast<int>(std::floor(rect.x));
  p.y = static_cast<int>(std::floor(rect.y));
  p.width = static_cast<int>(std::ceil(rect.x + rect.width)) - p.x;
  p.height = static_cast<int>(std::ceil(rect.y + rect.height)) - p.y;
  return p;
}

LayoutRect CoverRect(int src_w, int src_h, CanvasSize canvas) {
  LayoutRect r;
  if (src_w <= 0 || src_h <= 0 || canvas.width <= 0 || canvas.height <= 0) {
    return r;
  }
  const double src_ratio = static_cast<double>(src_w) / src_h;
  const double canvas_ratio = static_cast<double>(canvas.width) / canvas.height;
  if (src_ratio > canvas_ratio) {
    r.height = canvas.height;
    r.width = canvas.height * src_ratio;
  } else {
    r.width = canvas.width;
    r.height = canvas.width / src_ratio;
  }
  r.x = (canvas.width - r.width) / 2.0;
  r.y = (canvas.height - r.height) / 2.0;
  return r;
}

LayoutRect FitWithin(double src_w, double src_h, double max_w, double max_h) {
  LayoutRect r;
  if (src_w <= 0 || src_h <= 0) return r;
  const double ratio = src_w / src_h;
  r.width = max_w;
  r.height = max_w / ratio;
  if (r.height > max_h) {
    r.height = max_h;
    r.width = max_h * ratio;
  }
  return r;
}

LayoutRect CornerLogoRect(int logo_w, int logo_h, CanvasSize canvas) {
  LayoutRect r = FitWithin(logo_w, logo_h, canvas.width * kLogoMaxWidthRatio,
                           canvas.height * kLogoMaxHeightRatio);
  r.x = canvas.width - r.width - kOverlayMarginPx;
  r.y = kOverlayMarginPx;
  return r;
}

LayoutRect EndCardLogoRect(int logo_w, int logo_h, CanvasSize canvas) {
  LayoutRect r = FitWithin(logo_w, logo_h, canvas.width * kEndCardLogoMaxRatio,
                           canvas.height * kEndCardLogoMaxRatio);
  r.x = (canvas.width - r.width) / 2.0;
  r.y = (canvas.height - r.height) / 2.0;
  return r;
}

TextSpec ImageWatermarkSpec(const std::string& text, int image_w, int image_h,
                            const FontConfig& fonts) {
  TextSpec spec;
  spec.text = text;
  spec.style = fonts.Regular(std::max<double>(
      kImageWatermarkMinSize,
      static_cast<double>(image_w) / kImageWatermarkWidthDivisor));
  spec.style.fill = kWatermarkFill;
  spec.anchor = TextAnchor::kBottomLeft;
  spec.x = kOverlayMarginPx;
  spec.y = image_h - kOverlayMarginPx;
  return spec;
}

TextSpec VideoWatermarkSpec(const std::string& text, CanvasSize canvas,
                            const FontConfig& fonts) {
  TextSpec spec;
  spec.text = text;
  spec.style = fonts.Regular(canvas.height * kVideoWatermarkSizeRatio);
  spec.style.fill = kWatermarkFill;
  spec.anchor = TextAnchor::kBottomLeft;
  spec.x = kOverlayMarginPx;
  spec.y = canvas.height - kOverlayMarginPx;
  return spec;
}

TextSpec CaptionSpec(const std::string& text, CanvasSize canvas,
                     const FontConfig& fonts) {
  TextSpec spec;
  spec.text = text;
  spec.style = fonts.Bold(canvas.height * kCaptionSizeRatio);
  spec.style.fill = kCaptionFill;
  spec.style.outline = kCaptionOutline;
  // Stroke is centered on the glyph edge; half of it shows outside the fill.
  spec.style.outline_width = std::max(
      1, static_cast<int>(std::lround(canvas.height * kCaptionOutlineRatio / 2.0)));
  spec.anchor = TextAnchor::kCenter;
  spec.x = canvas.width / 2;
  spec.y = static_cast<int>(std::lround(canvas.height * kCaptionCenterYRatio));
  return spec;
}

}  // namespace adreel::render
