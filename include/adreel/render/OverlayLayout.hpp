// Repository: AdReel
// Component: Overlay Layout
// Purpose: Pure geometry for composited frames: canvas size, cover-fit clip
//          rectangle, logo placements and text anchors. No pixel work.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_OVERLAY_LAYOUT_HPP_
#define ADREEL_RENDER_OVERLAY_LAYOUT_HPP_

#include <string>

#include "adreel/campaign/CampaignTypes.hpp"
#include "adreel/render/TextPainter.hpp"

namespace adreel::render {

constexpr int kOverlayMarginPx = 20;
constexpr double kLogoMaxWidthRatio = 0.15;
constexpr double kLogoMaxHeightRatio = 0.08;
constexpr double kEndCardLogoMaxRatio = 0.5;
constexpr double kVideoWatermarkSizeRatio = 0.015;
constexpr double kCaptionSizeRatio = 0.04;
constexpr double kCaptionCenterYRatio = 0.85;
constexpr double kCaptionOutlineRatio = 0.01;
constexpr int kImageWatermarkMinSize = 12;
constexpr int kImageWatermarkWidthDivisor = 50;
constexpr int kEndCardSeconds = 3;

struct CanvasSize {
  int width = 0;
  int height = 0;
};

// 9:16 -> 720x1280, 1:1 -> 1080x1080.
CanvasSize CanvasSizeFor(campaign::AspectRatio ratio);

struct LayoutRect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

// Integer pixel rectangle enclosing a LayoutRect (floor origin, ceil extent).
struct PixelRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

PixelRect ToPixels(const LayoutRect& rect);

// Scales (src_w, src_h) to fully cover the canvas preserving aspect ratio,
// centered; overflow on one axis is cropped by the canvas.
LayoutRect CoverRect(int src_w, int src_h, CanvasSize canvas);

// Largest aspect-preserving size with width <= max_w and height <= max_h,
// filling width first. Origin is (0, 0).
LayoutRect FitWithin(double src_w, double src_h, double max_w, double max_h);

// Top-right corner logo: at most 15% width / 8% height, 20px margins.
LayoutRect CornerLogoRect(int logo_w, int logo_h, CanvasSize canvas);

// End-card logo: at most 50% of each dimension, centered.
LayoutRect EndCardLogoRect(int logo_w, int logo_h, CanvasSize canvas);

// Still-image watermark: size max(12, width/50), white 50%, bottom of the
// text box (descenders included) 20px above the bottom, 20px from the left.
TextSpec ImageWatermarkSpec(const std::string& text, int image_w, int image_h,
                            const FontConfig& fonts);

// Video watermark: size 1.5% of canvas height, same placement and colour.
TextSpec VideoWatermarkSpec(const std::string& text, CanvasSize canvas,
                            const FontConfig& fonts);

// Caption: bold, 4% of height, centered at (width/2, 85% height), white with a
// black 80% outline.
TextSpec CaptionSpec(const std::string& text, CanvasSize canvas,
                     const FontConfig& fonts);

}  // namespace adreel::render

#endif  // ADREEL_RENDER_OVERLAY_LAYOUT_HPP_
