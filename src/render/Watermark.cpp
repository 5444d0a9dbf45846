// Repository: AdReel
// Component: Watermark
// Purpose: Stamp the brand watermark onto generated stills.
// Copyright (c) 2026 AdReel

#include "adreel/render/Watermark.hpp"

#include "adreel/render/OverlayLayout.hpp"

namespace adreel::render {

util::Result<media::RgbaImage> ApplyWatermark(const media::RgbaImage& image,
                                              const std::string& text,
                                              ITextPainter& painter,
                                              const FontConfig& fonts) {
  using R = util::Result<media::RgbaImage>;
  if (image.IsEmpty()) return R::Failure("watermark: empty image");

  media::RgbaImage out = image;
  if (text.empty()) return R::Success(std::move(out));

  TextSpec spec = ImageWatermarkSpec(text, image.width, image.height, fonts);
  if (!painter.Paint(out, spec)) {
    return R::Failure("watermark: " + painter.LastError());
  }
  return R::Success(std::move(out));
}

}  // namespace adreel::render
