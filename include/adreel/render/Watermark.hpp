// Repository: AdReel
// Component: Watermark
// Purpose: Stamp the brand watermark onto generated stills.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_WATERMARK_HPP_
#define ADREEL_RENDER_WATERMARK_HPP_

#include <string>

#include "adreel/media/RgbaImage.hpp"
#include "adreel/render/TextPainter.hpp"
#include "adreel/util/Result.hpp"

namespace adreel::render {

// Returns a new image of identical dimensions with text drawn bottom-left.
// Empty text returns a copy of the input untouched. The input is never
// modified; no state survives between calls.
util::Result<media::RgbaImage> ApplyWatermark(const media::RgbaImage& image,
                                              const std::string& text,
                                              ITextPainter& painter,
                                              const FontConfig& fonts);

}  // namespace adreel::render

#endif  // ADREEL_RENDER_WATERMARK_HPP_
