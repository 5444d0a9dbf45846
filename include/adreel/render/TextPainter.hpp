// Repository: AdReel
// Component: Text Painter
// Purpose: Abstract text rasterization onto an RGBA canvas.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_TEXT_PAINTER_HPP_
#define ADREEL_RENDER_TEXT_PAINTER_HPP_

#include <string>

#include "adreel/media/RgbaImage.hpp"

namespace adreel::render {

enum class TextAnchor {
  kBottomLeft,  // (x, y) is the bottom-left corner of the text box, descenders included
  kCenter,      // (x, y) is the center of the text box
};

struct TextStyle {
  // Font file wins over the fontconfig pattern when set.
  std::string font_file;
  std::string font_pattern = "Sans";
  double font_size = 12.0;
  media::Rgba fill{255, 255, 255, 255};
  media::Rgba outline{0, 0, 0, 0};
  int outline_width = 0;
};

struct TextSpec {
  std::string text;
  TextStyle style;
  TextAnchor anchor = TextAnchor::kBottomLeft;
  int x = 0;
  int y = 0;
};

// Font selection shared by the watermark and caption overlays.
struct FontConfig {
  std::string font_file;
  std::string caption_font_file;
  std::string regular_pattern = "Sans";
  std::string bold_pattern = "Sans:style=Bold";

  TextStyle Regular(double size) const {
    TextStyle s;
    s.font_file = font_file;
    s.font_pattern = regular_pattern;
    s.font_size = size;
    return s;
  }

  TextStyle Bold(double size) const {
    TextStyle s;
    s.font_file = caption_font_file;
    s.font_pattern = bold_pattern;
    s.font_size = size;
    return s;
  }
};

class ITextPainter {
 public:
  virtual ~ITextPainter() = default;

  // Paints spec onto canvas in place. Empty text is a successful no-op.
  virtual bool Paint(media::RgbaImage& canvas, const TextSpec& spec) = 0;
  virtual std::string LastError() const = 0;
};

}  // namespace adreel::render

#endif  // ADREEL_RENDER_TEXT_PAINTER_HPP_
