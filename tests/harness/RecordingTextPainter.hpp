// Repository: AdReel
// Component: Recording Text Painter
// Purpose: ITextPainter that records every request and stamps a marker
//          pixel at the anchor so tests can see that text was drawn.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_TESTS_HARNESS_RECORDING_TEXT_PAINTER_HPP_
#define ADREEL_TESTS_HARNESS_RECORDING_TEXT_PAINTER_HPP_

#include <string>
#include <vector>

#include "adreel/render/TextPainter.hpp"

namespace adreel::testing {

class RecordingTextPainter : public render::ITextPainter {
 public:
  bool Paint(media::RgbaImage& canvas, const render::TextSpec& spec) override {
    if (spec.text.empty()) return true;
    calls_.push_back(spec);
    if (fail_) {
      last_error_ = "font not found";
      return false;
    }
    if (spec.x >= 0 && spec.y >= 0 && spec.x < canvas.width && spec.y < canvas.height) {
      uint8_t* px = canvas.Row(spec.y) + spec.x * 4;
      px[0] = spec.style.fill.r;
      px[1] = spec.style.fill.g;
      px[2] = spec.style.fill.b;
      px[3] = 255;
    }
    return true;
  }

  std::string LastError() const override { return last_error_; }

  void SetFail(bool fail) { fail_ = fail; }

  const std::vector<render::TextSpec>& calls() const { return calls_; }
  void Clear() { calls_.clear(); }

  size_t CountText(const std::string& text) const {
    size_t n = 0;
    for (const auto& c : calls_) {
      if (c.text == text) ++n;
    }
    return n;
  }

 private:
  std::vector<render::TextSpec> calls_;
  bool fail_ = false;
  std::string last_error_;
};

}  // namespace adreel::testing

#endif  // ADREEL_TESTS_HARNESS_RECORDING_TEXT_PAINTER_HPP_
