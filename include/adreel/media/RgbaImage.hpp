// Repository: AdReel
// Component: RGBA Image
// Purpose: Tightly packed 8-bit RGBA raster plus the canvas operations the
//          renderer needs (fill, clipped copy, source-over blend, scaling).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_RGBA_IMAGE_HPP_
#define ADREEL_MEDIA_RGBA_IMAGE_HPP_

#include <cstdint>
#include <string>
#include <vector>

struct SwsContext;

namespace adreel::media {

struct Rgba {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;
};

// Straight (non-premultiplied) alpha, row-major, stride == width * 4.
struct RgbaImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels;

  RgbaImage() = default;
  RgbaImage(int w, int h);

  bool IsEmpty() const { return width <= 0 || height <= 0 || pixels.empty(); }
  int Stride() const { return width * 4; }

  uint8_t* Row(int y) { return pixels.data() + static_cast<size_t>(y) * Stride(); }
  const uint8_t* Row(int y) const {
    return pixels.data() + static_cast<size_t>(y) * Stride();
  }

  Rgba PixelAt(int x, int y) const;
};

void Fill(RgbaImage& image, Rgba color);

// Opaque copy of src with its top-left at (x, y). Pixels outside dst are
// clipped; negative offsets are allowed (cover-fit overflow).
void CopyInto(RgbaImage& dst, const RgbaImage& src, int x, int y);

// Source-over composite of src onto dst with its top-left at (x, y), clipped.
void BlendOver(RgbaImage& dst, const RgbaImage& src, int x, int y);

// ImageScaler wraps a cached libswscale context. One instance per consumer;
// not thread-safe.
class ImageScaler {
 public:
  ImageScaler() = default;
  ~ImageScaler();

  ImageScaler(const ImageScaler&) = delete;
  ImageScaler& operator=(const ImageScaler&) = delete;

  // Bicubic resize of src to (width, height). Returns false on invalid sizes
  // or swscale failure.
  bool Scale(const RgbaImage& src, int width, int height, RgbaImage& out);

  const std::string& LastError() const { return last_error_; }

 private:
  SwsContext* sws_ctx_ = nullptr;
  std::string last_error_;
};

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_RGBA_IMAGE_HPP_
