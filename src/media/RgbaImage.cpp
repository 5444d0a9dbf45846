// Repository: AdReel
// Component: RGBA Image
// Purpose: Canvas raster operations and libswscale-backed resizing.
// Copyright (c) 2026 AdReel

#include "adreel/media/RgbaImage.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace adreel::media {

RgbaImage::RgbaImage(int w, int h)
    : width(w > 0 ? w : 0),
      height(h > 0 ? h : 0),
      pixels(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0) {}

Rgba RgbaImage::PixelAt(int x, int y) const {
  Rgba out{0, 0, 0, 0};
  if (x < 0 || y < 0 || x >= width || y >= height) return out;
  const uint8_t* p = Row(y) + static_cast<size_t>(x) * 4;
  out.r = p[0];
  out.g = p[1];
  out.b = p[2];
  out.a = p[3];
  return out;
}

void Fill(RgbaImage& image, Rgba color) {
  for (size_t i = 0; i + 3 < image.pixels.size(); i += 4) {
    image.pixels[i + 0] = color.r;
    image.pixels[i + 1] = color.g;
    image.pixels[i + 2] = color.b;
    image.pixels[i + 3] = color.a;
  }
}

namespace {

// Intersection of src placed at (x, y) with dst bounds.
struct Span {
  int src_x0, src_y0, dst_x0, dst_y0, w, h;
};

bool ClipSpan(const RgbaImage& dst, const RgbaImage& src, int x, int y,
              Span& span) {
  int dst_x0 = std::max(0, x);
  int dst_y0 = std::max(0, y);
  int dst_x1 = std::min(dst.width, x + src.width);
  int dst_y1 = std::min(dst.height, y + src.height);
  if (dst_x1 <= dst_x0 || dst_y1 <= dst_y0) return false;
  span.dst_x0 = dst_x0;
  span.dst_y0 = dst_y0;
  span.src_x0 = dst_x0 - x;
  span.src_y0 = dst_y0 - y;
  span.w = dst_x1 - dst_x0;
  span.h = dst_y1 - dst_y0;
  return true;
}

}  // namespace

void CopyInto(RgbaImage& dst, const RgbaImage& src, int x, int y) {
  if (dst.IsEmpty() || src.IsEmpty()) return;
  Span s{};
  if (!ClipSpan(dst, src, x, y, s)) return;
  for (int row = 0; row < s.h; ++row) {
    const uint8_t* sp = src.Row(s.src_y0 + row) + static_cast<size_t>(s.src_x0) * 4;
    uint8_t* dp = dst.Row(s.dst_y0 + row) + static_cast<size_t>(s.dst_x0) * 4;
    std::memcpy(dp, sp, static_cast<size_t>(s.w) * 4);
    for (int col = 0; col < s.w; ++col) {
      dp[col * 4 + 3] = 255;
    }
  }
}

void BlendOver(RgbaImage& dst, const RgbaImage& src, int x, int y) {
  if (dst.IsEmpty() || src.IsEmpty()) return;
  Span s{};
  if (!ClipSpan(dst, src, x, y, s)) return;
  for (int row = 0; row < s.h; ++row) {
    const uint8_t* sp = src.Row(s.src_y0 + row) + static_cast<size_t>(s.src_x0) * 4;
    uint8_t* dp = dst.Row(s.dst_y0 + row) + static_cast<size_t>(s.dst_x0) * 4;
    for (int col = 0; col < s.w; ++col, sp += 4, dp += 4) {
      const uint32_t sa = sp[3];
      if (sa == 0) continue;
      if (sa == 255) {
        std::memcpy(dp, sp, 4);
        continue;
      }
      const uint32_t inv = 255 - sa;
      for (int c = 0; c < 3; ++c) {
        dp[c] = static_cast<uint8_t>((sp[c] * sa + dp[c] * inv + 127) / 255);
      }
      dp[3] = static_cast<uint8_t>(sa + (dp[3] * inv + 127) / 255);
    }
  }
}

ImageScaler::~ImageScaler() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

bool ImageScaler::Scale(const RgbaImage& src, int width, int height,
                        RgbaImage& out) {
  if (src.IsEmpty() || width <= 0 || height <= 0) {
    last_error_ = "invalid scale dimensions";
    return false;
  }
  if (src.width == width && src.height == height) {
    out = src;
    return true;
  }

  sws_ctx_ = sws_getCachedContext(sws_ctx_, src.width, src.height,
                                  AV_PIX_FMT_RGBA, width, height,
                                  AV_PIX_FMT_RGBA, SWS_BICUBIC, nullptr,
                                  nullptr, nullptr);
  if (!sws_ctx_) {
    last_error_ = "sws_getCachedContext failed";
    return false;
  }

  out = RgbaImage(width, height);
  const uint8_t* src_planes[4] = {src.pixels.data(), nullptr, nullptr, nullptr};
  const int src_strides[4] = {src.Stride(), 0, 0, 0};
  uint8_t* dst_planes[4] = {out.pixels.data(), nullptr, nullptr, nullptr};
  const int dst_strides[4] = {out.Stride(), 0, 0, 0};

  int rows = sws_scale(sws_ctx_, src_planes, src_strides, 0, src.height,
                       dst_planes, dst_strides);
  if (rows != height) {
    last_error_ = "sws_scale produced " + std::to_string(rows) + " rows";
    return false;
  }
  return true;
}

}  // namespace adreel::media
