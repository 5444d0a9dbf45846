// Repository: AdReel
// Component: DrawText Painter
// Purpose: libavfilter drawtext rendering onto RGBA canvases.
// Copyright (c) 2026 AdReel

#include "adreel/render/DrawTextPainter.hpp"

#include <cstddef>
#include <cstdio>
#include <cstring>

#include "adreel/media/MemoryIO.hpp"
#include "adreel/util/Logger.hpp"

extern "C" {
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavutil/frame.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
}

namespace adreel::render {

namespace {

constexpr size_t kMaxCachedGraphs = 32;

std::string ColorString(const media::Rgba& c) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "0x%02X%02X%02X@%.3f", c.r, c.g, c.b,
                c.a / 255.0);
  return buf;
}

std::string Number(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

}  // namespace

DrawTextPainter::Graph::~Graph() {
  if (graph) avfilter_graph_free(&graph);
}

DrawTextPainter::DrawTextPainter()
    : in_frame_(av_frame_alloc()), out_frame_(av_frame_alloc()) {}

DrawTextPainter::~DrawTextPainter() {
  graphs_.clear();
  if (in_frame_) av_frame_free(&in_frame_);
  if (out_frame_) av_frame_free(&out_frame_);
}

std::string DrawTextPainter::CacheKey(int width, int height,
                                      const TextSpec& spec) {
  const TextStyle& s = spec.style;
  return std::to_string(width) + "x" + std::to_string(height) + "|" +
         std::to_string(static_cast<int>(spec.anchor)) + "|" +
         std::to_string(spec.x) + "," + std::to_string(spec.y) + "|" +
         s.font_file + "|" + s.font_pattern + "|" + Number(s.font_size) + "|" +
         ColorString(s.fill) + "|" + ColorString(s.outline) + "|" +
         std::to_string(s.outline_width) + "|" + spec.text;
}

std::unique_ptr<DrawTextPainter::Graph> DrawTextPainter::BuildGraph(
    int width, int height, const TextSpec& spec) {
  auto g = std::make_unique<Graph>();
  g->graph = avfilter_graph_alloc();
  if (!g->graph) {
    last_error_ = "avfilter_graph_alloc failed";
    return nullptr;
  }

  char args[256];
  std::snprintf(args, sizeof(args),
                "video_size=%dx%d:pix_fmt=%d:time_base=1/30:pixel_aspect=1/1",
                width, height, static_cast<int>(AV_PIX_FMT_RGBA));
  int ret = avfilter_graph_create_filter(&g->source,
                                         avfilter_get_by_name("buffer"), "in",
                                         args, nullptr, g->graph);
  if (ret < 0) {
    last_error_ = "buffer source: " + media::FfmpegErrorString(ret);
    return nullptr;
  }

  const AVFilter* drawtext = avfilter_get_by_name("drawtext");
  if (!drawtext) {
    last_error_ = "drawtext filter not available in this FFmpeg build";
    return nullptr;
  }
  AVFilterContext* text_ctx =
      avfilter_graph_alloc_filter(g->graph, drawtext, "text");
  if (!text_ctx) {
    last_error_ = "drawtext alloc failed";
    return nullptr;
  }

  const TextStyle& style = spec.style;
  std::string x_expr;
  std::string y_expr;
  switch (spec.anchor) {
    case TextAnchor::kBottomLeft:
      // descent is negative: the line box spans ascent - descent.
      x_expr = std::to_string(spec.x);
      y_expr = std::to_string(spec.y) + "-ascent+descent";
      break;
    case TextAnchor::kCenter:
      x_expr = std::to_string(spec.x) + "-text_w/2";
      y_expr = std::to_string(spec.y) + "-text_h/2";
      break;
  }

  ret = 0;
  auto set = [&ret, text_ctx](const char* key, const std::string& value) {
    if (ret >= 0) ret = av_opt_set(text_ctx, key, value.c_str(), AV_OPT_SEARCH_CHILDREN);
  };
  set("text", spec.text);
  set("expansion", "none");
  if (!style.font_file.empty()) {
    set("fontfile", style.font_file);
  } else {
    set("font", style.font_pattern);
  }
  set("fontsize", Number(style.font_size));
  set("fontcolor", ColorString(style.fill));
  set("x", x_expr);
  set("y", y_expr);
  if (style.outline_width > 0) {
    set("borderw", std::to_string(style.outline_width));
    set("bordercolor", ColorString(style.outline));
  }
  if (ret < 0) {
    last_error_ = "drawtext options: " + media::FfmpegErrorString(ret);
    return nullptr;
  }
  ret = avfilter_init_str(text_ctx, nullptr);
  if (ret < 0) {
    last_error_ = "drawtext init: " + media::FfmpegErrorString(ret);
    return nullptr;
  }

  AVFilterContext* format_ctx = nullptr;
  ret = avfilter_graph_create_filter(&format_ctx, avfilter_get_by_name("format"),
                                     "fmt", "pix_fmts=rgba", nullptr, g->graph);
  if (ret < 0) {
    last_error_ = "format filter: " + media::FfmpegErrorString(ret);
    return nullptr;
  }

  ret = avfilter_graph_create_filter(&g->sink, avfilter_get_by_name("buffersink"),
                                     "out", nullptr, nullptr, g->graph);
  if (ret < 0) {
    last_error_ = "buffersink: " + media::FfmpegErrorString(ret);
    return nullptr;
  }

  if ((ret = avfilter_link(g->source, 0, text_ctx, 0)) < 0 ||
      (ret = avfilter_link(text_ctx, 0, format_ctx, 0)) < 0 ||
      (ret = avfilter_link(format_ctx, 0, g->sink, 0)) < 0) {
    last_error_ = "avfilter_link: " + media::FfmpegErrorString(ret);
    return nullptr;
  }

  ret = avfilter_graph_config(g->graph, nullptr);
  if (ret < 0) {
    last_error_ = "avfilter_graph_config: " + media::FfmpegErrorString(ret);
    return nullptr;
  }
  return g;
}

bool DrawTextPainter::Paint(media::RgbaImage& canvas, const TextSpec& spec) {
  if (spec.text.empty()) return true;
  if (canvas.IsEmpty()) {
    last_error_ = "empty canvas";
    return false;
  }
  if (!in_frame_ || !out_frame_) {
    last_error_ = "frame allocation failed";
    return false;
  }

  const std::string key = CacheKey(canvas.width, canvas.height, spec);
  auto it = graphs_.find(key);
  if (it == graphs_.end()) {
    if (graphs_.size() >= kMaxCachedGraphs) graphs_.clear();
    auto graph = BuildGraph(canvas.width, canvas.height, spec);
    if (!graph) {
      util::Logger::Error("[DrawTextPainter] Graph setup failed: " + last_error_);
      return false;
    }
    it = graphs_.emplace(key, std::move(graph)).first;
  }
  Graph& g = *it->second;

  av_frame_unref(in_frame_);
  in_frame_->format = AV_PIX_FMT_RGBA;
  in_frame_->width = canvas.width;
  in_frame_->height = canvas.height;
  int ret = av_frame_get_buffer(in_frame_, 32);
  if (ret < 0) {
    last_error_ = "av_frame_get_buffer: " + media::FfmpegErrorString(ret);
    return false;
  }
  for (int y = 0; y < canvas.height; ++y) {
    std::memcpy(in_frame_->data[0] + static_cast<ptrdiff_t>(y) * in_frame_->linesize[0],
                canvas.Row(y), static_cast<size_t>(canvas.Stride()));
  }
  in_frame_->pts = next_pts_++;

  ret = av_buffersrc_add_frame_flags(g.source, in_frame_, AV_BUFFERSRC_FLAG_KEEP_REF);
  if (ret < 0) {
    last_error_ = "buffersrc_add_frame: " + media::FfmpegErrorString(ret);
    return false;
  }

  av_frame_unref(out_frame_);
  ret = av_buffersink_get_frame(g.sink, out_frame_);
  if (ret < 0) {
    last_error_ = "buffersink_get_frame: " + media::FfmpegErrorString(ret);
    return false;
  }
  if (out_frame_->width != canvas.width || out_frame_->height != canvas.height ||
      out_frame_->format != AV_PIX_FMT_RGBA) {
    av_frame_unref(out_frame_);
    last_error_ = "drawtext returned an unexpected frame layout";
    return false;
  }
  for (int y = 0; y < canvas.height; ++y) {
    std::memcpy(canvas.Row(y),
                out_frame_->data[0] + static_cast<ptrdiff_t>(y) * out_frame_->linesize[0],
                static_cast<size_t>(canvas.Stride()));
  }
  av_frame_unref(out_frame_);
  return true;
}

}  // namespace adreel::render
