// Repository: AdReel
// Component: DrawText Painter
// Purpose: ITextPainter backed by a libavfilter "drawtext" graph.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_DRAW_TEXT_PAINTER_HPP_
#define ADREEL_RENDER_DRAW_TEXT_PAINTER_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "adreel/render/TextPainter.hpp"

struct AVFilterContext;
struct AVFilterGraph;
struct AVFrame;

namespace adreel::render {

// One filter graph (buffer -> drawtext -> format=rgba -> buffersink) is
// built per distinct (canvas size, text spec) and reused, so a caption drawn
// on every frame of a scene costs one graph. Not thread-safe.
class DrawTextPainter : public ITextPainter {
 public:
  DrawTextPainter();
  ~DrawTextPainter() override;

  DrawTextPainter(const DrawTextPainter&) = delete;
  DrawTextPainter& operator=(const DrawTextPainter&) = delete;

  bool Paint(media::RgbaImage& canvas, const TextSpec& spec) override;
  std::string LastError() const override { return last_error_; }

  size_t cached_graph_count() const { return graphs_.size(); }

 private:
  struct Graph {
    AVFilterGraph* graph = nullptr;
    AVFilterContext* source = nullptr;
    AVFilterContext* sink = nullptr;
    ~Graph();
  };

  std::unique_ptr<Graph> BuildGraph(int width, int height, const TextSpec& spec);
  static std::string CacheKey(int width, int height, const TextSpec& spec);

  std::map<std::string, std::unique_ptr<Graph>> graphs_;
  AVFrame* in_frame_ = nullptr;
  AVFrame* out_frame_ = nullptr;
  int64_t next_pts_ = 0;
  std::string last_error_;
};

}  // namespace adreel::render

#endif  // ADREEL_RENDER_DRAW_TEXT_PAINTER_HPP_
