// Repository: AdReel
// Component: Preview Window Sink
// Purpose: Real-time SDL2 playback of the composed ad (video + mixed audio).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_OUTPUT_PREVIEW_WINDOW_SINK_HPP_
#define ADREEL_OUTPUT_PREVIEW_WINDOW_SINK_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "adreel/output/IOutputSink.hpp"
#include "adreel/pipeline/IWaitStrategy.hpp"

namespace adreel::output {

struct PreviewConfig {
  std::string window_title = "AdReel Preview";
  int max_window_height = 960;
};

// Presents each frame at origin + frame_index / fps using the wait strategy.
// Built against SDL2 when available; otherwise Start() fails with
// "preview unavailable". Produces no artifact.
class PreviewWindowSink : public IOutputSink {
 public:
  PreviewWindowSink(pipeline::IWaitStrategy& wait, PreviewConfig config);
  ~PreviewWindowSink() override;

  PreviewWindowSink(const PreviewWindowSink&) = delete;
  PreviewWindowSink& operator=(const PreviewWindowSink&) = delete;

  bool Start(const OutputFormat& format) override;
  bool ConsumeVideo(const media::RgbaImage& frame, int64_t frame_index) override;
  bool ConsumeAudio(const float* interleaved, int64_t frame_count,
                    int64_t first_frame) override;
  bool Finish(std::vector<uint8_t>* encoded) override;
  void Abort() override;

  bool IsRunning() const override { return status_ == SinkStatus::kRunning; }
  SinkStatus GetStatus() const override { return status_; }
  void SetStatusCallback(SinkStatusCallback callback) override;
  std::string GetName() const override { return "PreviewWindowSink"; }
  std::string LastError() const override { return last_error_; }
  std::string FileExtension() const override { return ""; }
  std::string MimeType() const override { return ""; }

 private:
  bool PumpEvents();
  void SetStatus(SinkStatus status, const std::string& message);
  void Cleanup();

  pipeline::IWaitStrategy& wait_;
  PreviewConfig config_;
  OutputFormat format_;
  SinkStatus status_ = SinkStatus::kIdle;
  SinkStatusCallback status_callback_;
  std::string last_error_;
  std::chrono::steady_clock::time_point origin_;

  // SDL handles kept opaque so the header does not require SDL2.
  void* window_ = nullptr;
  void* sdl_renderer_ = nullptr;
  void* texture_ = nullptr;
  uint32_t audio_device_ = 0;
};

}  // namespace adreel::output

#endif  // ADREEL_OUTPUT_PREVIEW_WINDOW_SINK_HPP_
