// Repository: AdReel
// Component: Timeline Compositor
// Purpose: Plays every scene clip in storyboard order through the overlay
//          renderer, appends the logo end-card, mixes the voice-over track
//          and feeds the result to an output sink on a fixed frame clock.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_TIMELINE_COMPOSITOR_HPP_
#define ADREEL_RENDER_TIMELINE_COMPOSITOR_HPP_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "adreel/campaign/Campaign.hpp"
#include "adreel/media/AudioDecoder.hpp"
#include "adreel/media/ClipSource.hpp"
#include "adreel/output/IOutputSink.hpp"
#include "adreel/render/AudioTimeline.hpp"
#include "adreel/render/TextPainter.hpp"

namespace adreel::render {

enum class ExportError {
  kNone,
  kExportInProgress,
  kAssetsIncomplete,
  kInvalidConfig,
  kAudioDecodeFailed,
  kClipOpenFailed,
  kOverlaySetupFailed,
  kSinkStartFailed,
  kClipDecodeFailed,
  kRenderFailed,
  kSinkWriteFailed,
  kFinalizeFailed,
};

const char* ExportErrorToString(ExportError error);

struct SceneRenderStats {
  size_t scene_index = 0;
  int64_t first_output_frame = 0;
  int64_t frame_count = 0;
  uint32_t first_frame_crc32 = 0;
  uint32_t last_frame_crc32 = 0;
};

struct ExportReport {
  int width = 0;
  int height = 0;
  int fps = 0;
  std::vector<SceneRenderStats> scenes;
  int64_t end_card_frames = 0;
  uint32_t end_card_crc32 = 0;
  int64_t total_frames = 0;
  int64_t audio_frames_written = 0;
  std::vector<ScheduledClip> audio_schedule;

  double DurationSeconds() const {
    return fps > 0 ? static_cast<double>(total_frames) / fps : 0.0;
  }
};

struct ExportResult {
  bool ok = false;
  ExportError error = ExportError::kNone;
  std::string detail;
  ExportReport report;
  std::vector<uint8_t> encoded;  // empty for presentation sinks

  static ExportResult Success(ExportReport r, std::vector<uint8_t> bytes) {
    ExportResult out;
    out.ok = true;
    out.report = std::move(r);
    out.encoded = std::move(bytes);
    return out;
  }

  static ExportResult Failure(ExportError err, std::string msg) {
    ExportResult out;
    out.ok = false;
    out.error = err;
    out.detail = std::move(msg);
    return out;
  }
};

struct CompositorConfig {
  int fps = 30;
  FontConfig fonts;
};

// Export is synchronous and exclusive: a second call while one runs is
// rejected. The campaign is only read. Nothing reaches the sink before
// setup (audio decode, clip open, overlay prep) has fully succeeded; any
// failure after Start aborts the sink so no partial artifact exists.
class TimelineCompositor {
 public:
  TimelineCompositor(CompositorConfig config,
                     media::ClipSourceFactory clip_factory,
                     media::IAudioDecoder& audio_decoder,
                     ITextPainter& painter);

  ExportResult Export(const campaign::Campaign& campaign,
                      output::IOutputSink& sink);

  bool IsExportActive() const { return active_.load(std::memory_order_acquire); }

 private:
  ExportResult RunExport(const campaign::Campaign& campaign,
                         output::IOutputSink& sink);

  CompositorConfig config_;
  media::ClipSourceFactory clip_factory_;
  media::IAudioDecoder& audio_decoder_;
  ITextPainter& painter_;
  std::atomic<bool> active_{false};
};

}  // namespace adreel::render

#endif  // ADREEL_RENDER_TIMELINE_COMPOSITOR_HPP_
