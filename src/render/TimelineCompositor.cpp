// Repository: AdReel
// Component: Timeline Compositor
// Purpose: Scene-by-scene composition on a fixed frame clock.
// Copyright (c) 2026 AdReel

#include "adreel/render/TimelineCompositor.hpp"

#include <memory>
#include <utility>

#include "adreel/media/FrameFingerprint.hpp"
#include "adreel/render/OverlayLayout.hpp"
#include "adreel/render/OverlayRenderer.hpp"
#include "adreel/util/Logger.hpp"

namespace adreel::render {

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;

// Clears the active flag on every exit path.
class ActiveExportGuard {
 public:
  explicit ActiveExportGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~ActiveExportGuard() { flag_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool>& flag_;
};

// Pushes composed frames and the matching slice of mixed audio.
// Audio for output frame n covers sample frames
// [n * rate / fps, (n + 1) * rate / fps), so the track length always equals
// the video length.
class FrameEmitter {
 public:
  FrameEmitter(output::IOutputSink& sink, const AudioTimeline& timeline,
               int fps, int sample_rate)
      : sink_(sink), timeline_(timeline), fps_(fps), sample_rate_(sample_rate) {}

  bool Emit(const media::RgbaImage& frame) {
    if (!sink_.ConsumeVideo(frame, next_frame_)) return false;
    const int64_t a = next_frame_ * sample_rate_ / fps_;
    const int64_t b = (next_frame_ + 1) * sample_rate_ / fps_;
    timeline_.Mix(a, b - a, audio_scratch_);
    if (!sink_.ConsumeAudio(audio_scratch_.data(), b - a, a)) return false;
    audio_frames_written_ += b - a;
    ++next_frame_;
    return true;
  }

  int64_t frames_emitted() const { return next_frame_; }
  int64_t audio_frames_written() const { return audio_frames_written_; }

 private:
  output::IOutputSink& sink_;
  const AudioTimeline& timeline_;
  int fps_;
  int sample_rate_;
  int64_t next_frame_ = 0;
  int64_t audio_frames_written_ = 0;
  std::vector<float> audio_scratch_;
};

}  // namespace

const char* ExportErrorToString(ExportError error) {
  switch (error) {
    case ExportError::kNone: return "NONE";
    case ExportError::kExportInProgress: return "EXPORT_IN_PROGRESS";
    case ExportError::kAssetsIncomplete: return "ASSETS_INCOMPLETE";
    case ExportError::kInvalidConfig: return "INVALID_CONFIG";
    case ExportError::kAudioDecodeFailed: return "AUDIO_DECODE_FAILED";
    case ExportError::kClipOpenFailed: return "CLIP_OPEN_FAILED";
    case ExportError::kOverlaySetupFailed: return "OVERLAY_SETUP_FAILED";
    case ExportError::kSinkStartFailed: return "SINK_START_FAILED";
    case ExportError::kClipDecodeFailed: return "CLIP_DECODE_FAILED";
    case ExportError::kRenderFailed: return "RENDER_FAILED";
    case ExportError::kSinkWriteFailed: return "SINK_WRITE_FAILED";
    case ExportError::kFinalizeFailed: return "FINALIZE_FAILED";
  }
  return "UNKNOWN";
}

TimelineCompositor::TimelineCompositor(CompositorConfig config,
                                       media::ClipSourceFactory clip_factory,
                                       media::IAudioDecoder& audio_decoder,
                                       ITextPainter& painter)
    : config_(std::move(config)),
      clip_factory_(std::move(clip_factory)),
      audio_decoder_(audio_decoder),
      painter_(painter) {}

ExportResult TimelineCompositor::Export(const campaign::Campaign& campaign,
                                        output::IOutputSink& sink) {
  if (active_.exchange(true, std::memory_order_acq_rel)) {
    util::Logger::Warn("[Compositor] Rejected export: already in progress");
    return ExportResult::Failure(ExportError::kExportInProgress,
                                 "export already in progress");
  }
  ActiveExportGuard guard(active_);

  ExportResult result = RunExport(campaign, sink);
  if (!result.ok) {
    util::Logger::Error(std::string("[Compositor] Export failed error=") +
                        ExportErrorToString(result.error) + " detail=" +
                        result.detail);
  }
  return result;
}

ExportResult TimelineCompositor::RunExport(const campaign::Campaign& campaign,
                                           output::IOutputSink& sink) {
  using campaign::AssetKind;

  // ---- Preconditions (no side effects) ----
  if (!campaign.IsAligned() || !campaign.assets.ReadyForExport()) {
    return ExportResult::Failure(ExportError::kAssetsIncomplete, "assets incomplete");
  }
  if (config_.fps <= 0 || !clip_factory_) {
    return ExportResult::Failure(ExportError::kInvalidConfig,
                                 "compositor needs a positive fps and a clip factory");
  }
  const size_t scene_count = campaign.scenes.size();
  for (size_t i = 0; i < scene_count; ++i) {
    const campaign::SceneAsset* asset = campaign.assets.Get(i);
    if (!asset || !asset->video_url() || !asset->audio_url()) {
      return ExportResult::Failure(ExportError::kAssetsIncomplete, "assets incomplete");
    }
  }

  // ---- Setup: decode all voice-overs, open all clips ----
  std::vector<media::AudioBuffer> voiceovers;
  voiceovers.reserve(scene_count);
  for (size_t i = 0; i < scene_count; ++i) {
    auto decoded = audio_decoder_.Decode(campaign.assets.Get(i)->audio_url());
    if (!decoded.ok) {
      return ExportResult::Failure(
          ExportError::kAudioDecodeFailed,
          "voice-over " + std::to_string(i) + ": " + decoded.error);
    }
    if (decoded.value.sample_rate != media::kMixSampleRate ||
        decoded.value.channels != media::kMixChannels) {
      return ExportResult::Failure(
          ExportError::kAudioDecodeFailed,
          "voice-over " + std::to_string(i) + ": not in mix format");
    }
    voiceovers.push_back(std::move(decoded.value));
  }

  std::vector<std::unique_ptr<media::IClipSource>> clips;
  clips.reserve(scene_count);
  for (size_t i = 0; i < scene_count; ++i) {
    auto clip = clip_factory_(campaign.assets.Get(i)->video_url());
    if (!clip || !clip->Open()) {
      return ExportResult::Failure(
          ExportError::kClipOpenFailed,
          "clip " + std::to_string(i) + " unavailable" +
              (clip ? ": " + clip->LastError() : std::string()));
    }
    clips.push_back(std::move(clip));
  }

  const CanvasSize canvas = CanvasSizeFor(campaign.branding.aspect_ratio);
  OverlayRenderer renderer(canvas, campaign.branding, painter_, config_.fonts);
  if (!renderer.Prepare()) {
    return ExportResult::Failure(ExportError::kOverlaySetupFailed,
                                 renderer.LastError());
  }

  AudioTimeline timeline(std::move(voiceovers));

  ExportReport report;
  report.width = canvas.width;
  report.height = canvas.height;
  report.fps = config_.fps;
  report.audio_schedule = timeline.schedule();

  // ---- Sink ----
  output::OutputFormat format;
  format.width = canvas.width;
  format.height = canvas.height;
  format.fps = config_.fps;
  format.sample_rate = media::kMixSampleRate;
  format.channels = media::kMixChannels;
  if (!sink.Start(format)) {
    std::string detail = sink.LastError();
    sink.Abort();
    return ExportResult::Failure(ExportError::kSinkStartFailed, detail);
  }
  util::Logger::Info("[Compositor] Export started sink=" + sink.GetName() + " " +
                     std::to_string(canvas.width) + "x" +
                     std::to_string(canvas.height) + "@" +
                     std::to_string(config_.fps) + " scenes=" +
                     std::to_string(scene_count) + " voiceover_s=" +
                     std::to_string(static_cast<double>(timeline.TotalFrames()) /
                                    media::kMixSampleRate));

  auto abort_with = [&sink](ExportError err, std::string msg) {
    sink.Abort();
    return ExportResult::Failure(err, std::move(msg));
  };

  FrameEmitter emitter(sink, timeline, config_.fps, media::kMixSampleRate);
  media::RgbaImage canvas_image(canvas.width, canvas.height);
  const int64_t frame_period_us = kMicrosPerSecond / config_.fps;

  // ---- Scenes ----
  for (size_t i = 0; i < scene_count; ++i) {
    media::IClipSource& clip = *clips[i];
    const std::string& caption = campaign.scenes[i].on_screen_text;

    SceneRenderStats stats;
    stats.scene_index = i;
    stats.first_output_frame = emitter.frames_emitted();

    media::ClipFrame current;
    media::ClipFrame next;
    media::ClipReadStatus st = clip.ReadFrame(current);
    if (st == media::ClipReadStatus::kError) {
      return abort_with(ExportError::kClipDecodeFailed,
                        "clip " + std::to_string(i) + ": " + clip.LastError());
    }
    if (st == media::ClipReadStatus::kEndOfStream) {
      util::Logger::Warn("[Compositor] Scene " + std::to_string(i) +
                         " clip has no frames");
      report.scenes.push_back(stats);
      continue;
    }
    if (current.duration_us <= 0) current.duration_us = frame_period_us;

    st = clip.ReadFrame(next);
    if (st == media::ClipReadStatus::kError) {
      return abort_with(ExportError::kClipDecodeFailed,
                        "clip " + std::to_string(i) + ": " + clip.LastError());
    }
    bool have_next = (st == media::ClipReadStatus::kFrame);

    // Output tick k shows the latest clip frame with pts <= t_k; the scene
    // ends once the final frame's display interval has elapsed.
    for (int64_t k = 0;; ++k) {
      const int64_t t_us = k * kMicrosPerSecond / config_.fps;
      while (have_next && next.pts_us <= t_us) {
        std::swap(current, next);
        if (current.duration_us <= 0) current.duration_us = frame_period_us;
        st = clip.ReadFrame(next);
        if (st == media::ClipReadStatus::kError) {
          return abort_with(ExportError::kClipDecodeFailed,
                            "clip " + std::to_string(i) + ": " + clip.LastError());
        }
        have_next = (st == media::ClipReadStatus::kFrame);
      }
      if (!have_next && t_us >= current.pts_us + current.duration_us) break;

      if (!renderer.ComposeSceneFrame(current.image, caption, canvas_image)) {
        return abort_with(ExportError::kRenderFailed,
                          "scene " + std::to_string(i) + ": " + renderer.LastError());
      }
      if (!emitter.Emit(canvas_image)) {
        return abort_with(ExportError::kSinkWriteFailed, sink.LastError());
      }
      const uint32_t crc = media::CRC32Image(canvas_image);
      if (stats.frame_count == 0) stats.first_frame_crc32 = crc;
      stats.last_frame_crc32 = crc;
      ++stats.frame_count;
    }

    util::Logger::Info("[Compositor] Scene " + std::to_string(i) +
                       " frames=" + std::to_string(stats.frame_count));
    report.scenes.push_back(stats);
  }

  // ---- End-card ----
  if (renderer.HasLogo()) {
    if (!renderer.ComposeEndCard(canvas_image)) {
      return abort_with(ExportError::kRenderFailed, "end-card: " + renderer.LastError());
    }
    report.end_card_crc32 = media::CRC32Image(canvas_image);
    const int64_t end_card_frames = static_cast<int64_t>(kEndCardSeconds) * config_.fps;
    for (int64_t k = 0; k < end_card_frames; ++k) {
      if (!emitter.Emit(canvas_image)) {
        return abort_with(ExportError::kSinkWriteFailed, sink.LastError());
      }
    }
    report.end_card_frames = end_card_frames;
  }

  report.total_frames = emitter.frames_emitted();
  report.audio_frames_written = emitter.audio_frames_written();

  std::vector<uint8_t> encoded;
  if (!sink.Finish(&encoded)) {
    std::string detail = sink.LastError();
    sink.Abort();
    return ExportResult::Failure(ExportError::kFinalizeFailed, detail);
  }

  util::Logger::Info("[Compositor] Export finished frames=" +
                     std::to_string(report.total_frames) + " duration_s=" +
                     std::to_string(report.DurationSeconds()) + " bytes=" +
                     std::to_string(encoded.size()));
  return ExportResult::Success(std::move(report), std::move(encoded));
}

}  // namespace adreel::render
