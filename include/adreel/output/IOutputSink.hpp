// Repository: AdReel
// Component: IOutputSink Interface
// Purpose: Consumer of composited frames and mixed audio (encoder or preview).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_OUTPUT_IOUTPUT_SINK_HPP_
#define ADREEL_OUTPUT_IOUTPUT_SINK_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "adreel/media/RgbaImage.hpp"

namespace adreel::output {

enum class SinkStatus {
  kIdle,       // created, not started
  kStarting,   // opening encoder / window
  kRunning,    // consuming frames
  kError,      // a call failed; only Abort() is meaningful
  kStopping,   // finishing or aborting
  kStopped,    // finished or aborted
};

const char* SinkStatusToString(SinkStatus status);

using SinkStatusCallback =
    std::function<void(SinkStatus status, const std::string& message)>;

struct OutputFormat {
  int width = 0;
  int height = 0;
  int fps = 30;
  int sample_rate = 48000;
  int channels = 2;
};

// IOutputSink receives one export's worth of frames in order:
//   Start -> (ConsumeVideo | ConsumeAudio)* -> Finish   on success
//   Start -> ... -> Abort                               on any failure
//
// OutputSink responsibilities:
// - Encode / present frames and audio
// - Accumulate the encoded artifact in memory (encoders)
//
// OutputSink explicitly does NOT:
// - Know about scenes, captions or branding
// - Decide when the export ends
class IOutputSink {
 public:
  virtual ~IOutputSink() = default;

  // May only be called in kIdle.
  virtual bool Start(const OutputFormat& format) = 0;

  // frame_index counts output frames from 0 at Start.
  virtual bool ConsumeVideo(const media::RgbaImage& frame, int64_t frame_index) = 0;

  // frame_count interleaved frames; first_frame is the sample-frame position
  // on the output clock.
  virtual bool ConsumeAudio(const float* interleaved, int64_t frame_count,
                            int64_t first_frame) = 0;

  // Flushes and closes. Encoders move the finished container into *encoded;
  // presentation sinks leave it empty.
  virtual bool Finish(std::vector<uint8_t>* encoded) = 0;

  // Drops everything produced so far. Safe to call multiple times.
  virtual void Abort() = 0;

  virtual bool IsRunning() const = 0;
  virtual SinkStatus GetStatus() const = 0;
  virtual void SetStatusCallback(SinkStatusCallback callback) = 0;

  virtual std::string GetName() const = 0;
  virtual std::string LastError() const = 0;

  // Container extension and MIME type of the Finish() bytes; empty for sinks
  // that produce no artifact.
  virtual std::string FileExtension() const = 0;
  virtual std::string MimeType() const = 0;
};

}  // namespace adreel::output

#endif  // ADREEL_OUTPUT_IOUTPUT_SINK_HPP_
