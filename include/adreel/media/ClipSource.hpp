// Repository: AdReel
// Component: Clip Source
// Purpose: Frame-by-frame access to a generated scene clip in presentation order.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_CLIP_SOURCE_HPP_
#define ADREEL_MEDIA_CLIP_SOURCE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "adreel/media/MediaBlob.hpp"
#include "adreel/media/RgbaImage.hpp"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace adreel::media {

enum class ClipReadStatus {
  kFrame,
  kEndOfStream,
  kError,
};

// pts_us is relative to the clip's first frame (first frame == 0).
// duration_us is how long the frame is displayed.
struct ClipFrame {
  RgbaImage image;
  int64_t pts_us = 0;
  int64_t duration_us = 0;
};

class IClipSource {
 public:
  virtual ~IClipSource() = default;

  virtual bool Open() = 0;
  virtual ClipReadStatus ReadFrame(ClipFrame& out) = 0;
  virtual int Width() const = 0;
  virtual int Height() const = 0;
  virtual std::string LastError() const = 0;
};

using ClipSourceFactory =
    std::function<std::unique_ptr<IClipSource>(const MediaHandle& clip)>;

// ClipTimeline rebases decoded timestamps so the first frame sits at 0.
// The origin is whatever the first timestamped frame carries, negative
// values included. Frames without a timestamp, or jumping backwards by more
// than a frame, continue from the previous frame.
class ClipTimeline {
 public:
  explicit ClipTimeline(int64_t frame_duration_us = 0)
      : frame_duration_us_(frame_duration_us) {}

  // Returns the rebased pts in microseconds for the next decoded frame.
  int64_t Next(std::optional<int64_t> pts_us);
  void Reset();

  int64_t frame_duration_us() const { return frame_duration_us_; }
  void set_frame_duration_us(int64_t d) { frame_duration_us_ = d; }

 private:
  int64_t frame_duration_us_;
  std::optional<int64_t> origin_us_;
  int64_t next_pts_us_ = 0;
};

class MemoryDemuxer;

// FFmpegClipDecoder decodes the best video stream of an in-memory clip and
// converts every frame to RGBA at native resolution.
class FFmpegClipDecoder : public IClipSource {
 public:
  explicit FFmpegClipDecoder(MediaHandle clip);
  ~FFmpegClipDecoder() override;

  FFmpegClipDecoder(const FFmpegClipDecoder&) = delete;
  FFmpegClipDecoder& operator=(const FFmpegClipDecoder&) = delete;

  bool Open() override;
  ClipReadStatus ReadFrame(ClipFrame& out) override;
  int Width() const override { return width_; }
  int Height() const override { return height_; }
  std::string LastError() const override { return last_error_; }

  static ClipSourceFactory Factory();

 private:
  void Close();
  bool ConvertFrame(ClipFrame& out);

  MediaHandle clip_;
  std::unique_ptr<MemoryDemuxer> demuxer_;
  AVCodecContext* codec_ctx_ = nullptr;
  AVPacket* packet_ = nullptr;
  AVFrame* frame_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int stream_index_ = -1;
  int width_ = 0;
  int height_ = 0;
  ClipTimeline timeline_;
  bool input_eof_ = false;
  std::string last_error_;
};

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_CLIP_SOURCE_HPP_
