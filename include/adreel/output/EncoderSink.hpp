// Repository: AdReel
// Component: Encoder Sink
// Purpose: H.264 + AAC encoding into an in-memory container (MP4 by default).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_OUTPUT_ENCODER_SINK_HPP_
#define ADREEL_OUTPUT_ENCODER_SINK_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "adreel/output/IOutputSink.hpp"

struct AVCodecContext;
struct AVFormatContext;
struct AVFrame;
struct AVIOContext;
struct AVPacket;
struct AVStream;
struct SwsContext;

namespace adreel::output {

struct EncoderSinkConfig {
  std::string container = "mp4";  // mp4 | mov | mkv
  int64_t video_bitrate = 4000000;
  int64_t audio_bitrate = 128000;
  int gop_seconds = 2;
  std::string x264_preset = "veryfast";
};

// Muxer short name for a container key; nullptr when unsupported.
const char* MuxerNameForContainer(const std::string& container);
std::string MimeTypeForContainer(const std::string& container);

// FFmpegEncoderSink owns the libavformat muxer, the libx264 and AAC encoders
// and a seekable memory AVIO. Finish() writes the trailer and hands over the
// complete container bytes. Single-threaded: all calls come from the
// compositor loop.
class FFmpegEncoderSink : public IOutputSink {
 public:
  explicit FFmpegEncoderSink(EncoderSinkConfig config);
  ~FFmpegEncoderSink() override;

  FFmpegEncoderSink(const FFmpegEncoderSink&) = delete;
  FFmpegEncoderSink& operator=(const FFmpegEncoderSink&) = delete;

  bool Start(const OutputFormat& format) override;
  bool ConsumeVideo(const media::RgbaImage& frame, int64_t frame_index) override;
  bool ConsumeAudio(const float* interleaved, int64_t frame_count,
                    int64_t first_frame) override;
  bool Finish(std::vector<uint8_t>* encoded) override;
  void Abort() override;

  bool IsRunning() const override { return status_ == SinkStatus::kRunning; }
  SinkStatus GetStatus() const override { return status_; }
  void SetStatusCallback(SinkStatusCallback callback) override;
  std::string GetName() const override { return "FFmpegEncoderSink"; }
  std::string LastError() const override { return last_error_; }
  std::string FileExtension() const override { return config_.container; }
  std::string MimeType() const override;

  struct MemoryOutput;

 private:
  bool OpenVideoEncoder();
  bool OpenAudioEncoder();
  bool EncodePendingAudio(bool flush);
  bool DrainEncoder(AVCodecContext* codec_ctx, AVStream* stream);
  bool Fail(const std::string& message);
  void SetStatus(SinkStatus status, const std::string& message);
  void Close();

  EncoderSinkConfig config_;
  OutputFormat format_;
  SinkStatus status_ = SinkStatus::kIdle;
  SinkStatusCallback status_callback_;
  std::string last_error_;

  std::unique_ptr<MemoryOutput> output_;
  AVFormatContext* format_ctx_ = nullptr;
  AVIOContext* avio_ctx_ = nullptr;
  AVCodecContext* video_codec_ctx_ = nullptr;
  AVCodecContext* audio_codec_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  AVFrame* video_frame_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  std::vector<float> pending_audio_;  // interleaved, not yet encoded
  int64_t audio_frames_received_ = 0;
  int64_t audio_pts_ = 0;
  int64_t video_frames_written_ = 0;
};

}  // namespace adreel::output

#endif  // ADREEL_OUTPUT_ENCODER_SINK_HPP_
