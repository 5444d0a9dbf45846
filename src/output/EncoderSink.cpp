// Repository: AdReel
// Component: Encoder Sink
// Purpose: H.264 + AAC encoding into an in-memory container.
// Copyright (c) 2026 AdReel

#include "adreel/output/EncoderSink.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstring>

#include "adreel/media/MemoryIO.hpp"
#include "adreel/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/version.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

namespace adreel::output {

// Seekable, growable byte buffer behind the muxer's AVIOContext. The MP4
// muxer seeks back to patch box sizes when it writes the trailer.
struct FFmpegEncoderSink::MemoryOutput {
  std::vector<uint8_t> bytes;
  int64_t position = 0;

  int Write(const uint8_t* buf, int size) {
    const size_t end = static_cast<size_t>(position) + static_cast<size_t>(size);
    if (end > bytes.size()) bytes.resize(end);
    std::memcpy(bytes.data() + position, buf, static_cast<size_t>(size));
    position += size;
    return size;
  }

  int64_t Seek(int64_t offset, int whence) {
    const int64_t total = static_cast<int64_t>(bytes.size());
    if (whence & AVSEEK_SIZE) return total;
    int64_t target = 0;
    switch (whence & ~AVSEEK_FORCE) {
      case SEEK_SET: target = offset; break;
      case SEEK_CUR: target = position + offset; break;
      case SEEK_END: target = total + offset; break;
      default: return AVERROR(EINVAL);
    }
    if (target < 0) return AVERROR(EINVAL);
    position = target;
    return target;
  }
};

namespace {

constexpr int kAvioBufferSize = 64 * 1024;
constexpr int kDefaultAacFrameSize = 1024;

// libavformat 61 made the write buffer const.
#if LIBAVFORMAT_VERSION_MAJOR >= 61
using AvioWriteBuffer = const uint8_t*;
#else
using AvioWriteBuffer = uint8_t*;
#endif

int AVIOWriteThunk(void* opaque, AvioWriteBuffer buf, int buf_size) {
  return static_cast<FFmpegEncoderSink::MemoryOutput*>(opaque)->Write(buf, buf_size);
}

int64_t AVIOSeekThunk(void* opaque, int64_t offset, int whence) {
  return static_cast<FFmpegEncoderSink::MemoryOutput*>(opaque)->Seek(offset, whence);
}

}  // namespace

const char* MuxerNameForContainer(const std::string& container) {
  if (container == "mp4") return "mp4";
  if (container == "mov") return "mov";
  if (container == "mkv") return "matroska";
  return nullptr;
}

std::string MimeTypeForContainer(const std::string& container) {
  if (container == "mp4") return "video/mp4";
  if (container == "mov") return "video/quicktime";
  if (container == "mkv") return "video/x-matroska";
  return "application/octet-stream";
}

FFmpegEncoderSink::FFmpegEncoderSink(EncoderSinkConfig config)
    : config_(std::move(config)) {}

FFmpegEncoderSink::~FFmpegEncoderSink() { Close(); }

std::string FFmpegEncoderSink::MimeType() const {
  return MimeTypeForContainer(config_.container);
}

void FFmpegEncoderSink::SetStatusCallback(SinkStatusCallback callback) {
  status_callback_ = std::move(callback);
}

void FFmpegEncoderSink::SetStatus(SinkStatus status, const std::string& message) {
  status_ = status;
  if (status_callback_) status_callback_(status, message);
}

bool FFmpegEncoderSink::Fail(const std::string& message) {
  last_error_ = message;
  util::Logger::Error("[EncoderSink] " + message);
  SetStatus(SinkStatus::kError, message);
  return false;
}

bool FFmpegEncoderSink::Start(const OutputFormat& format) {
  if (status_ != SinkStatus::kIdle) {
    return Fail("Start called in state " + std::string(SinkStatusToString(status_)));
  }
  SetStatus(SinkStatus::kStarting, "");
  format_ = format;

  if (format.width <= 0 || format.height <= 0 || format.fps <= 0 ||
      (format.width % 2) != 0 || (format.height % 2) != 0) {
    return Fail("invalid output format " + std::to_string(format.width) + "x" +
                std::to_string(format.height) + "@" + std::to_string(format.fps));
  }

  const char* muxer = MuxerNameForContainer(config_.container);
  if (!muxer) return Fail("unsupported container: " + config_.container);

  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, muxer, nullptr);
  if (ret < 0 || !format_ctx_) {
    return Fail("Failed to allocate output context: " + media::FfmpegErrorString(ret));
  }

  output_ = std::make_unique<MemoryOutput>();
  auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!buffer) return Fail("Failed to allocate AVIO buffer");
  avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 1, output_.get(),
                                 nullptr, &AVIOWriteThunk, &AVIOSeekThunk);
  if (!avio_ctx_) {
    av_free(buffer);
    return Fail("Failed to allocate AVIO context");
  }
  format_ctx_->pb = avio_ctx_;
  format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  if (!OpenVideoEncoder()) return false;
  if (!OpenAudioEncoder()) return false;

  packet_ = av_packet_alloc();
  if (!packet_) return Fail("Failed to allocate packet");

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) return Fail("Failed to write header: " + media::FfmpegErrorString(ret));

  util::Logger::Info("[EncoderSink] Started " + config_.container + " " +
                     std::to_string(format.width) + "x" +
                     std::to_string(format.height) + "@" +
                     std::to_string(format.fps) + " v_bitrate=" +
                     std::to_string(config_.video_bitrate));
  SetStatus(SinkStatus::kRunning, "");
  return true;
}

bool FFmpegEncoderSink::OpenVideoEncoder() {
  // All-or-nothing: libx264 is required.
  const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
  if (!codec) return Fail("libx264 not found");

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!video_stream_) return Fail("Failed to create video stream");
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  video_codec_ctx_ = avcodec_alloc_context3(codec);
  if (!video_codec_ctx_) return Fail("Failed to allocate video codec context");

  video_codec_ctx_->codec_id = AV_CODEC_ID_H264;
  video_codec_ctx_->codec_type = AVMEDIA_TYPE_VIDEO;
  video_codec_ctx_->width = format_.width;
  video_codec_ctx_->height = format_.height;
  video_codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  video_codec_ctx_->bit_rate = config_.video_bitrate;
  video_codec_ctx_->gop_size = format_.fps * std::max(1, config_.gop_seconds);
  video_codec_ctx_->time_base = AVRational{1, format_.fps};
  video_codec_ctx_->framerate = AVRational{format_.fps, 1};
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    video_codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "preset", config_.x264_preset.c_str(), 0);
  int ret = avcodec_open2(video_codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) return Fail("Failed to open video codec: " + media::FfmpegErrorString(ret));

  // Copy parameters (extradata included) after open.
  ret = avcodec_parameters_from_context(video_stream_->codecpar, video_codec_ctx_);
  if (ret < 0) {
    return Fail("Failed to copy video codec parameters: " + media::FfmpegErrorString(ret));
  }
  video_stream_->time_base = video_codec_ctx_->time_base;

  video_frame_ = av_frame_alloc();
  if (!video_frame_) return Fail("Failed to allocate video frame");
  video_frame_->format = AV_PIX_FMT_YUV420P;
  video_frame_->width = format_.width;
  video_frame_->height = format_.height;
  ret = av_frame_get_buffer(video_frame_, 32);
  if (ret < 0) return Fail("Failed to allocate video frame buffer: " + media::FfmpegErrorString(ret));

  sws_ctx_ = sws_getContext(format_.width, format_.height, AV_PIX_FMT_RGBA,
                            format_.width, format_.height, AV_PIX_FMT_YUV420P,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) return Fail("Failed to create RGBA->YUV420P scaler");
  return true;
}

bool FFmpegEncoderSink::OpenAudioEncoder() {
  const AVCodec* codec = avcodec_find_encoder_by_name("aac");
  if (!codec) return Fail("No AAC encoder found");

  audio_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!audio_stream_) return Fail("Failed to create audio stream");
  audio_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  audio_codec_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_codec_ctx_) return Fail("Failed to allocate audio codec context");

  audio_codec_ctx_->codec_id = codec->id;
  audio_codec_ctx_->codec_type = AVMEDIA_TYPE_AUDIO;
  audio_codec_ctx_->sample_fmt = AV_SAMPLE_FMT_FLTP;
  audio_codec_ctx_->sample_rate = format_.sample_rate;
  int ret = av_channel_layout_from_mask(&audio_codec_ctx_->ch_layout, AV_CH_LAYOUT_STEREO);
  if (ret < 0) {
    return Fail("Failed to set audio channel layout: " + media::FfmpegErrorString(ret));
  }
  audio_codec_ctx_->bit_rate = config_.audio_bitrate;
  audio_codec_ctx_->time_base = AVRational{1, format_.sample_rate};
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    audio_codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  ret = avcodec_open2(audio_codec_ctx_, codec, nullptr);
  if (ret < 0) return Fail("Failed to open audio codec: " + media::FfmpegErrorString(ret));

  ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_codec_ctx_);
  if (ret < 0) {
    return Fail("Failed to copy audio codec parameters: " + media::FfmpegErrorString(ret));
  }
  audio_stream_->time_base = audio_codec_ctx_->time_base;

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) return Fail("Failed to allocate audio frame");
  return true;
}

bool FFmpegEncoderSink::DrainEncoder(AVCodecContext* codec_ctx, AVStream* stream) {
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return Fail("Error receiving packet: " + media::FfmpegErrorString(ret));

    av_packet_rescale_ts(packet_, codec_ctx->time_base, stream->time_base);
    packet_->stream_index = stream->index;
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0) return Fail("Error writing packet: " + media::FfmpegErrorString(ret));
  }
}

bool FFmpegEncoderSink::ConsumeVideo(const media::RgbaImage& frame,
                                     int64_t frame_index) {
  if (status_ != SinkStatus::kRunning) {
    last_error_ = "ConsumeVideo while not running";
    return false;
  }
  if (frame.width != format_.width || frame.height != format_.height) {
    return Fail("frame size " + std::to_string(frame.width) + "x" +
                std::to_string(frame.height) + " does not match output");
  }

  int ret = av_frame_make_writable(video_frame_);
  if (ret < 0) return Fail("Frame not writable: " + media::FfmpegErrorString(ret));

  const uint8_t* src[4] = {frame.pixels.data(), nullptr, nullptr, nullptr};
  const int src_stride[4] = {frame.Stride(), 0, 0, 0};
  sws_scale(sws_ctx_, src, src_stride, 0, frame.height, video_frame_->data,
            video_frame_->linesize);
  video_frame_->pts = frame_index;

  ret = avcodec_send_frame(video_codec_ctx_, video_frame_);
  if (ret < 0) return Fail("Error sending video frame: " + media::FfmpegErrorString(ret));
  if (!DrainEncoder(video_codec_ctx_, video_stream_)) return false;
  ++video_frames_written_;
  return true;
}

bool FFmpegEncoderSink::ConsumeAudio(const float* interleaved,
                                     int64_t frame_count, int64_t first_frame) {
  if (status_ != SinkStatus::kRunning) {
    last_error_ = "ConsumeAudio while not running";
    return false;
  }
  if (first_frame != audio_frames_received_) {
    return Fail("non-contiguous audio: expected frame " +
                std::to_string(audio_frames_received_) + " got " +
                std::to_string(first_frame));
  }
  if (frame_count <= 0) return true;
  pending_audio_.insert(pending_audio_.end(), interleaved,
                        interleaved + frame_count * format_.channels);
  audio_frames_received_ += frame_count;
  return EncodePendingAudio(false);
}

bool FFmpegEncoderSink::EncodePendingAudio(bool flush) {
  const int channels = format_.channels;
  const int frame_size = audio_codec_ctx_->frame_size > 0
                             ? audio_codec_ctx_->frame_size
                             : kDefaultAacFrameSize;
  size_t consumed = 0;

  while (true) {
    const int64_t available =
        static_cast<int64_t>(pending_audio_.size() - consumed) / channels;
    if (available <= 0 || (available < frame_size && !flush)) break;
    const int n = static_cast<int>(std::min<int64_t>(available, frame_size));

    av_frame_unref(audio_frame_);
    audio_frame_->format = AV_SAMPLE_FMT_FLTP;
    audio_frame_->sample_rate = format_.sample_rate;
    audio_frame_->nb_samples = n;
    int ret = av_channel_layout_copy(&audio_frame_->ch_layout,
                                     &audio_codec_ctx_->ch_layout);
    if (ret < 0) return Fail("Failed to copy audio layout: " + media::FfmpegErrorString(ret));
    ret = av_frame_get_buffer(audio_frame_, 0);
    if (ret < 0) return Fail("Failed to allocate audio buffer: " + media::FfmpegErrorString(ret));

    // Interleaved float -> planar float.
    const float* src = pending_audio_.data() + consumed;
    for (int c = 0; c < channels; ++c) {
      auto* plane = reinterpret_cast<float*>(audio_frame_->data[c]);
      for (int i = 0; i < n; ++i) plane[i] = src[i * channels + c];
    }
    audio_frame_->pts = audio_pts_;
    audio_pts_ += n;
    consumed += static_cast<size_t>(n) * channels;

    ret = avcodec_send_frame(audio_codec_ctx_, audio_frame_);
    if (ret < 0) return Fail("Error sending audio frame: " + media::FfmpegErrorString(ret));
    if (!DrainEncoder(audio_codec_ctx_, audio_stream_)) return false;
    if (n < frame_size) break;  // short frame is always the last one
  }

  pending_audio_.erase(pending_audio_.begin(),
                       pending_audio_.begin() + static_cast<ptrdiff_t>(consumed));
  return true;
}

bool FFmpegEncoderSink::Finish(std::vector<uint8_t>* encoded) {
  if (status_ != SinkStatus::kRunning) {
    last_error_ = "Finish while not running";
    Abort();
    return false;
  }
  SetStatus(SinkStatus::kStopping, "finish");

  if (!EncodePendingAudio(true)) {
    Abort();
    return false;
  }

  int ret = avcodec_send_frame(video_codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    Fail("Error flushing video encoder: " + media::FfmpegErrorString(ret));
    Abort();
    return false;
  }
  if (!DrainEncoder(video_codec_ctx_, video_stream_)) {
    Abort();
    return false;
  }
  ret = avcodec_send_frame(audio_codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    Fail("Error flushing audio encoder: " + media::FfmpegErrorString(ret));
    Abort();
    return false;
  }
  if (!DrainEncoder(audio_codec_ctx_, audio_stream_)) {
    Abort();
    return false;
  }

  ret = av_write_trailer(format_ctx_);
  if (ret < 0) {
    Fail("Failed to write trailer: " + media::FfmpegErrorString(ret));
    Abort();
    return false;
  }
  avio_flush(avio_ctx_);

  const size_t size = output_->bytes.size();
  if (encoded) *encoded = std::move(output_->bytes);
  util::Logger::Info("[EncoderSink] Finished frames=" +
                     std::to_string(video_frames_written_) + " audio_frames=" +
                     std::to_string(audio_frames_received_) + " bytes=" +
                     std::to_string(size));
  Close();
  SetStatus(SinkStatus::kStopped, "finished");
  return true;
}

void FFmpegEncoderSink::Abort() {
  if (status_ == SinkStatus::kStopped || status_ == SinkStatus::kIdle) {
    Close();
    return;
  }
  util::Logger::Warn("[EncoderSink] Aborted after frames=" +
                     std::to_string(video_frames_written_));
  Close();
  SetStatus(SinkStatus::kStopped, "aborted");
}

void FFmpegEncoderSink::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (video_frame_) av_frame_free(&video_frame_);
  if (audio_frame_) av_frame_free(&audio_frame_);
  if (packet_) av_packet_free(&packet_);
  if (video_codec_ctx_) avcodec_free_context(&video_codec_ctx_);
  if (audio_codec_ctx_) avcodec_free_context(&audio_codec_ctx_);
  if (format_ctx_) {
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
    avio_ctx_ = nullptr;
  }
  output_.reset();
  video_stream_ = nullptr;
  audio_stream_ = nullptr;
  pending_audio_.clear();
}

}  // namespace adreel::output
