// Repository: AdReel
// Component: Clip Source
// Purpose: libavcodec video decode of in-memory clips to RGBA frames.
// Copyright (c) 2026 AdReel

#include "adreel/media/ClipSource.hpp"

#include "adreel/media/MemoryIO.hpp"
#include "adreel/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace adreel::media {

namespace {
constexpr int64_t kFallbackFrameDurationUs = 1000000 / 30;
}  // namespace

int64_t ClipTimeline::Next(std::optional<int64_t> pts_us) {
  int64_t out = next_pts_us_;
  if (pts_us) {
    if (!origin_us_) origin_us_ = *pts_us;
    out = *pts_us - *origin_us_;
    if (out < next_pts_us_ - frame_duration_us_) out = next_pts_us_;
  }
  next_pts_us_ = out + frame_duration_us_;
  return out;
}

void ClipTimeline::Reset() {
  origin_us_.reset();
  next_pts_us_ = 0;
}

FFmpegClipDecoder::FFmpegClipDecoder(MediaHandle clip) : clip_(std::move(clip)) {}

FFmpegClipDecoder::~FFmpegClipDecoder() { Close(); }

ClipSourceFactory FFmpegClipDecoder::Factory() {
  return [](const MediaHandle& clip) -> std::unique_ptr<IClipSource> {
    return std::make_unique<FFmpegClipDecoder>(clip);
  };
}

bool FFmpegClipDecoder::Open() {
  Close();
  demuxer_ = std::make_unique<MemoryDemuxer>(clip_);
  if (!demuxer_->Open(&last_error_)) {
    util::Logger::Error("[ClipDecoder] DECODER_STEP open_input FAILED: " + last_error_);
    Close();
    return false;
  }

  AVFormatContext* fmt = demuxer_->format();
  stream_index_ = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (stream_index_ < 0) {
    last_error_ = "no video stream";
    util::Logger::Error("[ClipDecoder] DECODER_STEP find_video_stream FAILED");
    Close();
    return false;
  }

  AVStream* stream = fmt->streams[stream_index_];
  const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
  if (!codec) {
    last_error_ = std::string("no decoder for ") +
                  avcodec_get_name(stream->codecpar->codec_id);
    util::Logger::Error("[ClipDecoder] DECODER_STEP find_decoder FAILED: " + last_error_);
    Close();
    return false;
  }
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    last_error_ = "avcodec_alloc_context3 failed";
    Close();
    return false;
  }
  int ret = avcodec_parameters_to_context(codec_ctx_, stream->codecpar);
  if (ret < 0) {
    last_error_ = "parameters_to_context: " + FfmpegErrorString(ret);
    Close();
    return false;
  }
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    last_error_ = "avcodec_open2: " + FfmpegErrorString(ret);
    util::Logger::Error("[ClipDecoder] DECODER_STEP initialize_codec FAILED: " + last_error_);
    Close();
    return false;
  }

  width_ = codec_ctx_->width;
  height_ = codec_ctx_->height;
  if (width_ <= 0 || height_ <= 0) {
    last_error_ = "clip has no dimensions";
    Close();
    return false;
  }

  AVRational rate = stream->avg_frame_rate;
  if (rate.num <= 0 || rate.den <= 0) rate = stream->r_frame_rate;
  timeline_.Reset();
  timeline_.set_frame_duration_us((rate.num > 0 && rate.den > 0)
                                      ? av_rescale(1000000, rate.den, rate.num)
                                      : kFallbackFrameDurationUs);

  packet_ = av_packet_alloc();
  frame_ = av_frame_alloc();
  if (!packet_ || !frame_) {
    last_error_ = "packet/frame allocation failed";
    Close();
    return false;
  }

  util::Logger::Debug("[ClipDecoder] DECODER_STEP open_input OK " +
                      std::to_string(width_) + "x" + std::to_string(height_) +
                      " frame_duration_us=" + std::to_string(timeline_.frame_duration_us()));
  return true;
}

ClipReadStatus FFmpegClipDecoder::ReadFrame(ClipFrame& out) {
  if (!codec_ctx_) {
    last_error_ = "decoder not open";
    return ClipReadStatus::kError;
  }

  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      bool ok = ConvertFrame(out);
      av_frame_unref(frame_);
      return ok ? ClipReadStatus::kFrame : ClipReadStatus::kError;
    }
    if (ret == AVERROR_EOF) {
      return ClipReadStatus::kEndOfStream;
    }
    if (ret != AVERROR(EAGAIN)) {
      last_error_ = "receive_frame: " + FfmpegErrorString(ret);
      return ClipReadStatus::kError;
    }
    if (input_eof_) {
      // Flush already sent and the decoder still wants input: nothing left.
      return ClipReadStatus::kEndOfStream;
    }

    ret = av_read_frame(demuxer_->format(), packet_);
    if (ret < 0) {
      input_eof_ = true;
      ret = avcodec_send_packet(codec_ctx_, nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        last_error_ = "flush: " + FfmpegErrorString(ret);
        return ClipReadStatus::kError;
      }
      continue;
    }
    if (packet_->stream_index == stream_index_) {
      ret = avcodec_send_packet(codec_ctx_, packet_);
      if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
        av_packet_unref(packet_);
        last_error_ = "send_packet: " + FfmpegErrorString(ret);
        return ClipReadStatus::kError;
      }
    }
    av_packet_unref(packet_);
  }
}

bool FFmpegClipDecoder::ConvertFrame(ClipFrame& out) {
  sws_ctx_ = sws_getCachedContext(
      sws_ctx_, frame_->width, frame_->height,
      static_cast<AVPixelFormat>(frame_->format), frame_->width,
      frame_->height, AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    last_error_ = "sws_getCachedContext failed";
    return false;
  }
  if (out.image.width != frame_->width || out.image.height != frame_->height) {
    out.image = RgbaImage(frame_->width, frame_->height);
  }
  uint8_t* dst[4] = {out.image.pixels.data(), nullptr, nullptr, nullptr};
  const int dst_stride[4] = {out.image.Stride(), 0, 0, 0};
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height, dst,
            dst_stride);

  AVStream* stream = demuxer_->format()->streams[stream_index_];
  std::optional<int64_t> raw_pts_us;
  if (frame_->best_effort_timestamp != AV_NOPTS_VALUE) {
    raw_pts_us = av_rescale_q(frame_->best_effort_timestamp, stream->time_base,
                              AVRational{1, 1000000});
  }
  out.pts_us = timeline_.Next(raw_pts_us);
  out.duration_us = timeline_.frame_duration_us();
  return true;
}

void FFmpegClipDecoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) av_frame_free(&frame_);
  if (packet_) av_packet_free(&packet_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  demuxer_.reset();
  stream_index_ = -1;
  timeline_.Reset();
  input_eof_ = false;
}

}  // namespace adreel::media
