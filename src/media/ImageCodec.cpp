// Repository: AdReel
// Component: Image Codec
// Purpose: FFmpeg-backed still image decode/encode.
// Copyright (c) 2026 AdReel

#include "adreel/media/ImageCodec.hpp"

#include <algorithm>
#include <vector>

#include "adreel/media/MemoryIO.hpp"
#include "adreel/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

namespace adreel::media {

namespace {

bool FrameToRgba(const AVFrame* frame, RgbaImage& out, std::string* error) {
  SwsContext* sws = sws_getContext(
      frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
      frame->width, frame->height, AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr,
      nullptr, nullptr);
  if (!sws) {
    *error = "no conversion from pixel format " + std::to_string(frame->format);
    return false;
  }
  out = RgbaImage(frame->width, frame->height);
  uint8_t* dst[4] = {out.pixels.data(), nullptr, nullptr, nullptr};
  const int dst_stride[4] = {out.Stride(), 0, 0, 0};
  sws_scale(sws, frame->data, frame->linesize, 0, frame->height, dst,
            dst_stride);
  sws_freeContext(sws);
  return true;
}

}  // namespace

util::Result<RgbaImage> FFmpegImageCodec::Decode(const MediaHandle& encoded) {
  using R = util::Result<RgbaImage>;
  MemoryDemuxer demuxer(encoded);
  std::string error;
  if (!demuxer.Open(&error)) {
    return R::Failure("image decode: " + error);
  }

  AVFormatContext* fmt = demuxer.format();
  int stream_index = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    return R::Failure("image decode: no image stream");
  }
  const AVCodecParameters* codecpar = fmt->streams[stream_index]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    return R::Failure(std::string("image decode: no decoder for ") +
                      avcodec_get_name(codecpar->codec_id));
  }

  AVCodecContext* codec_ctx = avcodec_alloc_context3(codec);
  if (!codec_ctx) return R::Failure("image decode: avcodec_alloc_context3 failed");
  int ret = avcodec_parameters_to_context(codec_ctx, codecpar);
  if (ret >= 0) ret = avcodec_open2(codec_ctx, codec, nullptr);
  if (ret < 0) {
    avcodec_free_context(&codec_ctx);
    return R::Failure("image decode: avcodec_open2: " + FfmpegErrorString(ret));
  }

  AVPacket* pkt = av_packet_alloc();
  AVFrame* frame = av_frame_alloc();
  bool got_frame = false;
  bool flushed = false;
  std::string decode_error = "no frame decoded";

  while (pkt && frame) {
    ret = avcodec_receive_frame(codec_ctx, frame);
    if (ret == 0) {
      got_frame = true;
      break;
    }
    if (ret != AVERROR(EAGAIN)) {
      if (ret != AVERROR_EOF) decode_error = "receive_frame: " + FfmpegErrorString(ret);
      break;
    }
    if (flushed) break;

    ret = av_read_frame(fmt, pkt);
    if (ret < 0) {
      flushed = true;
      ret = avcodec_send_packet(codec_ctx, nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        decode_error = "flush: " + FfmpegErrorString(ret);
        break;
      }
      continue;
    }
    if (pkt->stream_index == stream_index) {
      ret = avcodec_send_packet(codec_ctx, pkt);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        av_packet_unref(pkt);
        decode_error = "send_packet: " + FfmpegErrorString(ret);
        break;
      }
    }
    av_packet_unref(pkt);
  }

  R result;
  if (got_frame) {
    RgbaImage image;
    if (FrameToRgba(frame, image, &error)) {
      result = R::Success(std::move(image));
    } else {
      result = R::Failure("image decode: " + error);
    }
  } else {
    result = R::Failure("image decode: " + decode_error);
  }

  av_frame_free(&frame);
  av_packet_free(&pkt);
  avcodec_free_context(&codec_ctx);
  return result;
}

util::Result<MediaHandle> FFmpegImageCodec::EncodePng(const RgbaImage& image) {
  using R = util::Result<MediaHandle>;
  if (image.IsEmpty()) return R::Failure("png encode: empty image");

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PNG);
  if (!codec) return R::Failure("png encode: PNG encoder not available");

  AVCodecContext* ctx = avcodec_alloc_context3(codec);
  if (!ctx) return R::Failure("png encode: avcodec_alloc_context3 failed");
  ctx->width = image.width;
  ctx->height = image.height;
  ctx->pix_fmt = AV_PIX_FMT_RGBA;
  ctx->time_base = AVRational{1, 1};

  int ret = avcodec_open2(ctx, codec, nullptr);
  if (ret < 0) {
    avcodec_free_context(&ctx);
    return R::Failure("png encode: avcodec_open2: " + FfmpegErrorString(ret));
  }

  AVFrame* frame = av_frame_alloc();
  if (!frame) {
    avcodec_free_context(&ctx);
    return R::Failure("png encode: av_frame_alloc failed");
  }
  frame->format = AV_PIX_FMT_RGBA;
  frame->width = image.width;
  frame->height = image.height;
  frame->pts = 0;
  ret = av_frame_get_buffer(frame, 32);
  if (ret < 0) {
    av_frame_free(&frame);
    avcodec_free_context(&ctx);
    return R::Failure("png encode: av_frame_get_buffer: " + FfmpegErrorString(ret));
  }
  for (int y = 0; y < image.height; ++y) {
    std::copy(image.Row(y), image.Row(y) + image.Stride(),
              frame->data[0] + static_cast<ptrdiff_t>(y) * frame->linesize[0]);
  }

  AVPacket* pkt = av_packet_alloc();
  std::vector<uint8_t> bytes;
  ret = pkt ? avcodec_send_frame(ctx, frame) : AVERROR(ENOMEM);
  if (ret >= 0) ret = avcodec_send_frame(ctx, nullptr);
  while (ret >= 0) {
    ret = avcodec_receive_packet(ctx, pkt);
    if (ret < 0) break;
    bytes.insert(bytes.end(), pkt->data, pkt->data + pkt->size);
    av_packet_unref(pkt);
  }

  av_packet_free(&pkt);
  av_frame_free(&frame);
  avcodec_free_context(&ctx);

  if (bytes.empty()) {
    util::Logger::Error("[ImageCodec] PNG encode produced no data " +
                        std::to_string(image.width) + "x" +
                        std::to_string(image.height));
    return R::Failure("png encode: encoder produced no data");
  }
  return R::Success(MakeMediaHandle("image/png", std::move(bytes)));
}

}  // namespace adreel::media
