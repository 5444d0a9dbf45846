// Repository: AdReel
// Component: Audio Decoder
// Purpose: libavcodec + libswresample decode of voice-over blobs.
// Copyright (c) 2026 AdReel

#include "adreel/media/AudioDecoder.hpp"

#include <cstddef>
#include <vector>

#include "adreel/media/MemoryIO.hpp"
#include "adreel/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace adreel::media {

namespace {

// Owns the per-decode FFmpeg state so every exit path releases it.
struct DecodeState {
  AVCodecContext* codec_ctx = nullptr;
  SwrContext* swr_ctx = nullptr;
  AVPacket* packet = nullptr;
  AVFrame* frame = nullptr;

  ~DecodeState() {
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (swr_ctx) swr_free(&swr_ctx);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
  }
};

bool InitResampler(DecodeState& st, std::string* error) {
  AVChannelLayout src_layout;
  av_channel_layout_uninit(&src_layout);
  if (st.codec_ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
      st.codec_ctx->ch_layout.nb_channels <= 0) {
    int channels = st.codec_ctx->ch_layout.nb_channels > 0
                       ? st.codec_ctx->ch_layout.nb_channels
                       : 1;
    av_channel_layout_default(&src_layout, channels);
  } else if (av_channel_layout_copy(&src_layout, &st.codec_ctx->ch_layout) < 0) {
    *error = "failed to copy source channel layout";
    return false;
  }

  AVChannelLayout dst_layout;
  av_channel_layout_uninit(&dst_layout);
  av_channel_layout_default(&dst_layout, kMixChannels);

  int ret = swr_alloc_set_opts2(&st.swr_ctx, &dst_layout, AV_SAMPLE_FMT_FLT,
                                kMixSampleRate, &src_layout,
                                st.codec_ctx->sample_fmt,
                                st.codec_ctx->sample_rate, 0, nullptr);
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0 || !st.swr_ctx) {
    *error = "swr_alloc_set_opts2: " + FfmpegErrorString(ret);
    return false;
  }
  ret = swr_init(st.swr_ctx);
  if (ret < 0) {
    *error = "swr_init: " + FfmpegErrorString(ret);
    return false;
  }
  return true;
}

// Converts (or flushes, when frame is null) into out.
bool Resample(SwrContext* swr, const AVFrame* frame, AudioBuffer& out) {
  const int in_samples = frame ? frame->nb_samples : 0;
  const int capacity = swr_get_out_samples(swr, in_samples);
  if (capacity <= 0) return true;

  std::vector<float> chunk(static_cast<size_t>(capacity) * kMixChannels);
  uint8_t* out_planes[1] = {reinterpret_cast<uint8_t*>(chunk.data())};
  int produced = swr_convert(
      swr, out_planes, capacity,
      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
      in_samples);
  if (produced < 0) return false;
  out.samples.insert(out.samples.end(), chunk.begin(),
                     chunk.begin() + static_cast<ptrdiff_t>(produced) * kMixChannels);
  return true;
}

bool DrainDecoder(DecodeState& st, AudioBuffer& out, std::string* error) {
  while (true) {
    int ret = avcodec_receive_frame(st.codec_ctx, st.frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) {
      *error = "receive_frame: " + FfmpegErrorString(ret);
      return false;
    }
    bool ok = Resample(st.swr_ctx, st.frame, out);
    av_frame_unref(st.frame);
    if (!ok) {
      *error = "swr_convert failed";
      return false;
    }
  }
}

}  // namespace

util::Result<AudioBuffer> FFmpegAudioDecoder::Decode(const MediaHandle& encoded) {
  using R = util::Result<AudioBuffer>;
  MemoryDemuxer demuxer(encoded);
  std::string error;
  if (!demuxer.Open(&error)) {
    return R::Failure("audio decode: " + error);
  }

  AVFormatContext* fmt = demuxer.format();
  int stream_index = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (stream_index < 0) {
    return R::Failure("audio decode: no audio stream");
  }
  const AVCodecParameters* codecpar = fmt->streams[stream_index]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    return R::Failure(std::string("audio decode: no decoder for ") +
                      avcodec_get_name(codecpar->codec_id));
  }

  DecodeState st;
  st.codec_ctx = avcodec_alloc_context3(codec);
  if (!st.codec_ctx) return R::Failure("audio decode: avcodec_alloc_context3 failed");
  int ret = avcodec_parameters_to_context(st.codec_ctx, codecpar);
  if (ret < 0) {
    return R::Failure("audio decode: parameters_to_context: " + FfmpegErrorString(ret));
  }
  ret = avcodec_open2(st.codec_ctx, codec, nullptr);
  if (ret < 0) {
    return R::Failure("audio decode: avcodec_open2: " + FfmpegErrorString(ret));
  }
  if (!InitResampler(st, &error)) {
    return R::Failure("audio decode: " + error);
  }

  st.packet = av_packet_alloc();
  st.frame = av_frame_alloc();
  if (!st.packet || !st.frame) return R::Failure("audio decode: allocation failed");

  AudioBuffer buffer;
  while ((ret = av_read_frame(fmt, st.packet)) >= 0) {
    if (st.packet->stream_index == stream_index) {
      ret = avcodec_send_packet(st.codec_ctx, st.packet);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        util::Logger::Warn("[AudioDecoder] send_packet: " + FfmpegErrorString(ret));
      }
      if (!DrainDecoder(st, buffer, &error)) {
        av_packet_unref(st.packet);
        return R::Failure("audio decode: " + error);
      }
    }
    av_packet_unref(st.packet);
  }

  ret = avcodec_send_packet(st.codec_ctx, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    return R::Failure("audio decode: flush: " + FfmpegErrorString(ret));
  }
  if (!DrainDecoder(st, buffer, &error)) {
    return R::Failure("audio decode: " + error);
  }
  if (!Resample(st.swr_ctx, nullptr, buffer)) {
    return R::Failure("audio decode: swr flush failed");
  }

  if (buffer.FrameCount() == 0) {
    return R::Failure("audio decode: no samples decoded");
  }
  util::Logger::Debug("[AudioDecoder] decoded " +
                      std::to_string(buffer.FrameCount()) + " frames (" +
                      std::to_string(buffer.DurationSeconds()) + "s)");
  return R::Success(std::move(buffer));
}

}  // namespace adreel::media
