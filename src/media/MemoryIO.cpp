// Repository: AdReel
// Component: Memory I/O
// Purpose: libavformat demuxing from in-memory blobs.
// Copyright (c) 2026 AdReel

#include "adreel/media/MemoryIO.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

namespace adreel::media {

namespace {
constexpr int kAvioBufferSize = 64 * 1024;
}  // namespace

std::string FfmpegErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

MemoryDemuxer::MemoryDemuxer(MediaHandle blob) : blob_(std::move(blob)) {}

MemoryDemuxer::~MemoryDemuxer() { Close(); }

int MemoryDemuxer::ReadThunk(void* opaque, uint8_t* buf, int buf_size) {
  auto* self = static_cast<MemoryDemuxer*>(opaque);
  const int64_t total = static_cast<int64_t>(self->blob_->bytes.size());
  const int64_t remaining = total - self->position_;
  if (remaining <= 0) return AVERROR_EOF;
  const int n = static_cast<int>(std::min<int64_t>(remaining, buf_size));
  std::memcpy(buf, self->blob_->bytes.data() + self->position_,
              static_cast<size_t>(n));
  self->position_ += n;
  return n;
}

int64_t MemoryDemuxer::SeekThunk(void* opaque, int64_t offset, int whence) {
  auto* self = static_cast<MemoryDemuxer*>(opaque);
  const int64_t total = static_cast<int64_t>(self->blob_->bytes.size());
  if (whence & AVSEEK_SIZE) return total;

  int64_t target = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET: target = offset; break;
    case SEEK_CUR: target = self->position_ + offset; break;
    case SEEK_END: target = total + offset; break;
    default: return AVERROR(EINVAL);
  }
  if (target < 0 || target > total) return AVERROR(EINVAL);
  self->position_ = target;
  return target;
}

bool MemoryDemuxer::Open(std::string* error) {
  Close();
  if (!blob_ || blob_->bytes.empty()) {
    if (error) *error = "empty media blob";
    return false;
  }
  position_ = 0;

  auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!buffer) {
    if (error) *error = "av_malloc failed";
    return false;
  }
  avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, this,
                                 &MemoryDemuxer::ReadThunk, nullptr,
                                 &MemoryDemuxer::SeekThunk);
  if (!avio_ctx_) {
    av_free(buffer);
    if (error) *error = "avio_alloc_context failed";
    return false;
  }

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    if (error) *error = "avformat_alloc_context failed";
    Close();
    return false;
  }
  format_ctx_->pb = avio_ctx_;
  format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  int ret = avformat_open_input(&format_ctx_, nullptr, nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    if (error) *error = "open_input: " + FfmpegErrorString(ret);
    Close();
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    if (error) *error = "find_stream_info: " + FfmpegErrorString(ret);
    Close();
    return false;
  }
  return true;
}

void MemoryDemuxer::Close() {
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
    format_ctx_ = nullptr;
  }
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
    avio_ctx_ = nullptr;
  }
  position_ = 0;
}

}  // namespace adreel::media
