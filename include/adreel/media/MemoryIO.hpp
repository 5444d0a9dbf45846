// Repository: AdReel
// Component: Memory I/O
// Purpose: libavformat demuxing straight from an in-memory MediaBlob via a
//          custom AVIOContext (read + seek). No temporary files.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_MEMORY_IO_HPP_
#define ADREEL_MEDIA_MEMORY_IO_HPP_

#include <cstdint>
#include <string>

#include "adreel/media/MediaBlob.hpp"

struct AVFormatContext;
struct AVIOContext;

namespace adreel::media {

// av_strerror() wrapped for log lines and error strings.
std::string FfmpegErrorString(int ret);

// MemoryDemuxer owns the AVFormatContext and AVIOContext for one blob.
// The blob handle is retained so the bytes outlive the demuxer.
class MemoryDemuxer {
 public:
  explicit MemoryDemuxer(MediaHandle blob);
  ~MemoryDemuxer();

  MemoryDemuxer(const MemoryDemuxer&) = delete;
  MemoryDemuxer& operator=(const MemoryDemuxer&) = delete;

  // Opens the container and reads stream info. On failure *error is set
  // and the demuxer stays closed.
  bool Open(std::string* error);
  void Close();

  AVFormatContext* format() const { return format_ctx_; }

 private:
  static int ReadThunk(void* opaque, uint8_t* buf, int buf_size);
  static int64_t SeekThunk(void* opaque, int64_t offset, int whence);

  MediaHandle blob_;
  int64_t position_ = 0;
  AVIOContext* avio_ctx_ = nullptr;
  AVFormatContext* format_ctx_ = nullptr;
};

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_MEMORY_IO_HPP_
