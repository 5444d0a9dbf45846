// Repository: AdReel
// Component: Recording Output Sink
// Purpose: Recording sink implementation.
// Copyright (c) 2026 AdReel

#include "harness/RecordingSink.hpp"

#include <algorithm>
#include <cmath>

#include "adreel/media/FrameFingerprint.hpp"
#include "adreel/render/OverlayLayout.hpp"

namespace adreel::testing {

void RecordingSink::SetStatus(output::SinkStatus status, const std::string& message) {
  status_ = status;
  if (callback_) callback_(status, message);
}

bool RecordingSink::Start(const output::OutputFormat& format) {
  ++start_calls_;
  if (status_ != output::SinkStatus::kIdle) {
    last_error_ = "already started";
    return false;
  }
  SetStatus(output::SinkStatus::kStarting, "starting");
  if (fail_start_) {
    last_error_ = "encoder libx264 not available";
    SetStatus(output::SinkStatus::kError, last_error_);
    return false;
  }
  format_ = format;
  SetStatus(output::SinkStatus::kRunning, "running");
  return true;
}

bool RecordingSink::ConsumeVideo(const media::RgbaImage& frame, int64_t frame_index) {
  if (status_ != output::SinkStatus::kRunning) {
    last_error_ = "not running";
    return false;
  }
  if (frame_index == fail_video_at_) {
    last_error_ = "write failed at frame " + std::to_string(frame_index);
    SetStatus(output::SinkStatus::kError, last_error_);
    return false;
  }
  RecordedFrame rec;
  rec.frame_index = frame_index;
  rec.crc32 = media::CRC32Image(frame);
  rec.center = frame.PixelAt(frame.width / 2, frame.height / 2);
  rec.top_left = frame.PixelAt(0, 0);
  int tx = 0;
  int ty = 0;
  TopRightSamplePoint(frame.width, frame.height, &tx, &ty);
  rec.top_right = frame.PixelAt(tx, ty);
  frames_.push_back(rec);
  return true;
}

bool RecordingSink::ConsumeAudio(const float* interleaved, int64_t frame_count,
                                 int64_t first_frame) {
  if (status_ != output::SinkStatus::kRunning) {
    last_error_ = "not running";
    return false;
  }
  RecordedAudioChunk chunk;
  chunk.first_frame = first_frame;
  chunk.frame_count = frame_count;
  const size_t n = static_cast<size_t>(frame_count) * format_.channels;
  for (size_t i = 0; i < n; ++i) {
    chunk.peak = std::max(chunk.peak, std::fabs(interleaved[i]));
  }
  audio_samples_.insert(audio_samples_.end(), interleaved, interleaved + n);
  audio_.push_back(chunk);
  audio_frames_ += frame_count;
  return true;
}

bool RecordingSink::Finish(std::vector<uint8_t>* encoded) {
  if (status_ != output::SinkStatus::kRunning) {
    last_error_ = "not running";
    return false;
  }
  SetStatus(output::SinkStatus::kStopping, "finishing");
  if (encoded) {
    const std::string marker = "RECORDED " + std::to_string(frames_.size());
    encoded->assign(marker.begin(), marker.end());
  }
  finished_ = true;
  SetStatus(output::SinkStatus::kStopped, "finished");
  return true;
}

void RecordingSink::Abort() {
  aborted_ = true;
  if (status_ != output::SinkStatus::kStopped) {
    SetStatus(output::SinkStatus::kStopped, "aborted");
  }
}

void RecordingSink::TopRightSamplePoint(int width, int height, int* x, int* y) {
  // The corner logo's right edge sits at width - margin and its top at margin.
  *x = std::max(0, width - render::kOverlayMarginPx - 4);
  *y = std::min(std::max(0, height - 1), render::kOverlayMarginPx + 4);
}

bool RecordingSink::FramesContiguous() const {
  for (size_t i = 0; i < frames_.size(); ++i) {
    if (frames_[i].frame_index != static_cast<int64_t>(i)) return false;
  }
  return true;
}

bool RecordingSink::AudioContiguous() const {
  int64_t expected = 0;
  for (const auto& chunk : audio_) {
    if (chunk.first_frame != expected) return false;
    expected += chunk.frame_count;
  }
  return true;
}

std::optional<float> RecordingSink::SampleAt(int64_t sample_frame) const {
  const size_t idx = static_cast<size_t>(sample_frame) * format_.channels;
  if (sample_frame < 0 || idx >= audio_samples_.size()) return std::nullopt;
  return audio_samples_[idx];
}

}  // namespace adreel::testing
