// Repository: AdReel
// Component: Audio Timeline
// Purpose: Back-to-back scheduling and mixing of per-scene voice-overs.
// Copyright (c) 2026 AdReel

#include "adreel/render/AudioTimeline.hpp"

#include <algorithm>

namespace adreel::render {

std::vector<int64_t> ScheduleOffsets(const std::vector<int64_t>& frame_counts) {
  std::vector<int64_t> offsets;
  offsets.reserve(frame_counts.size());
  int64_t cursor = 0;
  for (int64_t n : frame_counts) {
    offsets.push_back(cursor);
    cursor += n;
  }
  return offsets;
}

AudioTimeline::AudioTimeline(std::vector<media::AudioBuffer> clips)
    : clips_(std::move(clips)) {
  std::vector<int64_t> counts;
  counts.reserve(clips_.size());
  for (const auto& clip : clips_) counts.push_back(clip.FrameCount());
  const std::vector<int64_t> starts = ScheduleOffsets(counts);

  schedule_.reserve(clips_.size());
  for (size_t i = 0; i < clips_.size(); ++i) {
    ScheduledClip entry;
    entry.scene_index = i;
    entry.start_frame = starts[i];
    entry.frame_count = counts[i];
    schedule_.push_back(entry);
  }
  total_frames_ = clips_.empty() ? 0 : starts.back() + counts.back();
}

void AudioTimeline::Mix(int64_t first_frame, int64_t frame_count,
                        std::vector<float>& out) const {
  constexpr int ch = media::kMixChannels;
  out.assign(static_cast<size_t>(std::max<int64_t>(frame_count, 0)) * ch, 0.0f);
  if (frame_count <= 0) return;

  const int64_t window_end = first_frame + frame_count;
  for (size_t i = 0; i < schedule_.size(); ++i) {
    const ScheduledClip& entry = schedule_[i];
    const int64_t clip_end = entry.start_frame + entry.frame_count;
    const int64_t from = std::max(first_frame, entry.start_frame);
    const int64_t to = std::min(window_end, clip_end);
    if (to <= from) continue;

    const std::vector<float>& src = clips_[i].samples;
    for (int64_t f = from; f < to; ++f) {
      const size_t src_idx = static_cast<size_t>(f - entry.start_frame) * ch;
      const size_t dst_idx = static_cast<size_t>(f - first_frame) * ch;
      for (int c = 0; c < ch; ++c) {
        out[dst_idx + c] += src[src_idx + c];
      }
    }
  }
}

}  // namespace adreel::render
