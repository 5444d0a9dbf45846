// Repository: AdReel
// Component: Audio Timeline
// Purpose: Back-to-back scheduling and mixing of per-scene voice-overs.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_RENDER_AUDIO_TIMELINE_HPP_
#define ADREEL_RENDER_AUDIO_TIMELINE_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "adreel/media/AudioBuffer.hpp"

namespace adreel::render {

// Start frames for back-to-back clips: start[i] = sum(frame_counts[0..i-1]).
std::vector<int64_t> ScheduleOffsets(const std::vector<int64_t>& frame_counts);

struct ScheduledClip {
  size_t scene_index = 0;
  int64_t start_frame = 0;   // in mix sample frames
  int64_t frame_count = 0;

  double StartSeconds() const {
    return static_cast<double>(start_frame) / media::kMixSampleRate;
  }
  double DurationSeconds() const {
    return static_cast<double>(frame_count) / media::kMixSampleRate;
  }
};

// Voice-over i starts where voice-over i-1 ends, independent of clip
// lengths. No stretching, looping or padding between clips; anything past
// TotalFrames() is silence.
class AudioTimeline {
 public:
  explicit AudioTimeline(std::vector<media::AudioBuffer> clips);

  const std::vector<ScheduledClip>& schedule() const { return schedule_; }
  int64_t TotalFrames() const { return total_frames_; }

  // Fills out with frame_count interleaved stereo frames starting at
  // first_frame on the mix clock.
  void Mix(int64_t first_frame, int64_t frame_count,
           std::vector<float>& out) const;

 private:
  std::vector<media::AudioBuffer> clips_;
  std::vector<ScheduledClip> schedule_;
  int64_t total_frames_ = 0;
};

}  // namespace adreel::render

#endif  // ADREEL_RENDER_AUDIO_TIMELINE_HPP_
