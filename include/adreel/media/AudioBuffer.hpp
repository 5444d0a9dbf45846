// Repository: AdReel
// Component: Audio Buffer
// Purpose: Decoded voice-over PCM in the mix format (48 kHz, stereo, float).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_AUDIO_BUFFER_HPP_
#define ADREEL_MEDIA_AUDIO_BUFFER_HPP_

#include <cstdint>
#include <vector>

namespace adreel::media {

constexpr int kMixSampleRate = 48000;
constexpr int kMixChannels = 2;

struct AudioBuffer {
  int sample_rate = kMixSampleRate;
  int channels = kMixChannels;
  std::vector<float> samples;  // interleaved

  int64_t FrameCount() const {
    return channels > 0 ? static_cast<int64_t>(samples.size()) / channels : 0;
  }

  double DurationSeconds() const {
    return sample_rate > 0
               ? static_cast<double>(FrameCount()) / sample_rate
               : 0.0;
  }
};

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_AUDIO_BUFFER_HPP_
