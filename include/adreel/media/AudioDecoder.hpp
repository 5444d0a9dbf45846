// Repository: AdReel
// Component: Audio Decoder
// Purpose: Decode a voice-over blob (MP3/WAV/AAC) into the mix format.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_AUDIO_DECODER_HPP_
#define ADREEL_MEDIA_AUDIO_DECODER_HPP_

#include "adreel/media/AudioBuffer.hpp"
#include "adreel/media/MediaBlob.hpp"
#include "adreel/util/Result.hpp"

namespace adreel::media {

class IAudioDecoder {
 public:
  virtual ~IAudioDecoder() = default;

  // Entire clip, resampled to kMixSampleRate / kMixChannels float.
  virtual util::Result<AudioBuffer> Decode(const MediaHandle& encoded) = 0;
};

class FFmpegAudioDecoder : public IAudioDecoder {
 public:
  util::Result<AudioBuffer> Decode(const MediaHandle& encoded) override;
};

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_AUDIO_DECODER_HPP_
