// Repository: AdReel
// Component: Image Codec
// Purpose: Decode still images (PNG/JPEG/WebP) to RGBA and encode RGBA to PNG.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_IMAGE_CODEC_HPP_
#define ADREEL_MEDIA_IMAGE_CODEC_HPP_

#include "adreel/media/MediaBlob.hpp"
#include "adreel/media/RgbaImage.hpp"
#include "adreel/util/Result.hpp"

namespace adreel::media {

class IImageCodec {
 public:
  virtual ~IImageCodec() = default;

  virtual util::Result<RgbaImage> Decode(const MediaHandle& encoded) = 0;

  // Returns a blob with mime_type "image/png".
  virtual util::Result<MediaHandle> EncodePng(const RgbaImage& image) = 0;
};

// FFmpegImageCodec decodes through libavformat's image pipe demuxers and
// encodes with the native PNG encoder. Stateless between calls.
class FFmpegImageCodec : public IImageCodec {
 public:
  util::Result<RgbaImage> Decode(const MediaHandle& encoded) override;
  util::Result<MediaHandle> EncodePng(const RgbaImage& image) override;
};

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_IMAGE_CODEC_HPP_
