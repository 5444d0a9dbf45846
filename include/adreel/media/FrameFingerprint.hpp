// Repository: AdReel
// Component: Frame Fingerprint
// Purpose: CRC32 of composed frames, used by the export report and tests to
//          prove which content landed on which output frame.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_FRAME_FINGERPRINT_HPP_
#define ADREEL_MEDIA_FRAME_FINGERPRINT_HPP_

#include <zlib.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "adreel/media/RgbaImage.hpp"

namespace adreel::media {

inline uint32_t CRC32Bytes(const uint8_t* data, size_t size) {
  if (!data || size == 0) return 0;
  uLong crc = crc32(0L, Z_NULL, 0);
  constexpr size_t kChunk = 1u << 30;
  while (size > 0) {
    size_t len = std::min(size, kChunk);
    crc = crc32(crc, data, static_cast<uInt>(len));
    data += len;
    size -= len;
  }
  return static_cast<uint32_t>(crc);
}

inline uint32_t CRC32Image(const RgbaImage& image) {
  return CRC32Bytes(image.pixels.data(), image.pixels.size());
}

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_FRAME_FINGERPRINT_HPP_
