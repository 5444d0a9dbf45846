// Repository: AdReel
// Component: Media Blob
// Purpose: Immutable, shared, in-memory media payloads (images, audio, clips).
// Copyright (c) 2026 AdReel

#ifndef ADREEL_MEDIA_MEDIA_BLOB_HPP_
#define ADREEL_MEDIA_MEDIA_BLOB_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace adreel::media {

// A blob is written once by the step that produced it and then only read.
// Handles are shared between the asset set, the compositor and the exporter.
struct MediaBlob {
  std::string mime_type;
  std::vector<uint8_t> bytes;

  size_t size() const { return bytes.size(); }
  bool empty() const { return bytes.empty(); }
};

using MediaHandle = std::shared_ptr<const MediaBlob>;

inline MediaHandle MakeMediaHandle(std::string mime_type,
                                   std::vector<uint8_t> bytes) {
  auto blob = std::make_shared<MediaBlob>();
  blob->mime_type = std::move(mime_type);
  blob->bytes = std::move(bytes);
  return blob;
}

}  // namespace adreel::media

#endif  // ADREEL_MEDIA_MEDIA_BLOB_HPP_
