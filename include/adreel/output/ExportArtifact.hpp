// Repository: AdReel
// Component: Export Artifact
// Purpose: The finished video as bytes plus its download filename.
// Copyright (c) 2026 AdReel

#ifndef ADREEL_OUTPUT_EXPORT_ARTIFACT_HPP_
#define ADREEL_OUTPUT_EXPORT_ARTIFACT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace adreel::output {

constexpr size_t kMaxProductSlugLength = 40;

struct ExportArtifact {
  std::string filename;
  std::string mime_type;
  std::vector<uint8_t> bytes;
};

// Lower-case, runs of non-alphanumerics -> '_', trimmed of '_', at most 40
// characters, "campaign" when nothing is left.
std::string ProductSlug(const std::string& product_description);

// "YYYY-MM-DD" in UTC.
std::string UtcDateString(int64_t utc_ms);

// "<slug>_ad_<YYYY-MM-DD>.<extension>"
std::string ExportFilename(const std::string& product_description,
                           int64_t utc_ms, const std::string& extension);

}  // namespace adreel::output

#endif  // ADREEL_OUTPUT_EXPORT_ARTIFACT_HPP_
