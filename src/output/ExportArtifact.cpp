// Repository: AdReel
// Component: Export Artifact
// Purpose: Export file naming.
// Copyright (c) 2026 AdReel

#include "adreel/output/ExportArtifact.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace adreel::output {

std::string ProductSlug(const std::string& product_description) {
  std::string slug;
  bool pending_sep = false;
  for (unsigned char c : product_description) {
    if (std::isalnum(c)) {
      if (pending_sep && !slug.empty()) slug += '_';
      pending_sep = false;
      slug += static_cast<char>(std::tolower(c));
    } else {
      pending_sep = true;
    }
  }
  if (slug.size() > kMaxProductSlugLength) {
    slug.resize(kMaxProductSlugLength);
    while (!slug.empty() && slug.back() == '_') slug.pop_back();
  }
  return slug.empty() ? "campaign" : slug;
}

std::string UtcDateString(int64_t utc_ms) {
  std::time_t seconds = static_cast<std::time_t>(utc_ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm_utc.tm_year + 1900,
                tm_utc.tm_mon + 1, tm_utc.tm_mday);
  return buf;
}

std::string ExportFilename(const std::string& product_description,
                           int64_t utc_ms, const std::string& extension) {
  return ProductSlug(product_description) + "_ad_" + UtcDateString(utc_ms) +
         "." + extension;
}

}  // namespace adreel::output
