// Repository: AdReel
// Component: Export Artifact Contract Tests
// Purpose: Download filenames are built from a product slug and the UTC date.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

#include "adreel/output/ExportArtifact.hpp"

namespace adreel::testing {
namespace {

constexpr int64_t kLeapDayNoonUtcMs = 1709208000000;     // 2024-02-29 12:00:00
constexpr int64_t kLastSecondOfDayUtcMs = 1792454399000;  // 2026-10-19 23:59:59

TEST(ExportArtifactContract, SlugLowercasesAndJoinsWords) {
  EXPECT_EQ(output::ProductSlug("Trail Runner Shoes"), "trail_runner_shoes");
  EXPECT_EQ(output::ProductSlug("  GlowUp -- Serum (50ml)!  "), "glowup_serum_50ml");
  EXPECT_EQ(output::ProductSlug("X"), "x");
}

TEST(ExportArtifactContract, SlugFallsBackWhenNothingUsable) {
  EXPECT_EQ(output::ProductSlug(""), "campaign");
  EXPECT_EQ(output::ProductSlug("!!! ???"), "campaign");
}

TEST(ExportArtifactContract, SlugIsBounded) {
  std::string slug = output::ProductSlug(std::string(100, 'a'));
  EXPECT_EQ(slug.size(), output::kMaxProductSlugLength);

  // A cut that lands on a separator does not leave it dangling
  std::string word_cut = output::ProductSlug(std::string(39, 'b') + " cccc");
  EXPECT_EQ(word_cut, std::string(39, 'b'));
}

TEST(ExportArtifactContract, UtcDateIgnoresTimeOfDay) {
  EXPECT_EQ(output::UtcDateString(0), "1970-01-01");
  EXPECT_EQ(output::UtcDateString(kLeapDayNoonUtcMs), "2024-02-29");
  EXPECT_EQ(output::UtcDateString(kLastSecondOfDayUtcMs), "2026-10-19");
  EXPECT_EQ(output::UtcDateString(kLastSecondOfDayUtcMs + 1000), "2026-10-20");
}

TEST(ExportArtifactContract, FilenameCombinesSlugDateAndExtension) {
  EXPECT_EQ(output::ExportFilename("Trail Runner Shoes", kLeapDayNoonUtcMs, "mp4"),
            "trail_runner_shoes_ad_2024-02-29.mp4");
  EXPECT_EQ(output::ExportFilename("", 0, "mkv"), "campaign_ad_1970-01-01.mkv");
}

}  // namespace
}  // namespace adreel::testing
