// Repository: AdReel
// Component: Watermark Contract Tests
// Purpose: Still-image watermark is pure, size-preserving and placed
//          bottom-left with a width-relative font size.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

#include "adreel/media/FrameFingerprint.hpp"
#include "adreel/render/Watermark.hpp"
#include "harness/FakeMedia.hpp"
#include "harness/RecordingTextPainter.hpp"

namespace adreel::testing {
namespace {

class WatermarkContractTest : public ::testing::Test {
 protected:
  RecordingTextPainter painter_;
  render::FontConfig fonts_;
};

TEST_F(WatermarkContractTest, EmptyTextReturnsInputUnchanged) {
  auto image = MakeSolidImage(320, 240, media::Rgba{10, 20, 30, 255});

  auto out = render::ApplyWatermark(image, "", painter_, fonts_);

  ASSERT_TRUE(out.ok);
  EXPECT_EQ(out.value.pixels, image.pixels);
  EXPECT_TRUE(painter_.calls().empty());
}

TEST_F(WatermarkContractTest, OutputHasIdenticalDimensionsAndInputIsUntouched) {
  auto image = MakeSolidImage(1000, 600, media::Rgba{10, 20, 30, 255});
  const uint32_t before = media::CRC32Image(image);

  auto out = render::ApplyWatermark(image, "@acme", painter_, fonts_);

  ASSERT_TRUE(out.ok) << out.error;
  EXPECT_EQ(out.value.width, 1000);
  EXPECT_EQ(out.value.height, 600);
  EXPECT_EQ(media::CRC32Image(image), before);
  EXPECT_NE(media::CRC32Image(out.value), before);
}

TEST_F(WatermarkContractTest, PlacementAndStyleFollowImageWidth) {
  auto wide = MakeSolidImage(1000, 600, media::Rgba{});
  ASSERT_TRUE(render::ApplyWatermark(wide, "@acme", painter_, fonts_).ok);

  ASSERT_EQ(painter_.calls().size(), 1u);
  const render::TextSpec& spec = painter_.calls()[0];
  EXPECT_EQ(spec.text, "@acme");
  EXPECT_DOUBLE_EQ(spec.style.font_size, 20.0);  // 1000 / 50
  // Bottom of the glyph box, descenders included, sits on the 20px margin
  EXPECT_EQ(spec.anchor, render::TextAnchor::kBottomLeft);
  EXPECT_EQ(spec.x, 20);
  EXPECT_EQ(spec.y, 580);
  EXPECT_EQ(spec.style.fill.r, 255);
  EXPECT_EQ(spec.style.fill.a, 128);
}

TEST_F(WatermarkContractTest, SmallImagesUseMinimumFontSize) {
  auto small = MakeSolidImage(300, 300, media::Rgba{});
  ASSERT_TRUE(render::ApplyWatermark(small, "@acme", painter_, fonts_).ok);
  EXPECT_DOUBLE_EQ(painter_.calls()[0].style.font_size, 12.0);
}

TEST_F(WatermarkContractTest, PainterFailureIsReported) {
  painter_.SetFail(true);
  auto image = MakeSolidImage(100, 100, media::Rgba{});

  auto out = render::ApplyWatermark(image, "@acme", painter_, fonts_);

  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "watermark: font not found");
}

}  // namespace
}  // namespace adreel::testing
