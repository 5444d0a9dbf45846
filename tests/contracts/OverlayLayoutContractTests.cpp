// Repository: AdReel
// Component: Overlay Layout Contract Tests
// Purpose: Canvas sizes, cover scaling, logo rectangles, text anchors and
//          the pixels the overlay renderer produces from them.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

#include <cstdlib>

#include "adreel/render/OverlayLayout.hpp"
#include "adreel/render/OverlayRenderer.hpp"
#include "harness/FakeMedia.hpp"
#include "harness/RecordingTextPainter.hpp"

namespace adreel::testing {
namespace {

using render::CanvasSize;

constexpr double kEps = 1e-9;

void ExpectColorNear(const media::Rgba& actual, const media::Rgba& expected, int tol = 3) {
  EXPECT_LE(std::abs(int(actual.r) - int(expected.r)), tol);
  EXPECT_LE(std::abs(int(actual.g) - int(expected.g)), tol);
  EXPECT_LE(std::abs(int(actual.b) - int(expected.b)), tol);
}

// =============================================================================
// Pure geometry
// =============================================================================

TEST(OverlayLayoutContract, CanvasSizePerAspectRatio) {
  auto portrait = render::CanvasSizeFor(campaign::AspectRatio::kPortrait9x16);
  auto square = render::CanvasSizeFor(campaign::AspectRatio::kSquare1x1);
  EXPECT_EQ(portrait.width, 720);
  EXPECT_EQ(portrait.height, 1280);
  EXPECT_EQ(square.width, 1080);
  EXPECT_EQ(square.height, 1080);
}

TEST(OverlayLayoutContract, CoverRectFillsCanvasAndCenters) {
  // 16:9 clip on a square canvas: height-bound, overflow split left/right
  auto r = render::CoverRect(1280, 720, CanvasSize{1080, 1080});
  EXPECT_DOUBLE_EQ(r.height, 1080.0);
  EXPECT_DOUBLE_EQ(r.width, 1920.0);
  EXPECT_DOUBLE_EQ(r.x, -420.0);
  EXPECT_DOUBLE_EQ(r.y, 0.0);

  // 16:9 clip on a portrait canvas
  auto p = render::CoverRect(1280, 720, CanvasSize{720, 1280});
  EXPECT_DOUBLE_EQ(p.height, 1280.0);
  EXPECT_NEAR(p.width, 2275.56, 0.01);
  EXPECT_NEAR(p.x, -777.78, 0.01);

  // Matching aspect: exact fit
  auto exact = render::CoverRect(360, 640, CanvasSize{720, 1280});
  EXPECT_DOUBLE_EQ(exact.x, 0.0);
  EXPECT_DOUBLE_EQ(exact.width, 720.0);
}

TEST(OverlayLayoutContract, CornerLogoOnSquareCanvas) {
  // 2:1 logo bound by 15 % width (162) before 8 % height (86.4)
  auto r = render::CornerLogoRect(100, 50, CanvasSize{1080, 1080});
  EXPECT_NEAR(r.width, 162.0, kEps);
  EXPECT_NEAR(r.height, 81.0, kEps);
  EXPECT_NEAR(r.x, 898.0, kEps);
  EXPECT_NEAR(r.y, 20.0, kEps);
}

TEST(OverlayLayoutContract, TallLogoIsHeightBound) {
  // 1:2 logo on portrait: 8 % height (102.4) binds before 15 % width (108)
  auto r = render::CornerLogoRect(50, 100, CanvasSize{720, 1280});
  EXPECT_NEAR(r.height, 102.4, kEps);
  EXPECT_NEAR(r.width, 51.2, kEps);
  EXPECT_NEAR(r.x, 720.0 - 51.2 - 20.0, kEps);
}

TEST(OverlayLayoutContract, EndCardLogoIsCenteredAtHalfSize) {
  auto r = render::EndCardLogoRect(100, 50, CanvasSize{1080, 1080});
  EXPECT_NEAR(r.width, 540.0, kEps);
  EXPECT_NEAR(r.height, 270.0, kEps);
  EXPECT_NEAR(r.x, 270.0, kEps);
  EXPECT_NEAR(r.y, 405.0, kEps);
}

TEST(OverlayLayoutContract, VideoWatermarkAndCaptionAnchors) {
  render::FontConfig fonts;
  const CanvasSize canvas{720, 1280};

  auto wm = render::VideoWatermarkSpec("@acme", canvas, fonts);
  EXPECT_NEAR(wm.style.font_size, 19.2, kEps);
  EXPECT_EQ(wm.x, 20);
  EXPECT_EQ(wm.y, 1260);
  EXPECT_EQ(wm.anchor, render::TextAnchor::kBottomLeft);
  EXPECT_EQ(wm.style.fill.a, 128);
  EXPECT_EQ(wm.style.font_pattern, "Sans");

  auto cap = render::CaptionSpec("Glow all night", canvas, fonts);
  EXPECT_NEAR(cap.style.font_size, 51.2, kEps);
  EXPECT_EQ(cap.anchor, render::TextAnchor::kCenter);
  EXPECT_EQ(cap.x, 360);
  EXPECT_EQ(cap.y, 1088);
  EXPECT_EQ(cap.style.fill.a, 255);
  EXPECT_EQ(cap.style.outline.r, 0);
  EXPECT_EQ(cap.style.outline.a, 204);
  EXPECT_EQ(cap.style.outline_width, 6);
  EXPECT_EQ(cap.style.font_pattern, "Sans:style=Bold");
}

TEST(OverlayLayoutContract, ToPixelsCoversFractionalEdges) {
  render::LayoutRect r{10.4, 20.6, 100.2, 50.1};
  auto p = render::ToPixels(r);
  EXPECT_EQ(p.x, 10);
  EXPECT_EQ(p.y, 20);
  EXPECT_EQ(p.width, 101);   // ceil(110.6) - 10
  EXPECT_EQ(p.height, 51);   // ceil(70.7) - 20
}

// =============================================================================
// Renderer output
// =============================================================================

class OverlayRendererContractTest : public ::testing::Test {
 protected:
  campaign::BrandingConfig SquareBrandingWithLogo() {
    campaign::BrandingConfig b;
    b.aspect_ratio = campaign::AspectRatio::kSquare1x1;
    b.logo_image = MakeSolidImage(100, 50, kBlue);
    b.watermark_text = "@acme";
    return b;
  }

  const media::Rgba kRed{220, 30, 30, 255};
  const media::Rgba kBlue{20, 40, 230, 255};
  RecordingTextPainter painter_;
  render::FontConfig fonts_;
};

TEST_F(OverlayRendererContractTest, SceneFrameLayersClipLogoWatermarkCaption) {
  auto branding = SquareBrandingWithLogo();
  render::OverlayRenderer renderer(CanvasSize{1080, 1080}, branding, painter_, fonts_);
  ASSERT_TRUE(renderer.Prepare()) << renderer.LastError();

  media::RgbaImage canvas;
  auto clip = MakeSolidImage(64, 36, kRed);
  ASSERT_TRUE(renderer.ComposeSceneFrame(clip, "Glow all night", canvas));

  EXPECT_EQ(canvas.width, 1080);
  EXPECT_EQ(canvas.height, 1080);
  ExpectColorNear(canvas.PixelAt(540, 540), kRed);
  // Logo occupies (898, 20) .. (1060, 101)
  ExpectColorNear(canvas.PixelAt(898 + 81, 20 + 40), kBlue);
  ExpectColorNear(canvas.PixelAt(880, 60), kRed);

  ASSERT_EQ(painter_.calls().size(), 2u);
  EXPECT_EQ(painter_.calls()[0].text, "@acme");
  EXPECT_EQ(painter_.calls()[1].text, "Glow all night");
}

TEST_F(OverlayRendererContractTest, EmptyCaptionAndWatermarkAreNotPainted) {
  campaign::BrandingConfig plain;
  plain.aspect_ratio = campaign::AspectRatio::kPortrait9x16;
  render::OverlayRenderer renderer(CanvasSize{720, 1280}, plain, painter_, fonts_);
  ASSERT_TRUE(renderer.Prepare());

  media::RgbaImage canvas;
  ASSERT_TRUE(renderer.ComposeSceneFrame(MakeSolidImage(36, 64, kRed), "", canvas));
  EXPECT_TRUE(painter_.calls().empty());
  EXPECT_FALSE(renderer.HasLogo());
}

TEST_F(OverlayRendererContractTest, EndCardIsBlackWithCenteredLogo) {
  auto branding = SquareBrandingWithLogo();
  render::OverlayRenderer renderer(CanvasSize{1080, 1080}, branding, painter_, fonts_);
  ASSERT_TRUE(renderer.Prepare());

  media::RgbaImage canvas;
  ASSERT_TRUE(renderer.ComposeEndCard(canvas));

  ExpectColorNear(canvas.PixelAt(540, 540), kBlue);
  ExpectColorNear(canvas.PixelAt(5, 5), media::Rgba{0, 0, 0, 255});
  ExpectColorNear(canvas.PixelAt(540, 300), media::Rgba{0, 0, 0, 255});
  EXPECT_TRUE(painter_.calls().empty());
}

TEST_F(OverlayRendererContractTest, PainterFailureFailsTheFrame) {
  auto branding = SquareBrandingWithLogo();
  painter_.SetFail(true);
  render::OverlayRenderer renderer(CanvasSize{1080, 1080}, branding, painter_, fonts_);
  ASSERT_TRUE(renderer.Prepare());

  media::RgbaImage canvas;
  EXPECT_FALSE(renderer.ComposeSceneFrame(MakeSolidImage(8, 8, kRed), "", canvas));
  EXPECT_EQ(renderer.LastError(), "watermark: font not found");
}

}  // namespace
}  // namespace adreel::testing
