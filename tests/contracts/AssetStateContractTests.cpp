// Repository: AdReel
// Component: Asset State Contract Tests
// Purpose: Transition table, idempotent completion, video gating and the
//          readiness predicates over a campaign asset set.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "adreel/campaign/AssetState.hpp"
#include "adreel/campaign/SceneAsset.hpp"
#include "adreel/util/Logger.hpp"
#include "harness/FakeMedia.hpp"

namespace adreel::testing {
namespace {

using campaign::AssetKind;
using campaign::AssetState;
using campaign::AssetStatus;
using campaign::BeginResult;
using campaign::CampaignAssetSet;
using campaign::SceneAsset;

// =============================================================================
// Test Fixture
// =============================================================================

class AssetStateContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    errors_.clear();
    util::Logger::SetSink([this](util::LogLevel level, const std::string& line) {
      if (level == util::LogLevel::kError) errors_.push_back(line);
    });
  }

  void TearDown() override { util::Logger::SetSink(nullptr); }

  bool HasError(const std::string& substr) const {
    for (const auto& e : errors_) {
      if (e.find(substr) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<std::string> errors_;
};

// =============================================================================
// Transition table
// =============================================================================

TEST_F(AssetStateContractTest, LegalTransitionTableIsExact) {
  const AssetStatus all[] = {AssetStatus::kReady, AssetStatus::kGenerating,
                             AssetStatus::kComplete, AssetStatus::kFailed};
  int legal = 0;
  for (AssetStatus from : all) {
    for (AssetStatus to : all) {
      if (campaign::IsLegalTransition(from, to)) ++legal;
    }
  }
  EXPECT_EQ(legal, 4);
  EXPECT_TRUE(campaign::IsLegalTransition(AssetStatus::kReady, AssetStatus::kGenerating));
  EXPECT_TRUE(campaign::IsLegalTransition(AssetStatus::kGenerating, AssetStatus::kComplete));
  EXPECT_TRUE(campaign::IsLegalTransition(AssetStatus::kGenerating, AssetStatus::kFailed));
  EXPECT_TRUE(campaign::IsLegalTransition(AssetStatus::kFailed, AssetStatus::kGenerating));
}

TEST_F(AssetStateContractTest, IllegalTransitionIsRejectedLoggedAndCounted) {
  // GIVEN: A fresh image state
  AssetState state(AssetKind::kImage);

  // WHEN: Jumping straight to complete
  bool moved = state.TransitionTo(AssetStatus::kComplete);

  // THEN: Rejected, status unchanged, counted and logged
  EXPECT_FALSE(moved);
  EXPECT_EQ(state.status(), AssetStatus::kReady);
  EXPECT_EQ(state.illegal_transition_count(), 1u);
  EXPECT_TRUE(HasError("ILLEGAL_TRANSITION kind=image from=ready to=complete"));
}

TEST_F(AssetStateContractTest, FailureMessageRecordedAndClearedOnRetry) {
  AssetState state(AssetKind::kVoiceover);
  ASSERT_TRUE(state.TransitionTo(AssetStatus::kGenerating));
  ASSERT_TRUE(state.TransitionTo(AssetStatus::kFailed, "TTS provider error: Unauthorized - bad key"));
  EXPECT_EQ(state.error(), "TTS provider error: Unauthorized - bad key");

  // Retry goes back through generating and drops the stale message
  ASSERT_TRUE(state.TransitionTo(AssetStatus::kGenerating));
  EXPECT_TRUE(state.error().empty());
  ASSERT_TRUE(state.TransitionTo(AssetStatus::kComplete));
  EXPECT_EQ(state.illegal_transition_count(), 0u);
}

// =============================================================================
// SceneAsset
// =============================================================================

TEST_F(AssetStateContractTest, CompleteAssetIsNeverRestarted) {
  SceneAsset asset;
  ASSERT_EQ(asset.Begin(AssetKind::kVoiceover), BeginResult::kStarted);
  ASSERT_TRUE(asset.CompleteVoiceover(MakeVoiceBlob(100)));

  EXPECT_EQ(asset.Begin(AssetKind::kVoiceover), BeginResult::kAlreadyComplete);
  EXPECT_EQ(asset.status(AssetKind::kVoiceover), AssetStatus::kComplete);
  EXPECT_NE(asset.audio_url(), nullptr);
  EXPECT_EQ(asset.illegal_transition_count(), 0u);
}

TEST_F(AssetStateContractTest, VideoCannotLeaveReadyUntilImageComplete) {
  SceneAsset asset;

  // GIVEN: Image still ready
  EXPECT_EQ(asset.Begin(AssetKind::kVideo), BeginResult::kPrerequisiteMissing);
  EXPECT_EQ(asset.status(AssetKind::kVideo), AssetStatus::kReady);

  // GIVEN: Image generating
  ASSERT_EQ(asset.Begin(AssetKind::kImage), BeginResult::kStarted);
  EXPECT_EQ(asset.Begin(AssetKind::kVideo), BeginResult::kPrerequisiteMissing);

  // GIVEN: Image failed
  ASSERT_TRUE(asset.Fail(AssetKind::kImage, "blocked"));
  EXPECT_EQ(asset.Begin(AssetKind::kVideo), BeginResult::kPrerequisiteMissing);
  EXPECT_EQ(asset.status(AssetKind::kVideo), AssetStatus::kReady);

  // GIVEN: Image complete
  ASSERT_EQ(asset.Begin(AssetKind::kImage), BeginResult::kStarted);
  auto still = MakeBlob("image/png", "raw");
  ASSERT_TRUE(asset.CompleteImage(still, still));
  EXPECT_EQ(asset.Begin(AssetKind::kVideo), BeginResult::kStarted);
  EXPECT_EQ(asset.status(AssetKind::kVideo), AssetStatus::kGenerating);
}

TEST_F(AssetStateContractTest, FailureClearsPayloadForThatKindOnly) {
  SceneAsset asset;
  ASSERT_EQ(asset.Begin(AssetKind::kImage), BeginResult::kStarted);
  auto raw = MakeBlob("image/png", "raw");
  auto stamped = MakeBlob("image/png", "stamped");
  ASSERT_TRUE(asset.CompleteImage(raw, stamped));
  EXPECT_EQ(asset.image_bytes(), raw);
  EXPECT_EQ(asset.image_url(), stamped);

  ASSERT_EQ(asset.Begin(AssetKind::kVideo), BeginResult::kStarted);
  ASSERT_TRUE(asset.Fail(AssetKind::kVideo, "Video generation failed: boom"));

  EXPECT_EQ(asset.video_url(), nullptr);
  EXPECT_EQ(asset.error(AssetKind::kVideo), "Video generation failed: boom");
  EXPECT_EQ(asset.image_bytes(), raw);
  EXPECT_EQ(asset.status(AssetKind::kImage), AssetStatus::kComplete);
}

TEST_F(AssetStateContractTest, BeginWhileGeneratingIsIllegal) {
  SceneAsset asset;
  ASSERT_EQ(asset.Begin(AssetKind::kImage), BeginResult::kStarted);
  EXPECT_EQ(asset.Begin(AssetKind::kImage), BeginResult::kIllegal);
  EXPECT_EQ(asset.illegal_transition_count(), 1u);
}

TEST_F(AssetStateContractTest, CompletionWithoutPayloadIsRefused) {
  SceneAsset asset;
  ASSERT_EQ(asset.Begin(AssetKind::kVoiceover), BeginResult::kStarted);
  EXPECT_FALSE(asset.CompleteVoiceover(nullptr));
  EXPECT_EQ(asset.status(AssetKind::kVoiceover), AssetStatus::kGenerating);
}

// =============================================================================
// Readiness predicates
// =============================================================================

TEST_F(AssetStateContractTest, EmptyAssetSetIsNeverReady) {
  CampaignAssetSet empty;
  EXPECT_FALSE(empty.AllImagesComplete());
  EXPECT_FALSE(empty.ReadyForExport());
}

TEST_F(AssetStateContractTest, ReadyForExportNeedsVideoAndVoiceoverEverywhere) {
  auto c = MakeReadyCampaign({ClipSpec{}, ClipSpec{}}, {4800, 4800});
  EXPECT_TRUE(c.assets.AllImagesComplete());
  EXPECT_TRUE(c.assets.AllVoiceoversComplete());
  EXPECT_TRUE(c.assets.AllVideosComplete());
  EXPECT_TRUE(c.assets.ReadyForExport());
  EXPECT_TRUE(c.IsAligned());

  // One scene whose voice-over never completed
  campaign::Campaign partial(c.brief, MakeScenes(2), {}, "voice");
  CompleteScene(partial, 0, MakeClipBlob(ClipSpec{}), MakeVoiceBlob(10));
  SceneAsset* second = partial.assets.Get(1);
  second->Begin(AssetKind::kImage);
  auto still = MakeBlob("image/png", "s");
  second->CompleteImage(still, still);
  second->Begin(AssetKind::kVideo);
  second->CompleteVideo(MakeClipBlob(ClipSpec{}));

  EXPECT_TRUE(partial.assets.AllVideosComplete());
  EXPECT_FALSE(partial.assets.AllVoiceoversComplete());
  EXPECT_FALSE(partial.assets.ReadyForExport());
  EXPECT_EQ(partial.assets.CountWithStatus(AssetKind::kVoiceover, AssetStatus::kReady), 1u);
}

TEST_F(AssetStateContractTest, OutOfRangeIndexYieldsNull) {
  CampaignAssetSet set(3);
  EXPECT_NE(set.Get(2), nullptr);
  EXPECT_EQ(set.Get(3), nullptr);
}

}  // namespace
}  // namespace adreel::testing
