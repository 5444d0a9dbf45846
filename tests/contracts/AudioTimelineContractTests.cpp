// Repository: AdReel
// Component: Audio Timeline Contract Tests
// Purpose: Voice-overs play back to back from t=0 in scene order; the mix
//          is silent outside the scheduled clips.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

#include <memory>

#include "adreel/render/AudioTimeline.hpp"

namespace adreel::testing {
namespace {

media::AudioBuffer ConstantClip(int64_t frames, float level) {
  media::AudioBuffer buf;
  buf.samples.assign(static_cast<size_t>(frames) * media::kMixChannels, level);
  return buf;
}

// =============================================================================
// Offsets
// =============================================================================

TEST(AudioTimelineContract, OffsetsAreCumulativeFrameCounts) {
  // 2.0 s, 1.5 s and 3.0 s at 48 kHz
  auto offsets = render::ScheduleOffsets({96000, 72000, 144000});
  EXPECT_EQ(offsets, (std::vector<int64_t>{0, 96000, 168000}));
}

TEST(AudioTimelineContract, NoClipsNoOffsets) {
  EXPECT_TRUE(render::ScheduleOffsets(std::vector<int64_t>{}).empty());
}

// =============================================================================
// Schedule
// =============================================================================

class AudioTimelineContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::vector<media::AudioBuffer> clips;
    clips.push_back(ConstantClip(96000, 0.5f));   // 2.0 s
    clips.push_back(ConstantClip(72000, -0.25f)); // 1.5 s
    clips.push_back(ConstantClip(144000, 0.1f));  // 3.0 s
    timeline_ = std::make_unique<render::AudioTimeline>(std::move(clips));
  }

  std::unique_ptr<render::AudioTimeline> timeline_;
};

TEST_F(AudioTimelineContractTest, ClipsAreScheduledBackToBackInSceneOrder) {
  const auto& schedule = timeline_->schedule();
  ASSERT_EQ(schedule.size(), 3u);

  EXPECT_EQ(schedule[0].scene_index, 0u);
  EXPECT_EQ(schedule[0].start_frame, 0);
  EXPECT_EQ(schedule[1].start_frame, 96000);
  EXPECT_EQ(schedule[2].start_frame, 168000);

  EXPECT_DOUBLE_EQ(schedule[1].StartSeconds(), 2.0);
  EXPECT_DOUBLE_EQ(schedule[2].StartSeconds(), 3.5);
  EXPECT_DOUBLE_EQ(schedule[2].DurationSeconds(), 3.0);
  EXPECT_EQ(timeline_->TotalFrames(), 312000);
}

TEST_F(AudioTimelineContractTest, MixAcrossClipBoundaryCarriesBothClips) {
  std::vector<float> out;
  // Two frames before and two frames after the first boundary
  timeline_->Mix(95998, 4, out);

  ASSERT_EQ(out.size(), 8u);
  EXPECT_FLOAT_EQ(out[0], 0.5f);
  EXPECT_FLOAT_EQ(out[3], 0.5f);
  EXPECT_FLOAT_EQ(out[4], -0.25f);
  EXPECT_FLOAT_EQ(out[7], -0.25f);
}

TEST_F(AudioTimelineContractTest, MixPastEndIsSilence) {
  std::vector<float> out;
  timeline_->Mix(311999, 3, out);

  ASSERT_EQ(out.size(), 6u);
  EXPECT_FLOAT_EQ(out[0], 0.1f);
  EXPECT_FLOAT_EQ(out[1], 0.1f);
  for (size_t i = 2; i < out.size(); ++i) {
    EXPECT_FLOAT_EQ(out[i], 0.0f) << "sample " << i;
  }
}

TEST_F(AudioTimelineContractTest, EmptyWindowYieldsNothing) {
  std::vector<float> out{1.0f, 2.0f};
  timeline_->Mix(0, 0, out);
  EXPECT_TRUE(out.empty());
}

TEST(AudioTimelineContract, NoClipsMixesSilence) {
  render::AudioTimeline empty(std::vector<media::AudioBuffer>{});
  EXPECT_EQ(empty.TotalFrames(), 0);

  std::vector<float> out;
  empty.Mix(0, 1600, out);
  ASSERT_EQ(out.size(), 3200u);
  EXPECT_FLOAT_EQ(out.front(), 0.0f);
  EXPECT_FLOAT_EQ(out.back(), 0.0f);
}

}  // namespace
}  // namespace adreel::testing
