// Repository: AdReel
// Component: Logger Contract Tests
// Purpose: Level routing, debug gating, campaign tagging and the sink hook.
// Copyright (c) 2026 AdReel

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "adreel/util/Logger.hpp"

namespace adreel::testing {
namespace {

using util::LogLevel;
using util::Logger;

class LoggerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetCampaignTag("");
    Logger::SetSink([this](LogLevel level, const std::string& line) {
      lines_.emplace_back(level, line);
    });
  }

  void TearDown() override {
    Logger::SetSink(nullptr);
    Logger::SetCampaignTag("");
    unsetenv("ADREEL_DEBUG");
  }

  std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerContractTest, EveryLevelReachesTheSink) {
  Logger::Info("[Test] info");
  Logger::Warn("[Test] warn");
  Logger::Error("[Test] error");

  ASSERT_EQ(lines_.size(), 3u);
  EXPECT_EQ(lines_[0], std::make_pair(LogLevel::kInfo, std::string("[Test] info")));
  EXPECT_EQ(lines_[1].first, LogLevel::kWarn);
  EXPECT_EQ(lines_[2].first, LogLevel::kError);
}

TEST_F(LoggerContractTest, DebugNeedsEnvironmentSwitch) {
  unsetenv("ADREEL_DEBUG");
  Logger::Debug("[Test] hidden");
  EXPECT_TRUE(lines_.empty());

  setenv("ADREEL_DEBUG", "1", 1);
  Logger::Debug("[Test] shown");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].first, LogLevel::kDebug);
}

TEST_F(LoggerContractTest, CampaignTagPrefixesLinesUntilCleared) {
  // GIVEN: An active campaign
  Logger::SetCampaignTag("glowup_serum");
  EXPECT_EQ(Logger::CampaignTag(), "glowup_serum");

  // WHEN
  Logger::Warn("[ScenePipeline] scene=1 kind=image status=failed");
  Logger::SetCampaignTag("");
  Logger::Info("[adreel] done");

  // THEN
  ASSERT_EQ(lines_.size(), 2u);
  EXPECT_EQ(lines_[0].second,
            "[campaign=glowup_serum] [ScenePipeline] scene=1 kind=image status=failed");
  EXPECT_EQ(lines_[1].second, "[adreel] done");
}

TEST_F(LoggerContractTest, LevelNames) {
  EXPECT_STREQ(util::LogLevelToString(LogLevel::kDebug), "DEBUG");
  EXPECT_STREQ(util::LogLevelToString(LogLevel::kError), "ERROR");
}

}  // namespace
}  // namespace adreel::testing
