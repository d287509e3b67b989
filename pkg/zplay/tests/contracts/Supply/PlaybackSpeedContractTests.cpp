// Repository: Z-Play-supply
// Component: Playback Speed Contract Tests
// Purpose: Names, rates and parsing of the discrete speed set.
// Copyright (c) 2025 Z-Play

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "zplay/supply/PlaybackSpeed.hpp"

namespace zplay::tests {
namespace {

using supply::PlaybackSpeed;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Supply", {"PS-001"});
  return true;
}();

class PlaybackSpeedContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Supply"; }
  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override { return {"PS-001"}; }
};

// -----------------------------------------------------------------------------
// TEST-PS-001: Every speed parses from its own name; anything else is rejected
// -----------------------------------------------------------------------------
TEST_F(PlaybackSpeedContractTest, NamesRatesAndParsing) {
  double last_rate = 0.0;
  for (PlaybackSpeed speed : supply::kAllPlaybackSpeeds) {
    const auto parsed = supply::ParsePlaybackSpeed(supply::PlaybackSpeedName(speed));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, speed);
    EXPECT_GT(supply::PlaybackSpeedRate(speed), last_rate);
    last_rate = supply::PlaybackSpeedRate(speed);
  }
  EXPECT_DOUBLE_EQ(supply::PlaybackSpeedRate(PlaybackSpeed::kX0_5), 0.5);
  EXPECT_DOUBLE_EQ(supply::PlaybackSpeedRate(PlaybackSpeed::kX32), 32.0);

  EXPECT_FALSE(supply::ParsePlaybackSpeed("x3").has_value());
  EXPECT_FALSE(supply::ParsePlaybackSpeed("X2").has_value());
  EXPECT_FALSE(supply::ParsePlaybackSpeed("").has_value());
}

}  // namespace
}  // namespace zplay::tests
