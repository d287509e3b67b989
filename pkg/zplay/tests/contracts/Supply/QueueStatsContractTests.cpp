// Repository: Z-Play-supply
// Component: Queue Stats Contract Tests
// Purpose: Per-kind counting and saturation at zero.
// Copyright (c) 2025 Z-Play

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "zplay/supply/QueueStats.hpp"

namespace zplay::tests {
namespace {

using supply::QueueStats;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Supply", {"QS-001", "QS-002"});
  return true;
}();

class QueueStatsContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Supply"; }
  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"QS-001", "QS-002"};
  }
};

// -----------------------------------------------------------------------------
// TEST-QS-001: Items are counted by kind; unknown extensions are not counted
// -----------------------------------------------------------------------------
TEST_F(QueueStatsContractTest, CountsByKind) {
  QueueStats stats;
  stats.Add("/m/a.mp4");
  stats.Add("/m/b.MKV");
  stats.Add("/m/c.jpg");
  stats.Add("/m/d.flac");
  stats.Add("/m/notes.txt");

  const auto s = stats.Get();
  EXPECT_EQ(s.video, 2u);
  EXPECT_EQ(s.image, 1u);
  EXPECT_EQ(s.audio, 1u);
}

// -----------------------------------------------------------------------------
// TEST-QS-002: Remove after Reset saturates at zero
// -----------------------------------------------------------------------------
TEST_F(QueueStatsContractTest, RemoveSaturatesAtZero) {
  QueueStats stats;
  stats.Add("/m/a.mp4");
  stats.Add("/m/b.mp4");
  stats.Reset();
  stats.Remove("/m/a.mp4");
  stats.Remove("/m/b.mp4");
  EXPECT_EQ(stats.Get().video, 0u);

  stats.Add("/m/c.mp4");
  EXPECT_EQ(stats.Get().video, 1u);
}

}  // namespace
}  // namespace zplay::tests
