// Repository: Z-Play-supply
// Component: Random File Sampler Contract Tests
// Purpose: Uniformity over nested trees, Combine grouping, edge cases.
// Copyright (c) 2025 Z-Play

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures/ScopedTempTree.hpp"
#include "zplay/scan/MediaKind.hpp"
#include "zplay/scan/RandomFileSampler.hpp"

namespace zplay::tests {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using fixtures::ScopedTempTree;
using scan::Combine;
using scan::RandomFileSampler;
using scan::SamplerConfig;
using scan::ScanResult;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "Scan", {"RS-001", "RS-002", "RS-003", "RS-004", "RS-005", "RS-006", "RS-007",
               "RS-008"});
  return true;
}();

class RandomFileSamplerContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Scan"; }
  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"RS-001", "RS-002", "RS-003", "RS-004", "RS-005", "RS-006", "RS-007", "RS-008"};
  }

  static SamplerConfig TwoWalkers() {
    SamplerConfig config;
    config.walkers_per_root = 2;
    return config;
  }
};

// -----------------------------------------------------------------------------
// TEST-RS-001: Selection is uniform over every leaf of a nested tree
// Chi-square with 9 degrees of freedom; 27.88 is the p = 0.001 critical value.
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, UniformOverNestedTree) {
  ScopedTempTree tree;
  std::vector<fs::path> leaves;
  leaves.push_back(tree.AddFile("top.mp4"));
  for (const auto& p : tree.AddFiles("a", 2)) leaves.push_back(p);
  for (const auto& p : tree.AddFiles("a/b", 3)) leaves.push_back(p);
  for (const auto& p : tree.AddFiles("c/d/e", 4)) leaves.push_back(p);
  tree.AddDir("empty/deeper");
  ASSERT_EQ(leaves.size(), 10u);

  RandomFileSampler sampler(TwoWalkers());
  constexpr int kSamples = 2000;
  std::map<std::string, int> hits;
  for (int i = 0; i < kSamples; ++i) {
    auto picked = sampler.Sample({tree.Root()}, 2000ms, 500ms);
    ASSERT_TRUE(picked.has_value());
    ++hits[picked->string()];
  }

  ASSERT_EQ(hits.size(), leaves.size());
  const double expected = static_cast<double>(kSamples) / static_cast<double>(leaves.size());
  double chi2 = 0.0;
  for (const auto& leaf : leaves) {
    const double observed = hits[leaf.string()];
    chi2 += (observed - expected) * (observed - expected) / expected;
  }
  EXPECT_LT(chi2, 27.88);
}

// -----------------------------------------------------------------------------
// TEST-RS-002: Combine keeps a's candidate with probability ca / (ca + cb)
// Different groupings of the same partial results give the same distribution.
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, CombineGroupingPreservesDistribution) {
  const ScanResult a{fs::path("a"), 1};
  const ScanResult b{fs::path("b"), 2};
  const ScanResult c{fs::path("c"), 3};

  std::mt19937_64 rng(12345);
  constexpr int kTrials = 30000;
  std::map<std::string, int> left, right, swapped;
  for (int i = 0; i < kTrials; ++i) {
    const auto l = Combine(Combine(a, b, rng), c, rng);
    const auto r = Combine(a, Combine(b, c, rng), rng);
    const auto s = Combine(Combine(c, a, rng), b, rng);
    ASSERT_EQ(l.count, 6u);
    ASSERT_EQ(r.count, 6u);
    ASSERT_EQ(s.count, 6u);
    ++left[l.selected->string()];
    ++right[r.selected->string()];
    ++swapped[s.selected->string()];
  }

  const std::map<std::string, double> expected{{"a", 1.0 / 6}, {"b", 2.0 / 6}, {"c", 3.0 / 6}};
  for (const auto& [name, p] : expected) {
    EXPECT_NEAR(left[name] / static_cast<double>(kTrials), p, 0.02) << name;
    EXPECT_NEAR(right[name] / static_cast<double>(kTrials), p, 0.02) << name;
    EXPECT_NEAR(swapped[name] / static_cast<double>(kTrials), p, 0.02) << name;
  }
}

// -----------------------------------------------------------------------------
// TEST-RS-003: Combine identities and saturation
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, CombineIdentitiesAndSaturation) {
  std::mt19937_64 rng(7);
  const ScanResult empty{};
  const ScanResult one{fs::path("x"), 5};

  const auto both_empty = Combine(empty, empty, rng);
  EXPECT_FALSE(both_empty.selected.has_value());
  EXPECT_EQ(both_empty.count, 0u);

  EXPECT_EQ(Combine(empty, one, rng).selected, fs::path("x"));
  EXPECT_EQ(Combine(one, empty, rng).count, 5u);

  const uint64_t max = std::numeric_limits<uint64_t>::max();
  const ScanResult huge{fs::path("h"), max - 1};
  const auto saturated = Combine(huge, one, rng);
  EXPECT_EQ(saturated.count, max);
  EXPECT_TRUE(saturated.selected.has_value());
}

// -----------------------------------------------------------------------------
// TEST-RS-004: Empty roots, empty directories and missing roots yield nothing
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, NothingToFindIsNotAnError) {
  ScopedTempTree tree;
  const auto empty_dir = tree.AddDir("empty/nested");
  RandomFileSampler sampler(TwoWalkers());

  EXPECT_FALSE(sampler.Sample({}, 200ms, 100ms).has_value());
  EXPECT_FALSE(sampler.Sample({empty_dir}, 200ms, 100ms).has_value());
  EXPECT_FALSE(sampler.Sample({tree.Root() / "does-not-exist"}, 200ms, 100ms).has_value());
}

// -----------------------------------------------------------------------------
// TEST-RS-005: A non-directory root is a single leaf; bad roots are skipped
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, FileRootIsOneLeaf) {
  ScopedTempTree tree;
  const auto file = tree.AddFile("single.mkv");
  RandomFileSampler sampler(TwoWalkers());

  for (int i = 0; i < 20; ++i) {
    auto picked = sampler.Sample({tree.Root() / "missing", file}, 500ms, 200ms);
    ASSERT_TRUE(picked.has_value());
    EXPECT_EQ(*picked, file);
  }
}

// -----------------------------------------------------------------------------
// TEST-RS-006: Directory symlinks are not followed
// The link itself is a leaf; nothing beneath it is ever selected.
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, DirectorySymlinksAreNotFollowed) {
  ScopedTempTree outside;
  outside.AddFiles("target", 5);

  ScopedTempTree tree;
  const auto real = tree.AddFile("real/clip.mp4");
  std::error_code ec;
  fs::create_directory_symlink(outside.Root() / "target", tree.Root() / "link", ec);
  if (ec) {
    GTEST_SKIP() << "symlinks unavailable: " << ec.message();
  }

  RandomFileSampler sampler(TwoWalkers());
  for (int i = 0; i < 200; ++i) {
    auto picked = sampler.Sample({tree.Root()}, 500ms, 200ms);
    ASSERT_TRUE(picked.has_value());
    EXPECT_TRUE(*picked == real || *picked == tree.Root() / "link") << picked->string();
  }
}

// -----------------------------------------------------------------------------
// TEST-RS-007: A raised abort flag cuts the scan short
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, AbortFlagStopsScan) {
  ScopedTempTree tree;
  tree.AddFiles("many", 50);
  RandomFileSampler sampler(TwoWalkers());

  std::atomic<bool> abort{true};
  const auto start = std::chrono::steady_clock::now();
  auto picked = sampler.Sample({tree.Root()}, 10000ms, 5000ms, &abort);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(picked.has_value());
  EXPECT_LT(elapsed, 1000ms);

  abort = false;
  EXPECT_TRUE(sampler.Sample({tree.Root()}, 2000ms, 500ms, &abort).has_value());
}

// -----------------------------------------------------------------------------
// TEST-RS-008: The scan deadline bounds traversal of a large tree
// A spent deadline yields nothing; a short one yields nothing or a leaf found
// before it passed.
// -----------------------------------------------------------------------------
TEST_F(RandomFileSamplerContractTest, ScanDeadlineBoundsTraversal) {
  ScopedTempTree tree;
  for (int d = 0; d < 100; ++d) {
    tree.AddFiles("dir" + std::to_string(d), 30);
  }
  RandomFileSampler sampler(TwoWalkers());

  EXPECT_FALSE(sampler.Sample({tree.Root()}, 0ms, 0ms).has_value());

  for (int i = 0; i < 5; ++i) {
    const auto start = std::chrono::steady_clock::now();
    const auto picked = sampler.Sample({tree.Root()}, 5ms, 5ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, 1000ms);
    if (picked) {
      EXPECT_TRUE(scan::PathIsUnder(*picked, tree.Root())) << *picked;
    }
  }

  EXPECT_TRUE(sampler.Sample({tree.Root()}, 10000ms, 2000ms).has_value());
}

}  // namespace
}  // namespace zplay::tests
