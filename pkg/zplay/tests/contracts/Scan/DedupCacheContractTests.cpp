// Repository: Z-Play-supply
// Component: Dedup Cache Contract Tests
// Purpose: Toggle semantics, explicit release and the bounded FIFO horizon.
// Copyright (c) 2025 Z-Play

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "zplay/scan/DedupCache.hpp"

namespace zplay::tests {
namespace {

using scan::DedupCache;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Scan", {"DC-001", "DC-002", "DC-003", "DC-004", "DC-005"});
  return true;
}();

class DedupCacheContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Scan"; }
  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"DC-001", "DC-002", "DC-003", "DC-004", "DC-005"};
  }

  static std::string PathFor(int i) { return "/media/item" + std::to_string(i) + ".mp4"; }
};

// -----------------------------------------------------------------------------
// TEST-DC-001: Toggle admits, rejects the duplicate, then admits again
// A rejected duplicate also clears membership (insert/remove/insert cycle)
// -----------------------------------------------------------------------------
TEST_F(DedupCacheContractTest, ToggleCycle) {
  DedupCache cache(8);
  EXPECT_TRUE(cache.Toggle("/media/a.mp4"));
  EXPECT_TRUE(cache.Contains("/media/a.mp4"));
  EXPECT_FALSE(cache.Toggle("/media/a.mp4"));
  EXPECT_FALSE(cache.Contains("/media/a.mp4"));
  EXPECT_TRUE(cache.Toggle("/media/a.mp4"));
  EXPECT_EQ(cache.Size(), 1u);
}

// -----------------------------------------------------------------------------
// TEST-DC-002: The (K+1)th admission evicts the oldest entry, not before
// -----------------------------------------------------------------------------
TEST_F(DedupCacheContractTest, EvictsExactlyAtCapacity) {
  constexpr int kCapacity = 16;
  DedupCache cache(kCapacity);
  for (int i = 0; i < kCapacity; ++i) {
    ASSERT_TRUE(cache.Toggle(PathFor(i)));
  }
  EXPECT_EQ(cache.Size(), static_cast<size_t>(kCapacity));
  for (int i = 0; i < kCapacity; ++i) {
    EXPECT_TRUE(cache.Contains(PathFor(i))) << i;
  }

  ASSERT_TRUE(cache.Toggle(PathFor(kCapacity)));
  EXPECT_EQ(cache.Size(), static_cast<size_t>(kCapacity));
  EXPECT_FALSE(cache.Contains(PathFor(0)));
  EXPECT_TRUE(cache.Contains(PathFor(1)));
  EXPECT_TRUE(cache.Contains(PathFor(kCapacity)));

  // The evicted path is admitted again rather than treated as a duplicate.
  EXPECT_TRUE(cache.Toggle(PathFor(0)));
}

// -----------------------------------------------------------------------------
// TEST-DC-003: Release removes without inserting
// -----------------------------------------------------------------------------
TEST_F(DedupCacheContractTest, ReleaseNeverInserts) {
  DedupCache cache(4);
  EXPECT_FALSE(cache.Release("/media/never.mp4"));
  EXPECT_EQ(cache.Size(), 0u);

  ASSERT_TRUE(cache.Toggle("/media/a.mp4"));
  EXPECT_TRUE(cache.Release("/media/a.mp4"));
  EXPECT_FALSE(cache.Contains("/media/a.mp4"));
  EXPECT_TRUE(cache.Toggle("/media/a.mp4"));
}

// -----------------------------------------------------------------------------
// TEST-DC-004: A re-admitted path is aged from its latest admission
// Stale FIFO records of released entries must not evict the fresh entry
// -----------------------------------------------------------------------------
TEST_F(DedupCacheContractTest, ReadmissionIsAgedFromLatestInsert) {
  DedupCache cache(3);
  ASSERT_TRUE(cache.Toggle("/a"));
  ASSERT_TRUE(cache.Release("/a"));
  ASSERT_TRUE(cache.Toggle("/b"));
  ASSERT_TRUE(cache.Toggle("/a"));
  // FIFO: /a(stale) /b /a. The next insert drops the stale record only.
  ASSERT_TRUE(cache.Toggle("/c"));
  EXPECT_TRUE(cache.Contains("/a"));
  EXPECT_TRUE(cache.Contains("/b"));
  EXPECT_TRUE(cache.Contains("/c"));
  EXPECT_LE(cache.Size(), cache.Capacity());
}

// -----------------------------------------------------------------------------
// TEST-DC-005: Concurrent toggles never exceed capacity
// -----------------------------------------------------------------------------
TEST_F(DedupCacheContractTest, ConcurrentTogglesStayBounded) {
  constexpr size_t kCapacity = 64;
  DedupCache cache(kCapacity);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 2000; ++i) {
        cache.Toggle(PathFor((i * 7 + t) % 300));
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_LE(cache.Size(), kCapacity);

  cache.Clear();
  EXPECT_EQ(cache.Size(), 0u);
}

}  // namespace
}  // namespace zplay::tests
