// Repository: Z-Play-supply
// Component: Random File Sampler
// Purpose: Uniform random leaf-file selection over directory trees within a
//          time budget.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SCAN_RANDOM_FILE_SAMPLER_HPP_
#define ZPLAY_SCAN_RANDOM_FILE_SAMPLER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <vector>

namespace zplay::scan {

// ScanResult is one uniformly chosen candidate among `count` leaves seen so far.
struct ScanResult {
  std::optional<std::filesystem::path> selected;
  uint64_t count = 0;
};

// Combines two partial results so that `selected` stays uniform over the union:
// a's candidate survives with probability ca / (ca + cb). Either side with
// count 0 yields the other unchanged. The count saturates at UINT64_MAX.
ScanResult Combine(ScanResult a, ScanResult b);
ScanResult Combine(ScanResult a, ScanResult b, std::mt19937_64& rng);

struct SamplerConfig {
  // Traversal threads per directory root. 0 = derive from hardware_concurrency.
  int walkers_per_root = 0;
};

// RandomFileSampler walks every root in parallel and returns one leaf file
// chosen uniformly over all leaves reached before the scan deadline.
//
// - A root that is not a directory counts as a single leaf.
// - Unreadable roots and entries are skipped.
// - Directory symlinks are not followed.
// - Once scan_timeout elapses no further leaves are admitted; partial results
//   gathered so far are still combined.
// - busy_timeout bounds how long a traversal thread idles waiting for more
//   directories before exiting.
//
// nullopt means nothing was found in time. It is not an error.
class RandomFileSampler {
 public:
  explicit RandomFileSampler(SamplerConfig config = SamplerConfig{});

  // `abort`, when given, is polled alongside the deadline so an owner can
  // cut a long scan short (pipeline shutdown).
  std::optional<std::filesystem::path> Sample(
      const std::vector<std::filesystem::path>& roots,
      std::chrono::milliseconds scan_timeout,
      std::chrono::milliseconds busy_timeout,
      const std::atomic<bool>* abort = nullptr) const;

  // scan_timeout 2s, busy_timeout 1s.
  std::optional<std::filesystem::path> Sample(
      const std::vector<std::filesystem::path>& roots) const;

 private:
  using Clock = std::chrono::steady_clock;

  struct ScanControl {
    Clock::time_point deadline;
    std::chrono::milliseconds busy_timeout;
    std::atomic<bool> cancel{false};
    const std::atomic<bool>* abort = nullptr;

    // Raises `cancel` once the deadline passes or the owner aborts.
    bool Expired();
  };

  ScanResult ScanRoot(const std::filesystem::path& root, ScanControl& control) const;

  int WalkerCount() const;

  SamplerConfig config_;
};

}  // namespace zplay::scan

#endif  // ZPLAY_SCAN_RANDOM_FILE_SAMPLER_HPP_
