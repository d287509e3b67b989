// Repository: Z-Play-supply
// Component: Dedup Cache
// Purpose: Bounded, approximate "currently outstanding" guard for candidates.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SCAN_DEDUP_CACHE_HPP_
#define ZPLAY_SCAN_DEDUP_CACHE_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace zplay::scan {

// DedupCache tracks which sampled paths are currently somewhere in the supply
// chain. Membership is not history: an entry is dropped when its item is
// released, toggled a second time, or pushed out of the FIFO horizon.
//
// Eviction is unconditional. Once K newer paths have been admitted, the
// oldest is forgotten even if its engine is still queued, so duplicates can
// slip through under heavy churn. Memory stays bounded by K.
class DedupCache {
 public:
  static constexpr size_t kDefaultCapacity = 1000;

  explicit DedupCache(size_t capacity = kDefaultCapacity);

  DedupCache(const DedupCache&) = delete;
  DedupCache& operator=(const DedupCache&) = delete;

  // Present: remove and return false (drop the duplicate sample).
  // Absent: insert and return true (admit).
  bool Toggle(const std::filesystem::path& path);

  // Marks `path` as no longer outstanding. Never inserts.
  // Returns true if an entry was removed.
  bool Release(const std::filesystem::path& path);

  bool Contains(const std::filesystem::path& path) const;
  size_t Size() const;
  size_t Capacity() const { return capacity_; }
  void Clear();

 private:
  void EvictLocked();

  const size_t capacity_;
  mutable std::mutex mutex_;
  // path -> admission sequence. FIFO entries whose sequence no longer matches
  // were released or re-admitted and are skipped on eviction.
  std::unordered_map<std::string, uint64_t> members_;
  std::deque<std::pair<std::string, uint64_t>> fifo_;
  uint64_t next_seq_ = 0;
};

}  // namespace zplay::scan

#endif  // ZPLAY_SCAN_DEDUP_CACHE_HPP_
