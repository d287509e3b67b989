// Repository: Z-Play-supply
// Component: Queue Stats
// Purpose: Outstanding Ready-queue items per media kind.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SUPPLY_QUEUE_STATS_HPP_
#define ZPLAY_SUPPLY_QUEUE_STATS_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>

namespace zplay::supply {

// QueueStats counts queued items by the kind their extension classifies as.
// Files without a known kind are not counted. Counters never go below zero,
// so a Remove() after Reset() is harmless.
class QueueStats {
 public:
  struct Snapshot {
    uint64_t video = 0;
    uint64_t image = 0;
    uint64_t audio = 0;
  };

  void Add(const std::filesystem::path& path);
  void Remove(const std::filesystem::path& path);
  void Reset();
  Snapshot Get() const;

 private:
  std::atomic<uint64_t>* CounterFor(const std::filesystem::path& path);

  std::atomic<uint64_t> video_{0};
  std::atomic<uint64_t> image_{0};
  std::atomic<uint64_t> audio_{0};
};

}  // namespace zplay::supply

#endif  // ZPLAY_SUPPLY_QUEUE_STATS_HPP_
