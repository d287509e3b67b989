// Repository: Z-Play-supply
// Component: Acquisition Pipeline
// Purpose: Discover -> Preroll -> Ready stage threads feeding the playback front.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SUPPLY_ACQUISITION_PIPELINE_HPP_
#define ZPLAY_SUPPLY_ACQUISITION_PIPELINE_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

#include "zplay/engine/EngineHandle.hpp"
#include "zplay/engine/WorkerPool.hpp"
#include "zplay/scan/DedupCache.hpp"
#include "zplay/scan/MediaKind.hpp"
#include "zplay/scan/RandomFileSampler.hpp"
#include "zplay/supply/QueueStats.hpp"
#include "zplay/supply/ReadyQueue.hpp"
#include "zplay/supply/RootSet.hpp"
#include "zplay/util/Channel.hpp"

namespace zplay::supply {

using EngineReadyQueue = ReadyQueue<engine::EngineHandle>;

struct PipelineConfig {
  size_t ready_capacity = 20;
  size_t preroll_capacity = 10;
  size_t discover_channel_capacity = 10;

  std::chrono::milliseconds event_poll_timeout{100};
  std::chrono::milliseconds refill_timeout{100};
  std::chrono::milliseconds no_roots_backoff{1000};
  std::chrono::milliseconds miss_backoff_step{1000};

  scan::SamplerConfig sampler;
};

// Monotonic counters for the status surface.
struct PipelineCounters {
  uint64_t sampled = 0;      // hits returned by the sampler
  uint64_t scan_misses = 0;  // sampler returned nothing
  uint64_t duplicates = 0;   // rejected by the dedup cache or already in flight
  uint64_t admitted = 0;     // sent to Preroll
  uint64_t queued = 0;       // pushed onto Ready
  uint64_t discarded = 0;    // engine error or failed construction
  uint64_t evicted = 0;      // dropped because its root was disabled
  uint64_t taken = 0;        // withdrawn by the consumer
  uint64_t cleared = 0;      // dropped from Ready by ClearReady()
};

// Restricts TakeMatching() to Ready entries of the listed kinds under the
// listed roots. An empty list matches everything; a path whose kind cannot be
// told from its extension passes the kind list.
struct TakeFilter {
  std::vector<scan::MediaKind> kinds;
  std::vector<std::filesystem::path> roots;
};

// Paths held by the Preroll working set and the Ready queue, captured
// together so that a path moving between the two is seen exactly once.
struct SupplySnapshot {
  std::vector<std::filesystem::path> preroll;
  std::vector<std::filesystem::path> ready;
};

// AcquisitionPipeline runs three stage threads:
//
//   Discover  samples the enabled roots, filters through the dedup cache and
//             sends admits on a bounded channel (blocking when full).
//   Preroll   keeps a bounded working set of engines being driven to Paused.
//             Prerolled engines move to Ready when there is room and are held
//             otherwise; errors discard the engine.
//   Ready     applies root-set mutations to the Ready queue.
//
// Scan aggressiveness follows the Ready backlog:
//   timeout_ms = 100 + 9900 * ready_len / ready_capacity
// with scan_timeout = 2 * timeout and busy_timeout = timeout.
//
// Dedup: every admitted path stays "outstanding" until it is discarded,
// evicted, or released by the consumer via Release(). A path is never held
// twice across Preroll and Ready; a second admit of it is dropped.
class AcquisitionPipeline {
 public:
  AcquisitionPipeline(PipelineConfig config,
                      std::shared_ptr<engine::WorkerPool> pool,
                      std::shared_ptr<RootSet> roots,
                      std::shared_ptr<scan::DedupCache> dedup);
  ~AcquisitionPipeline();

  AcquisitionPipeline(const AcquisitionPipeline&) = delete;
  AcquisitionPipeline& operator=(const AcquisitionPipeline&) = delete;

  // Launches the stage threads. Returns false if already started.
  bool Start();

  // Disconnects the stage channels, joins the threads and releases every
  // engine still held in the working set or the Ready queue.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Withdraws the oldest Ready engine. The caller should request Playing
  // right away and call Release() once it is done with the engine.
  std::optional<engine::EngineHandle> Take();
  std::optional<engine::EngineHandle> TakeFor(std::chrono::milliseconds timeout);

  // Withdraws the oldest Ready engine accepted by `filter`, waiting up to
  // `timeout`. Entries that do not match stay queued in order.
  std::optional<engine::EngineHandle> TakeMatching(const TakeFilter& filter,
                                                   std::chrono::milliseconds timeout);

  // Marks a consumed engine's path as no longer outstanding.
  void Release(const engine::EngineHandle& handle);

  // Moves roots between enabled/disabled and notifies the Ready stage, which
  // evicts queued engines no longer under an enabled root.
  size_t ApplyRootPatch(const std::vector<RootEntry>& patch);

  // Drops every Ready engine, releases its path and zeroes the per-kind
  // counters. Returns the number dropped.
  size_t ClearReady();

  EngineReadyQueue& Ready() { return ready_; }
  const EngineReadyQueue& Ready() const { return ready_; }
  QueueStats::Snapshot Stats() const { return stats_.Get(); }
  PipelineCounters Counters() const;
  size_t PrerollInFlight() const { return preroll_in_flight_.load(std::memory_order_relaxed); }
  SupplySnapshot Snapshot() const;

  const PipelineConfig& Config() const { return config_; }
  const RootSet& Roots() const { return *roots_; }
  const scan::DedupCache& Dedup() const { return *dedup_; }

  // Backlog-derived busy timeout for the next scan.
  static std::chrono::milliseconds ScanTimeoutFor(size_t ready_len, size_t ready_capacity);

 private:
  struct InFlight {
    std::filesystem::path path;
    engine::EngineHandle handle;
    bool prerolled = false;
  };

  void DiscoverLoop(util::Sender<std::filesystem::path> tx);
  void PrerollLoop(util::Receiver<std::filesystem::path> rx);
  void ReadyLoop(util::Receiver<uint64_t> mutations);

  // Polls one working-set entry. Returns false if the entry was discarded.
  bool PollEntry(InFlight& item, std::chrono::milliseconds timeout);
  void Discard(InFlight& item, const char* reason);
  // True if `path` already sits in the working set or on Ready.
  bool HeldInFlight(const std::filesystem::path& path) const;
  void ForgetInFlight(const std::filesystem::path& path);
  size_t EvictDisabled();

  // Stop-aware sleep for the Discover thread.
  void SleepFor(std::chrono::milliseconds duration);

  const PipelineConfig config_;
  std::shared_ptr<engine::WorkerPool> pool_;
  std::shared_ptr<RootSet> roots_;
  std::shared_ptr<scan::DedupCache> dedup_;
  scan::RandomFileSampler sampler_;

  EngineReadyQueue ready_;
  QueueStats stats_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<size_t> preroll_in_flight_{0};

  // Guards preroll_paths_ and the Preroll -> Ready hand-off. Taken before
  // the Ready queue's own lock.
  mutable std::mutex inflight_mutex_;
  std::multiset<std::filesystem::path> preroll_paths_;

  std::mutex sleep_mutex_;
  std::condition_variable sleep_cv_;

  // Control copies used by Stop() to close the channels.
  std::optional<util::Sender<std::filesystem::path>> candidates_ctl_;
  std::optional<util::Sender<uint64_t>> mutations_tx_;
  std::mutex mutations_mutex_;

  std::thread discover_thread_;
  std::thread preroll_thread_;
  std::thread ready_thread_;

  std::atomic<uint64_t> sampled_{0};
  std::atomic<uint64_t> scan_misses_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> admitted_{0};
  std::atomic<uint64_t> queued_{0};
  std::atomic<uint64_t> discarded_{0};
  std::atomic<uint64_t> evicted_{0};
  std::atomic<uint64_t> taken_{0};
  std::atomic<uint64_t> cleared_{0};
};

}  // namespace zplay::supply

#endif  // ZPLAY_SUPPLY_ACQUISITION_PIPELINE_HPP_
