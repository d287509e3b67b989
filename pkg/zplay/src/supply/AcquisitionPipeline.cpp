// Repository: Z-Play-supply
// Component: Acquisition Pipeline
// Purpose: Discover -> Preroll -> Ready stage threads feeding the playback front.
// Copyright (c) 2025 Z-Play

#include "zplay/supply/AcquisitionPipeline.hpp"

#include <algorithm>
#include <deque>
#include <sstream>

#include "zplay/util/Logger.hpp"

namespace fs = std::filesystem;
using zplay::engine::EngineEvent;
using zplay::engine::EngineHandle;
using zplay::engine::LifecycleState;
using zplay::util::Logger;
using zplay::util::RecvStatus;

namespace zplay::supply {

AcquisitionPipeline::AcquisitionPipeline(PipelineConfig config,
                                         std::shared_ptr<engine::WorkerPool> pool,
                                         std::shared_ptr<RootSet> roots,
                                         std::shared_ptr<scan::DedupCache> dedup)
    : config_(std::move(config)),
      pool_(std::move(pool)),
      roots_(std::move(roots)),
      dedup_(std::move(dedup)),
      sampler_(config_.sampler),
      ready_(config_.ready_capacity) {}

AcquisitionPipeline::~AcquisitionPipeline() { Stop(); }

std::chrono::milliseconds AcquisitionPipeline::ScanTimeoutFor(size_t ready_len,
                                                             size_t ready_capacity) {
  if (ready_capacity == 0) ready_capacity = 1;
  ready_len = std::min(ready_len, ready_capacity);
  const auto extra = static_cast<int64_t>(9900 * ready_len / ready_capacity);
  return std::chrono::milliseconds(100 + extra);
}

bool AcquisitionPipeline::Start() {
  if (stop_requested_.load(std::memory_order_acquire)) {
    Logger::Warn("[AcquisitionPipeline] START_REJECTED reason=stopped");
    return false;
  }
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }

  auto [candidates_tx, candidates_rx] =
      util::MakeChannel<fs::path>(std::max<size_t>(config_.discover_channel_capacity, 1));
  auto [mutations_tx, mutations_rx] = util::MakeChannel<uint64_t>(util::kUnbounded);

  candidates_ctl_.emplace(candidates_tx);
  {
    std::lock_guard<std::mutex> lock(mutations_mutex_);
    mutations_tx_.emplace(std::move(mutations_tx));
  }

  discover_thread_ = std::thread(&AcquisitionPipeline::DiscoverLoop, this, std::move(candidates_tx));
  preroll_thread_ = std::thread(&AcquisitionPipeline::PrerollLoop, this, std::move(candidates_rx));
  ready_thread_ = std::thread(&AcquisitionPipeline::ReadyLoop, this, std::move(mutations_rx));

  std::ostringstream oss;
  oss << "[AcquisitionPipeline] STARTED ready_capacity=" << ready_.Capacity()
      << " preroll_capacity=" << config_.preroll_capacity
      << " enabled_roots=" << roots_->Enabled().size();
  Logger::Info(oss.str());
  return true;
}

void AcquisitionPipeline::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    stop_requested_.store(true, std::memory_order_release);
  }
  sleep_cv_.notify_all();

  if (candidates_ctl_) {
    candidates_ctl_->Close();
  }
  {
    std::lock_guard<std::mutex> lock(mutations_mutex_);
    if (mutations_tx_) {
      mutations_tx_->Close();
    }
  }

  if (discover_thread_.joinable()) discover_thread_.join();
  if (preroll_thread_.joinable()) preroll_thread_.join();
  if (ready_thread_.joinable()) ready_thread_.join();

  candidates_ctl_.reset();
  {
    std::lock_guard<std::mutex> lock(mutations_mutex_);
    mutations_tx_.reset();
  }

  const auto leftovers = ready_.Clear();
  for (const auto& handle : leftovers) {
    stats_.Remove(handle.Path());
    dedup_->Release(handle.Path());
  }

  std::ostringstream oss;
  oss << "[AcquisitionPipeline] STOPPED released=" << leftovers.size();
  Logger::Info(oss.str());
}

std::optional<EngineHandle> AcquisitionPipeline::Take() {
  while (auto handle = ready_.TryPop()) {
    stats_.Remove(handle->Path());
    // A root may have been disabled after the push but before the Ready stage
    // saw the mutation.
    if (!roots_->IsUnderEnabled(handle->Path())) {
      dedup_->Release(handle->Path());
      evicted_.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    taken_.fetch_add(1, std::memory_order_relaxed);
    return handle;
  }
  return std::nullopt;
}

std::optional<EngineHandle> AcquisitionPipeline::TakeFor(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    auto handle = ready_.PopFor(std::max(remaining, std::chrono::milliseconds(0)));
    if (!handle) {
      return std::nullopt;
    }
    stats_.Remove(handle->Path());
    if (roots_->IsUnderEnabled(handle->Path())) {
      taken_.fetch_add(1, std::memory_order_relaxed);
      return handle;
    }
    dedup_->Release(handle->Path());
    evicted_.fetch_add(1, std::memory_order_relaxed);
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
  }
}

std::optional<EngineHandle> AcquisitionPipeline::TakeMatching(const TakeFilter& filter,
                                                              std::chrono::milliseconds timeout) {
  auto matches = [this, &filter](const EngineHandle& handle) {
    const fs::path& path = handle.Path();
    if (!roots_->IsUnderEnabled(path)) {
      return false;
    }
    if (!filter.roots.empty() &&
        std::none_of(filter.roots.begin(), filter.roots.end(),
                     [&path](const fs::path& root) { return scan::PathIsUnder(path, root); })) {
      return false;
    }
    if (filter.kinds.empty()) {
      return true;
    }
    // An unclassified path passes any kind filter.
    const auto kind = scan::ClassifyPath(path);
    return !kind || std::find(filter.kinds.begin(), filter.kinds.end(), *kind) != filter.kinds.end();
  };

  auto handle = ready_.PopFirstFor(matches, timeout);
  if (!handle) {
    return std::nullopt;
  }
  stats_.Remove(handle->Path());
  taken_.fetch_add(1, std::memory_order_relaxed);
  return handle;
}

void AcquisitionPipeline::Release(const EngineHandle& handle) {
  if (handle) {
    dedup_->Release(handle.Path());
  }
}

size_t AcquisitionPipeline::ApplyRootPatch(const std::vector<RootEntry>& patch) {
  const size_t moved = roots_->ApplyPatch(patch);

  std::ostringstream oss;
  oss << "[AcquisitionPipeline] ROOTS_PATCHED entries=" << patch.size() << " moved=" << moved;
  Logger::Info(oss.str());

  if (moved == 0) {
    return 0;
  }

  bool delivered = false;
  {
    std::lock_guard<std::mutex> lock(mutations_mutex_);
    if (mutations_tx_) {
      delivered = mutations_tx_->Send(roots_->Generation());
    }
  }
  if (!delivered) {
    // No Ready stage running; evict inline.
    EvictDisabled();
  }
  return moved;
}

size_t AcquisitionPipeline::ClearReady() {
  std::vector<EngineHandle> removed;
  {
    // Holding the hand-off lock keeps Preroll from counting a new entry
    // between the drain and the reset.
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    removed = ready_.Clear();
    stats_.Reset();
  }
  for (const auto& handle : removed) {
    dedup_->Release(handle.Path());
  }
  cleared_.fetch_add(removed.size(), std::memory_order_relaxed);

  std::ostringstream oss;
  oss << "[ReadyStage] CLEARED count=" << removed.size();
  Logger::Info(oss.str());
  return removed.size();
}

SupplySnapshot AcquisitionPipeline::Snapshot() const {
  SupplySnapshot snapshot;
  std::lock_guard<std::mutex> lock(inflight_mutex_);
  snapshot.preroll.assign(preroll_paths_.begin(), preroll_paths_.end());
  ready_.ForEach([&snapshot](const EngineHandle& handle) { snapshot.ready.push_back(handle.Path()); });
  return snapshot;
}

PipelineCounters AcquisitionPipeline::Counters() const {
  PipelineCounters c;
  c.sampled = sampled_.load(std::memory_order_relaxed);
  c.scan_misses = scan_misses_.load(std::memory_order_relaxed);
  c.duplicates = duplicates_.load(std::memory_order_relaxed);
  c.admitted = admitted_.load(std::memory_order_relaxed);
  c.queued = queued_.load(std::memory_order_relaxed);
  c.discarded = discarded_.load(std::memory_order_relaxed);
  c.evicted = evicted_.load(std::memory_order_relaxed);
  c.taken = taken_.load(std::memory_order_relaxed);
  c.cleared = cleared_.load(std::memory_order_relaxed);
  return c;
}

void AcquisitionPipeline::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(sleep_mutex_);
  sleep_cv_.wait_for(lock, duration,
                     [this] { return stop_requested_.load(std::memory_order_acquire); });
}

// =============================================================================
// Discover
// =============================================================================

void AcquisitionPipeline::DiscoverLoop(util::Sender<fs::path> tx) {
  std::chrono::milliseconds miss_penalty{0};

  while (!stop_requested_.load(std::memory_order_acquire)) {
    const auto enabled = roots_->Enabled();
    if (enabled.empty()) {
      SleepFor(config_.no_roots_backoff);
      continue;
    }

    const auto timeout = ScanTimeoutFor(ready_.Size(), ready_.Capacity()) + miss_penalty;
    auto found = sampler_.Sample(enabled, timeout * 2, timeout, &stop_requested_);
    if (!found) {
      if (stop_requested_.load(std::memory_order_acquire)) {
        break;
      }
      scan_misses_.fetch_add(1, std::memory_order_relaxed);
      miss_penalty += config_.miss_backoff_step;
      std::ostringstream oss;
      oss << "[Discover] SCAN_MISS next_timeout_ms="
          << (ScanTimeoutFor(ready_.Size(), ready_.Capacity()) + miss_penalty).count();
      Logger::Debug(oss.str());
      continue;
    }
    miss_penalty = std::chrono::milliseconds(0);
    sampled_.fetch_add(1, std::memory_order_relaxed);

    if (!dedup_->Toggle(*found)) {
      duplicates_.fetch_add(1, std::memory_order_relaxed);
      std::ostringstream oss;
      oss << "[Discover] DUPLICATE path=" << found->string();
      Logger::Debug(oss.str());
      continue;
    }

    admitted_.fetch_add(1, std::memory_order_relaxed);
    const fs::path admitted = *found;
    if (!tx.Send(std::move(*found))) {
      dedup_->Release(admitted);
      break;
    }
  }

  Logger::Info("[Discover] EXIT reason=disconnected");
}

// =============================================================================
// Preroll
// =============================================================================

bool AcquisitionPipeline::HeldInFlight(const fs::path& path) const {
  std::lock_guard<std::mutex> lock(inflight_mutex_);
  if (preroll_paths_.count(path) > 0) {
    return true;
  }
  return ready_.AnyOf([&path](const EngineHandle& handle) { return handle.Path() == path; });
}

void AcquisitionPipeline::ForgetInFlight(const fs::path& path) {
  std::lock_guard<std::mutex> lock(inflight_mutex_);
  auto it = preroll_paths_.find(path);
  if (it != preroll_paths_.end()) {
    preroll_paths_.erase(it);
  }
}

void AcquisitionPipeline::Discard(InFlight& item, const char* reason) {
  ForgetInFlight(item.path);
  dedup_->Release(item.path);
  discarded_.fetch_add(1, std::memory_order_relaxed);
  std::ostringstream oss;
  oss << "[Preroll] DISCARDED path=" << item.path.string() << " reason=" << reason;
  Logger::Warn(oss.str());
}

bool AcquisitionPipeline::PollEntry(InFlight& item, std::chrono::milliseconds timeout) {
  auto& events = item.handle.Events();
  EngineEvent event;
  RecvStatus status = timeout.count() > 0 ? events.RecvTimeout(timeout, event)
                                          : events.TryRecv(event);
  while (status == RecvStatus::kOk) {
    if (event.kind == EngineEvent::Kind::kError) {
      Discard(item, event.error.c_str());
      return false;
    }
    if (event.kind == EngineEvent::Kind::kStateChanged &&
        event.to == LifecycleState::kPaused) {
      item.prerolled = true;
    }
    status = events.TryRecv(event);
  }
  if (status == RecvStatus::kDisconnected) {
    Discard(item, "event stream closed");
    return false;
  }
  if (item.handle.State() == LifecycleState::kPaused) {
    item.prerolled = true;
  }
  return true;
}

void AcquisitionPipeline::PrerollLoop(util::Receiver<fs::path> rx) {
  std::deque<InFlight> working;
  const size_t capacity = std::max<size_t>(config_.preroll_capacity, 1);
  bool disconnected = false;

  auto admit = [this, &working](fs::path path) {
    // The dedup toggle can readmit a path whose engine is still held here or
    // on Ready. That engine keeps the outstanding mark.
    if (HeldInFlight(path)) {
      duplicates_.fetch_add(1, std::memory_order_relaxed);
      std::ostringstream oss;
      oss << "[Preroll] DUPLICATE path=" << path.string();
      Logger::Debug(oss.str());
      return;
    }
    {
      std::lock_guard<std::mutex> lock(inflight_mutex_);
      preroll_paths_.insert(path);
    }
    InFlight item;
    item.path = std::move(path);
    item.handle = pool_->Create(item.path);
    // Outcome is observed through the event stream, not the reply.
    std::future<engine::EngineResult> pending = item.handle.SetState(LifecycleState::kPaused);
    (void)pending;
    working.push_back(std::move(item));
  };

  while (!stop_requested_.load(std::memory_order_acquire)) {
    // Refill the working set. Block briefly only when there is nothing to poll.
    while (working.size() < capacity) {
      fs::path path;
      const RecvStatus status = working.empty() ? rx.RecvTimeout(config_.refill_timeout, path)
                                                : rx.TryRecv(path);
      if (status == RecvStatus::kDisconnected) {
        disconnected = true;
        break;
      }
      if (status != RecvStatus::kOk) {
        break;
      }
      admit(std::move(path));
    }
    if (disconnected) {
      break;
    }

    // Poll every pending entry in admission order.
    for (auto it = working.begin(); it != working.end();) {
      if (it->prerolled) {
        ++it;
        continue;
      }
      if (PollEntry(*it, config_.event_poll_timeout)) {
        ++it;
      } else {
        it = working.erase(it);
      }
    }

    // Promote prerolled entries in admission order while Ready has room.
    bool ready_full = false;
    for (auto it = working.begin(); it != working.end();) {
      if (!it->prerolled) {
        ++it;
        continue;
      }
      // A patch landing between this check and the push is caught by the
      // generation comparison below.
      const uint64_t generation = roots_->Generation();
      if (!roots_->IsUnderEnabled(it->path)) {
        ForgetInFlight(it->path);
        dedup_->Release(it->path);
        evicted_.fetch_add(1, std::memory_order_relaxed);
        std::ostringstream oss;
        oss << "[Preroll] EVICTED path=" << it->path.string();
        Logger::Info(oss.str());
        it = working.erase(it);
        continue;
      }
      if (ready_full) {
        ++it;
        continue;
      }
      const fs::path path = it->path;
      {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        // Counted before the push so a consumer cannot withdraw it uncounted.
        stats_.Add(path);
        if (!ready_.TryPush(it->handle)) {
          stats_.Remove(path);
          ready_full = true;
          ++it;
          continue;
        }
        preroll_paths_.erase(preroll_paths_.find(path));
      }
      queued_.fetch_add(1, std::memory_order_relaxed);
      std::ostringstream oss;
      oss << "[Preroll] QUEUED path=" << path.string()
          << " ready=" << ready_.Size() << "/" << ready_.Capacity();
      Logger::Info(oss.str());
      it = working.erase(it);
      if (roots_->Generation() != generation) {
        EvictDisabled();
      }
    }

    preroll_in_flight_.store(working.size(), std::memory_order_relaxed);

    const bool all_prerolled =
        !working.empty() && std::all_of(working.begin(), working.end(),
                                        [](const InFlight& item) { return item.prerolled; });
    if (all_prerolled && ready_full) {
      // Nothing left to poll; hold until the consumer takes something.
      ready_.WaitForSpace(config_.event_poll_timeout);
    }
  }

  for (auto& item : working) {
    dedup_->Release(item.path);
  }
  working.clear();
  {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    preroll_paths_.clear();
  }
  // Admits still queued on the closed channel were never prerolled.
  fs::path queued;
  while (rx.TryRecv(queued) == RecvStatus::kOk) {
    dedup_->Release(queued);
  }
  preroll_in_flight_.store(0, std::memory_order_relaxed);

  Logger::Info("[Preroll] EXIT reason=disconnected");
}

// =============================================================================
// Ready
// =============================================================================

size_t AcquisitionPipeline::EvictDisabled() {
  auto removed = ready_.EvictIf(
      [this](const EngineHandle& handle) { return !roots_->IsUnderEnabled(handle.Path()); });
  for (const auto& handle : removed) {
    stats_.Remove(handle.Path());
    dedup_->Release(handle.Path());
    evicted_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream oss;
    oss << "[ReadyStage] EVICTED path=" << handle.Path().string();
    Logger::Info(oss.str());
  }
  return removed.size();
}

void AcquisitionPipeline::ReadyLoop(util::Receiver<uint64_t> mutations) {
  while (true) {
    uint64_t generation = 0;
    const RecvStatus status = mutations.RecvTimeout(config_.event_poll_timeout, generation);
    if (status == RecvStatus::kDisconnected) {
      break;
    }
    if (status != RecvStatus::kOk) {
      continue;
    }
    // Coalesce bursts of patches into one eviction pass.
    while (mutations.TryRecv(generation) == RecvStatus::kOk) {
    }
    const size_t evicted = EvictDisabled();

    std::ostringstream oss;
    oss << "[ReadyStage] ROOTS_APPLIED generation=" << generation
        << " evicted=" << evicted;
    Logger::Debug(oss.str());
  }

  Logger::Info("[ReadyStage] EXIT reason=disconnected");
}

}  // namespace zplay::supply
