// Repository: Z-Play-supply
// Component: Dedup Cache
// Purpose: Bounded, approximate "currently outstanding" guard for candidates.
// Copyright (c) 2025 Z-Play

#include "zplay/scan/DedupCache.hpp"

namespace zplay::scan {

DedupCache::DedupCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool DedupCache::Toggle(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string key = path.string();

  auto it = members_.find(key);
  if (it != members_.end()) {
    members_.erase(it);
    return false;
  }

  const uint64_t seq = next_seq_++;
  members_.emplace(key, seq);
  fifo_.emplace_back(key, seq);
  EvictLocked();
  return true;
}

bool DedupCache::Release(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.erase(path.string()) > 0;
}

bool DedupCache::Contains(const std::filesystem::path& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.count(path.string()) > 0;
}

size_t DedupCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.size();
}

void DedupCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  members_.clear();
  fifo_.clear();
}

void DedupCache::EvictLocked() {
  // The FIFO holds one record per admission; stale records still count toward
  // the horizon so that eviction is strictly by admission age.
  while (fifo_.size() > capacity_) {
    const auto& [key, seq] = fifo_.front();
    auto it = members_.find(key);
    if (it != members_.end() && it->second == seq) {
      members_.erase(it);
    }
    fifo_.pop_front();
  }
}

}  // namespace zplay::scan
