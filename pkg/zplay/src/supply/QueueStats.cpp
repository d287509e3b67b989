// Repository: Z-Play-supply
// Component: Queue Stats
// Purpose: Outstanding Ready-queue items per media kind.
// Copyright (c) 2025 Z-Play

#include "zplay/supply/QueueStats.hpp"

#include "zplay/scan/MediaKind.hpp"

namespace zplay::supply {

std::atomic<uint64_t>* QueueStats::CounterFor(const std::filesystem::path& path) {
  const auto kind = scan::ClassifyPath(path);
  if (!kind) {
    return nullptr;
  }
  switch (*kind) {
    case scan::MediaKind::kVideo: return &video_;
    case scan::MediaKind::kImage: return &image_;
    case scan::MediaKind::kAudio: return &audio_;
  }
  return nullptr;
}

void QueueStats::Add(const std::filesystem::path& path) {
  if (auto* counter = CounterFor(path)) {
    counter->fetch_add(1, std::memory_order_relaxed);
  }
}

void QueueStats::Remove(const std::filesystem::path& path) {
  auto* counter = CounterFor(path);
  if (!counter) {
    return;
  }
  uint64_t current = counter->load(std::memory_order_relaxed);
  while (current > 0 &&
         !counter->compare_exchange_weak(current, current - 1, std::memory_order_relaxed)) {
  }
}

void QueueStats::Reset() {
  video_.store(0, std::memory_order_relaxed);
  image_.store(0, std::memory_order_relaxed);
  audio_.store(0, std::memory_order_relaxed);
}

QueueStats::Snapshot QueueStats::Get() const {
  Snapshot s;
  s.video = video_.load(std::memory_order_relaxed);
  s.image = image_.load(std::memory_order_relaxed);
  s.audio = audio_.load(std::memory_order_relaxed);
  return s;
}

}  // namespace zplay::supply
