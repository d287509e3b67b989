// Repository: Z-Play-supply
// Component: Ready Queue
// Purpose: Bounded FIFO of fully prerolled items awaiting the playback front.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SUPPLY_READY_QUEUE_HPP_
#define ZPLAY_SUPPLY_READY_QUEUE_HPP_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace zplay::supply {

// ReadyQueue is a mutex-guarded bounded FIFO. A push never blocks and never
// overwrites: when full, TryPush refuses and the caller keeps the item.
template <typename T>
class ReadyQueue {
 public:
  static constexpr size_t kDefaultCapacity = 20;

  explicit ReadyQueue(size_t capacity = kDefaultCapacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  ReadyQueue(const ReadyQueue&) = delete;
  ReadyQueue& operator=(const ReadyQueue&) = delete;

  // Returns false if full; `item` is moved from only on success.
  bool TryPush(T& item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.size() >= capacity_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    // Filtered and unfiltered consumers may be waiting at the same time.
    not_empty_.notify_all();
    return true;
  }

  std::optional<T> TryPop() {
    std::unique_lock<std::mutex> lock(mutex_);
    return PopLocked(lock);
  }

  std::optional<T> PopFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return !items_.empty(); });
    return PopLocked(lock);
  }

  // Removes the oldest item matching `pred`, waiting up to `timeout` for one
  // to arrive. Non-matching items keep their place.
  template <typename Pred>
  std::optional<T> PopFirstFor(Pred pred, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto match = items_.end();
    not_empty_.wait_for(lock, timeout, [this, &pred, &match] {
      match = std::find_if(items_.begin(), items_.end(), pred);
      return match != items_.end();
    });
    if (match == items_.end()) {
      return std::nullopt;
    }
    std::optional<T> item(std::move(*match));
    items_.erase(match);
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  // Waits until there is room or the timeout expires. Returns true if not full.
  bool WaitForSpace(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return not_full_.wait_for(lock, timeout, [this] { return items_.size() < capacity_; });
  }

  // Removes every item matching `pred`, keeping the order of the rest.
  // Returns the removed items in queue order.
  template <typename Pred>
  std::vector<T> EvictIf(Pred pred) {
    std::vector<T> removed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      std::deque<T> kept;
      for (auto& item : items_) {
        if (pred(item)) {
          removed.push_back(std::move(item));
        } else {
          kept.push_back(std::move(item));
        }
      }
      items_.swap(kept);
    }
    if (!removed.empty()) {
      not_full_.notify_all();
    }
    return removed;
  }

  // Calls fn(const T&) for each item, front to back, under the lock.
  template <typename Fn>
  void ForEach(Fn fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : items_) {
      fn(item);
    }
  }

  template <typename Pred>
  bool AnyOf(Pred pred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(items_.begin(), items_.end(), pred);
  }

  // Empties the queue and returns what it held.
  std::vector<T> Clear() {
    std::vector<T> removed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& item : items_) {
        removed.push_back(std::move(item));
      }
      items_.clear();
    }
    not_full_.notify_all();
    return removed;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t Capacity() const { return capacity_; }

  bool IsEmpty() const { return Size() == 0; }
  bool IsFull() const { return Size() >= capacity_; }

 private:
  std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> item(std::move(items_.front()));
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
};

}  // namespace zplay::supply

#endif  // ZPLAY_SUPPLY_READY_QUEUE_HPP_
