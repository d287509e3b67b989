// Repository: Z-Play-supply
// Component: Channel
// Purpose: Bounded/unbounded multi-producer multi-consumer channel with
//          sender/receiver disconnect detection.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_UTIL_CHANNEL_HPP_
#define ZPLAY_UTIL_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace zplay::util {

enum class RecvStatus {
  kOk,
  kEmpty,         // TryRecv only: nothing queued, senders still alive
  kTimeout,       // RecvTimeout only: nothing arrived before the deadline
  kDisconnected,  // queue drained and no sender can ever push again
};

enum class SendStatus {
  kOk,
  kFull,
  kDisconnected,
};

// Capacity value for an unbounded channel.
inline constexpr std::size_t kUnbounded = 0;

namespace detail {

template <typename T>
struct ChannelState {
  explicit ChannelState(std::size_t cap) : capacity(cap) {}

  bool Full() const { return capacity != kUnbounded && items.size() >= capacity; }
  bool SendersGone() const { return closed || senders == 0; }
  bool ReceiversGone() const { return closed || receivers == 0; }

  std::mutex mutex;
  std::condition_variable not_empty;
  std::condition_variable not_full;
  std::deque<T> items;
  const std::size_t capacity;
  std::size_t senders = 0;
  std::size_t receivers = 0;
  bool closed = false;
};

}  // namespace detail

template <typename T>
class Receiver;

// Sender is the producing end of a channel. Copies share the channel; when the
// last Sender is destroyed, receivers observe kDisconnected once the queue has
// been drained.
template <typename T>
class Sender {
 public:
  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    Attach();
  }

  Sender(const Sender& other) : state_(other.state_) { Attach(); }
  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

  Sender& operator=(const Sender& other) {
    if (this != &other) {
      Detach();
      state_ = other.state_;
      Attach();
    }
    return *this;
  }

  Sender& operator=(Sender&& other) noexcept {
    if (this != &other) {
      Detach();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Sender() { Detach(); }

  // Blocks while the channel is full. Returns false (and drops the value) if
  // every receiver is gone or the channel was closed.
  bool Send(T value) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_full.wait(lock, [this] {
      return state_->ReceiversGone() || !state_->Full();
    });
    if (state_->ReceiversGone()) {
      return false;
    }
    state_->items.push_back(std::move(value));
    lock.unlock();
    state_->not_empty.notify_one();
    return true;
  }

  // Non-blocking. `value` is moved from only when kOk is returned.
  SendStatus TrySend(T& value) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->ReceiversGone()) {
      return SendStatus::kDisconnected;
    }
    if (state_->Full()) {
      return SendStatus::kFull;
    }
    state_->items.push_back(std::move(value));
    lock.unlock();
    state_->not_empty.notify_one();
    return SendStatus::kOk;
  }

  bool IsDisconnected() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->ReceiversGone();
  }

  std::size_t Len() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->items.size();
  }

  // Disconnects both ends immediately. Queued items stay receivable.
  void Close() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->closed = true;
    }
    state_->not_empty.notify_all();
    state_->not_full.notify_all();
  }

 private:
  void Attach() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  void Detach() {
    if (!state_) return;
    bool last = false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      last = (--state_->senders == 0);
    }
    if (last) {
      state_->not_empty.notify_all();
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

// Receiver is the consuming end of a channel.
template <typename T>
class Receiver {
 public:
  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    Attach();
  }

  Receiver(const Receiver& other) : state_(other.state_) { Attach(); }
  Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}

  Receiver& operator=(const Receiver& other) {
    if (this != &other) {
      Detach();
      state_ = other.state_;
      Attach();
    }
    return *this;
  }

  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      Detach();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Receiver() { Detach(); }

  // Blocks until a value arrives. nullopt means disconnected.
  std::optional<T> Recv() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_empty.wait(lock, [this] {
      return !state_->items.empty() || state_->SendersGone();
    });
    if (state_->items.empty()) {
      return std::nullopt;
    }
    return PopLocked(lock);
  }

  RecvStatus RecvTimeout(std::chrono::milliseconds timeout, T& out) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    const bool ready = state_->not_empty.wait_for(lock, timeout, [this] {
      return !state_->items.empty() || state_->SendersGone();
    });
    if (!state_->items.empty()) {
      out = PopLocked(lock);
      return RecvStatus::kOk;
    }
    return ready ? RecvStatus::kDisconnected : RecvStatus::kTimeout;
  }

  RecvStatus TryRecv(T& out) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->items.empty()) {
      out = PopLocked(lock);
      return RecvStatus::kOk;
    }
    return state_->SendersGone() ? RecvStatus::kDisconnected : RecvStatus::kEmpty;
  }

  bool IsDisconnected() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->SendersGone();
  }

  std::size_t Len() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->items.size();
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->closed = true;
    }
    state_->not_empty.notify_all();
    state_->not_full.notify_all();
  }

 private:
  T PopLocked(std::unique_lock<std::mutex>& lock) {
    T value = std::move(state_->items.front());
    state_->items.pop_front();
    lock.unlock();
    state_->not_full.notify_one();
    return value;
  }

  void Attach() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->receivers;
  }

  void Detach() {
    if (!state_) return;
    bool last = false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      last = (--state_->receivers == 0);
    }
    if (last) {
      state_->not_full.notify_all();
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

// MakeChannel returns a connected sender/receiver pair. capacity == kUnbounded
// never blocks the sender.
template <typename T>
std::pair<Sender<T>, Receiver<T>> MakeChannel(std::size_t capacity) {
  auto state = std::make_shared<detail::ChannelState<T>>(capacity);
  return {Sender<T>(state), Receiver<T>(state)};
}

}  // namespace zplay::util

#endif  // ZPLAY_UTIL_CHANNEL_HPP_
