// Repository: Z-Play-supply
// Component: Playback Front
// Purpose: Headless consumer that plays Ready engines one after another.
// Copyright (c) 2025 Z-Play

#include "zplay/supply/PlaybackFront.hpp"

#include <future>
#include <sstream>

#include "zplay/util/Logger.hpp"

using zplay::engine::EngineEvent;
using zplay::engine::EngineHandle;
using zplay::engine::EngineResult;
using zplay::engine::LifecycleState;
using zplay::util::Logger;
using zplay::util::RecvStatus;

namespace zplay::supply {

PlaybackFront::PlaybackFront(std::shared_ptr<AcquisitionPipeline> pipeline,
                             PlaybackFrontConfig config)
    : pipeline_(std::move(pipeline)), config_(config) {}

PlaybackFront::~PlaybackFront() { Stop(); }

bool PlaybackFront::Start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&PlaybackFront::Loop, this);
  Logger::Info("[PlaybackFront] STARTED");
  return true;
}

void PlaybackFront::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  EngineHandle last;
  uint64_t played = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last = std::move(current_);
    current_ = EngineHandle();
    played = items_played_;
  }
  pipeline_->Release(last);

  std::ostringstream oss;
  oss << "[PlaybackFront] STOPPED items_played=" << played;
  Logger::Info(oss.str());
}

NowPlayingInfo PlaybackFront::Next(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return NowPlayingLocked();
  }
  const uint64_t target = advance_attempts_ + 1;
  next_requested_ = true;
  cv_.notify_all();
  cv_.wait_for(lock, wait, [this, target] { return stop_ || advance_attempts_ >= target; });
  return NowPlayingLocked();
}

void PlaybackFront::SetSpeed(PlaybackSpeed speed) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (speed_ == speed) {
      return;
    }
    speed_ = speed;
    speed_dirty_ = true;
    rate_retry_at_ = std::chrono::steady_clock::time_point{};
  }
  cv_.notify_all();

  std::ostringstream oss;
  oss << "[PlaybackFront] SPEED_SET speed=" << PlaybackSpeedName(speed);
  Logger::Info(oss.str());
}

PlaybackSpeed PlaybackFront::Speed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return speed_;
}

NowPlayingInfo PlaybackFront::NowPlaying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return NowPlayingLocked();
}

NowPlayingInfo PlaybackFront::NowPlayingLocked() const {
  NowPlayingInfo info;
  info.speed = speed_;
  info.items_played = items_played_;
  if (current_) {
    info.active = true;
    info.path = current_.Path();
    info.state = current_.State();
    info.position = current_.Position();
    info.duration = current_.Duration();
  }
  return info;
}

void PlaybackFront::Resize(int width, int height) {
  EngineHandle current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = current_;
  }
  if (current) {
    current.Resize(width, height);
  }
}

void PlaybackFront::Loop() {
  bool pending_advance = true;

  while (true) {
    bool explicit_next = false;
    bool speed_dirty = false;
    PlaybackSpeed speed = PlaybackSpeed::kX1;
    bool has_current = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_) {
        break;
      }
      explicit_next = next_requested_;
      next_requested_ = false;
      speed_dirty = speed_dirty_ && std::chrono::steady_clock::now() >= rate_retry_at_;
      speed = speed_;
      has_current = current_.Valid();
    }

    if (!has_current || DrainCurrentEvents()) {
      pending_advance = true;
    }

    if (pending_advance || explicit_next) {
      const bool advanced = Advance();
      if (advanced) {
        pending_advance = false;
      }
      if (explicit_next) {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          ++advance_attempts_;
        }
        cv_.notify_all();
      }
      if (advanced || !speed_dirty) {
        continue;
      }
      // Nothing to swap in; the current engine still owes the rate change.
    }

    if (speed_dirty) {
      EngineHandle current;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        current = current_;
      }
      if (!current || ApplyRate(current, speed)) {
        MarkRateApplied(speed);
      } else {
        std::lock_guard<std::mutex> lock(mutex_);
        rate_retry_at_ = std::chrono::steady_clock::now() + config_.take_timeout;
      }
      continue;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, config_.take_timeout, [this] {
      return stop_ || next_requested_ ||
             (speed_dirty_ && std::chrono::steady_clock::now() >= rate_retry_at_);
    });
  }
}

bool PlaybackFront::DrainCurrentEvents() {
  EngineHandle current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = current_;
  }
  if (!current) {
    return true;
  }

  EngineEvent event;
  RecvStatus status = current.Events().TryRecv(event);
  while (status == RecvStatus::kOk) {
    if (event.kind == EngineEvent::Kind::kEndOfStream) {
      std::ostringstream oss;
      oss << "[PlaybackFront] ENDED path=" << current.Path().string();
      Logger::Info(oss.str());
      return true;
    }
    if (event.kind == EngineEvent::Kind::kError) {
      std::ostringstream oss;
      oss << "[PlaybackFront] PLAYBACK_ERROR path=" << current.Path().string()
          << " error=\"" << event.error << "\"";
      Logger::Warn(oss.str());
      return true;
    }
    status = current.Events().TryRecv(event);
  }
  return status == RecvStatus::kDisconnected;
}

bool PlaybackFront::Advance() {
  auto next = pipeline_->TakeFor(config_.take_timeout);
  if (!next) {
    return false;
  }

  std::future<EngineResult> reply = next->SetState(LifecycleState::kPlaying);
  if (reply.wait_for(config_.play_timeout) != std::future_status::ready) {
    std::ostringstream oss;
    oss << "[PlaybackFront] PLAY_TIMEOUT path=" << next->Path().string();
    Logger::Warn(oss.str());
    pipeline_->Release(*next);
    return false;
  }
  const EngineResult result = reply.get();
  if (!result.success) {
    std::ostringstream oss;
    oss << "[PlaybackFront] PLAY_FAILED path=" << next->Path().string()
        << " msg=" << result.message;
    Logger::Warn(oss.str());
    pipeline_->Release(*next);
    return false;
  }

  PlaybackSpeed speed = PlaybackSpeed::kX1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    speed = speed_;
  }
  // A fresh engine starts at the natural rate.
  if (speed == PlaybackSpeed::kX1 || ApplyRate(*next, speed)) {
    MarkRateApplied(speed);
  }

  const std::filesystem::path path = next->Path();
  EngineHandle previous;
  uint64_t played = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::move(current_);
    current_ = std::move(*next);
    played = ++items_played_;
  }
  // Dropping the last handle tears the engine down on its worker.
  pipeline_->Release(previous);

  std::ostringstream oss;
  oss << "[PlaybackFront] NOW_PLAYING path=" << path.string()
      << " speed=" << PlaybackSpeedName(speed) << " items_played=" << played;
  Logger::Info(oss.str());
  return true;
}

void PlaybackFront::MarkRateApplied(PlaybackSpeed applied) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (speed_ == applied) {
    speed_dirty_ = false;
  }
}

bool PlaybackFront::ApplyRate(const EngineHandle& handle, PlaybackSpeed speed) {
  std::future<EngineResult> reply =
      handle.Seek(handle.Position(), PlaybackSpeedRate(speed));
  if (reply.wait_for(config_.play_timeout) != std::future_status::ready) {
    std::ostringstream oss;
    oss << "[PlaybackFront] RATE_TIMEOUT path=" << handle.Path().string()
        << " speed=" << PlaybackSpeedName(speed);
    Logger::Warn(oss.str());
    return false;
  }
  const EngineResult result = reply.get();
  if (!result.success) {
    std::ostringstream oss;
    oss << "[PlaybackFront] RATE_FAILED path=" << handle.Path().string()
        << " speed=" << PlaybackSpeedName(speed) << " msg=" << result.message;
    Logger::Warn(oss.str());
    return false;
  }
  return true;
}

}  // namespace zplay::supply
