// Repository: Z-Play-supply
// Component: Playback Front
// Purpose: Headless consumer that plays Ready engines one after another.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SUPPLY_PLAYBACK_FRONT_HPP_
#define ZPLAY_SUPPLY_PLAYBACK_FRONT_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "zplay/engine/EngineHandle.hpp"
#include "zplay/supply/AcquisitionPipeline.hpp"
#include "zplay/supply/PlaybackSpeed.hpp"

namespace zplay::supply {

struct PlaybackFrontConfig {
  // How long one loop iteration waits for a Ready engine.
  std::chrono::milliseconds take_timeout{100};
  // Bound on waiting for the Playing reply of a freshly taken engine.
  std::chrono::milliseconds play_timeout{2000};
};

struct NowPlayingInfo {
  bool active = false;
  std::filesystem::path path;
  engine::LifecycleState state = engine::LifecycleState::kNull;
  std::chrono::milliseconds position{0};
  std::optional<std::chrono::milliseconds> duration;
  PlaybackSpeed speed = PlaybackSpeed::kX1;
  uint64_t items_played = 0;
};

// PlaybackFront drains the Ready queue: it plays the current engine until it
// ends or fails (or Next() is asked for), then swaps in the next one. The
// previous engine's dedup entry is released on every swap.
class PlaybackFront {
 public:
  PlaybackFront(std::shared_ptr<AcquisitionPipeline> pipeline,
                PlaybackFrontConfig config = PlaybackFrontConfig{});
  ~PlaybackFront();

  PlaybackFront(const PlaybackFront&) = delete;
  PlaybackFront& operator=(const PlaybackFront&) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Asks the loop to advance and waits up to `wait` for the attempt to finish.
  // If Ready is empty the request is dropped and the current item keeps
  // playing. Returns the now-playing snapshot after the attempt.
  NowPlayingInfo Next(std::chrono::milliseconds wait = std::chrono::milliseconds(3000));

  void SetSpeed(PlaybackSpeed speed);
  PlaybackSpeed Speed() const;

  NowPlayingInfo NowPlaying() const;

  // Forwards a render-target size to the current engine.
  void Resize(int width, int height);

 private:
  void Loop();

  // Returns true if the current engine finished or failed.
  bool DrainCurrentEvents();
  // Takes and starts the next engine. Returns false if none was available.
  bool Advance();
  // Returns false if the engine rejected the rate or did not answer in time.
  bool ApplyRate(const engine::EngineHandle& handle, PlaybackSpeed speed);
  // Clears speed_dirty_ if `applied` is still the requested speed.
  void MarkRateApplied(PlaybackSpeed applied);
  NowPlayingInfo NowPlayingLocked() const;

  std::shared_ptr<AcquisitionPipeline> pipeline_;
  const PlaybackFrontConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  engine::EngineHandle current_;
  PlaybackSpeed speed_ = PlaybackSpeed::kX1;
  // Set by SetSpeed() and cleared only once the current engine runs at speed_.
  bool speed_dirty_ = false;
  // A failed rate change is retried no earlier than this.
  std::chrono::steady_clock::time_point rate_retry_at_{};
  bool next_requested_ = false;
  uint64_t advance_attempts_ = 0;  // completed Next() attempts
  uint64_t items_played_ = 0;
  bool stop_ = false;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace zplay::supply

#endif  // ZPLAY_SUPPLY_PLAYBACK_FRONT_HPP_
