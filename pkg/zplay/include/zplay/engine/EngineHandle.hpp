// Repository: Z-Play-supply
// Component: Engine Handle
// Purpose: Reference-counted caller-side view of an engine owned by a pool worker.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_ENGINE_ENGINE_HANDLE_HPP_
#define ZPLAY_ENGINE_ENGINE_HANDLE_HPP_

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

#include "zplay/engine/EngineTypes.hpp"
#include "zplay/util/Channel.hpp"

namespace zplay::engine {

class WorkerPool;

// EngineCell is the state shared between an engine's owning worker and its
// handles: the mirrored lifecycle state, the latest picture, and the sending
// end of the public event stream.
class EngineCell {
 public:
  explicit EngineCell(util::Sender<EngineEvent> events);

  LifecycleState State() const;
  void SetState(LifecycleState state);

  std::shared_ptr<const VideoFrame> Frame() const;
  void SetFrame(std::shared_ptr<const VideoFrame> frame);

  std::chrono::milliseconds Position() const;
  std::optional<std::chrono::milliseconds> Duration() const;
  void SetProgress(std::chrono::milliseconds position,
                   std::optional<std::chrono::milliseconds> duration);

  // Forwards to the event stream. Returns false once every handle is gone;
  // the caller must then stop watching the engine.
  bool Publish(EngineEvent event);

 private:
  mutable std::mutex mutex_;
  LifecycleState state_ = LifecycleState::kNull;
  std::shared_ptr<const VideoFrame> frame_;
  std::chrono::milliseconds position_{0};
  std::optional<std::chrono::milliseconds> duration_;
  util::Sender<EngineEvent> events_;
};

// EngineHandle is a copyable value. All copies refer to the same engine and
// share one event receiver; when the last copy is destroyed the engine is
// torn down on its owning worker.
class EngineHandle {
 public:
  EngineHandle() = default;

  bool Valid() const { return core_ != nullptr; }
  explicit operator bool() const { return Valid(); }

  EngineId Id() const;
  const std::filesystem::path& Path() const;

  // Last state mirrored by the owning worker. Never blocks on the worker.
  LifecycleState State() const;

  std::future<EngineResult> SetState(LifecycleState target) const;
  std::future<EngineResult> Seek(std::chrono::milliseconds position,
                                 std::optional<double> rate = std::nullopt) const;
  void Resize(int width, int height) const;

  util::Receiver<EngineEvent>& Events() const;

  std::shared_ptr<const VideoFrame> CurrentFrame() const;

  // Progress as of the owning worker's last pump.
  std::chrono::milliseconds Position() const;
  std::optional<std::chrono::milliseconds> Duration() const;

  // Number of live EngineHandle copies for this engine.
  long UseCount() const { return core_.use_count(); }

  friend bool operator==(const EngineHandle& a, const EngineHandle& b) {
    return a.core_ == b.core_;
  }
  friend bool operator!=(const EngineHandle& a, const EngineHandle& b) {
    return !(a == b);
  }

 private:
  friend class WorkerPool;

  struct Core {
    Core(std::shared_ptr<WorkerPool> pool, EngineId id, std::filesystem::path path,
         std::shared_ptr<EngineCell> cell, util::Receiver<EngineEvent> events);
    ~Core();

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    std::shared_ptr<WorkerPool> pool;
    EngineId id;
    std::filesystem::path path;
    std::shared_ptr<EngineCell> cell;
    util::Receiver<EngineEvent> events;
  };

  explicit EngineHandle(std::shared_ptr<Core> core) : core_(std::move(core)) {}

  std::shared_ptr<Core> core_;
};

}  // namespace zplay::engine

#endif  // ZPLAY_ENGINE_ENGINE_HANDLE_HPP_
