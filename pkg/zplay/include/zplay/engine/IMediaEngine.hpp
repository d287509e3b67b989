// Repository: Z-Play-supply
// Component: Media Engine Interface
// Purpose: Opaque decode/render capability driven by the worker pool.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_ENGINE_IMEDIA_ENGINE_HPP_
#define ZPLAY_ENGINE_IMEDIA_ENGINE_HPP_

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "zplay/engine/EngineTypes.hpp"

namespace zplay::engine {

// IMediaEngine is one native pipeline instance for one file.
//
// Threading: every method is called from the engine's owning worker thread
// only. Implementations need no internal locking for calls; messages are
// delivered synchronously to the observer on that same thread.
//
// Messages: state transitions, end-of-stream and errors are posted as
// pipeline-source EngineMessages; decoded pictures as element-source
// kNewSample messages.
class IMediaEngine {
 public:
  using MessageObserver = std::function<void(const EngineMessage&)>;

  virtual ~IMediaEngine() = default;

  // Installs the bus observer. nullptr detaches.
  virtual void SetObserver(MessageObserver observer) = 0;

  // Drives the engine through every intermediate state toward `target`.
  // Failure leaves the engine in the last state it reached and posts kError.
  virtual EngineResult SetState(LifecycleState target) = 0;

  virtual LifecycleState CurrentState() const = 0;

  // Moves the playback position. `position` is clamped to the duration.
  // A rate, when given, also changes the playback rate.
  virtual EngineResult Seek(std::chrono::milliseconds position,
                            std::optional<double> rate) = 0;

  // Changes the output picture size hint.
  virtual void Resize(int width, int height) = 0;

  // Advances a playing engine. Called by the worker between commands.
  virtual void Pump() = 0;

  virtual std::optional<std::chrono::milliseconds> Duration() const = 0;
  virtual std::chrono::milliseconds Position() const = 0;
};

using EngineFactory = std::function<std::unique_ptr<IMediaEngine>(
    const std::filesystem::path& path, const EngineConfig& config)>;

}  // namespace zplay::engine

#endif  // ZPLAY_ENGINE_IMEDIA_ENGINE_HPP_
