// Repository: Z-Play-supply
// Component: Engine Handle
// Purpose: Reference-counted caller-side view of an engine owned by a pool worker.
// Copyright (c) 2025 Z-Play

#include "zplay/engine/EngineHandle.hpp"

#include "zplay/engine/WorkerPool.hpp"

namespace zplay::engine {

const char* LifecycleStateToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kNull: return "Null";
    case LifecycleState::kReady: return "Ready";
    case LifecycleState::kPaused: return "Paused";
    case LifecycleState::kPlaying: return "Playing";
  }
  return "Unknown";
}

// =============================================================================
// EngineCell
// =============================================================================

EngineCell::EngineCell(util::Sender<EngineEvent> events) : events_(std::move(events)) {}

LifecycleState EngineCell::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void EngineCell::SetState(LifecycleState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = state;
}

std::shared_ptr<const VideoFrame> EngineCell::Frame() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frame_;
}

void EngineCell::SetFrame(std::shared_ptr<const VideoFrame> frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  frame_ = std::move(frame);
}

std::chrono::milliseconds EngineCell::Position() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return position_;
}

std::optional<std::chrono::milliseconds> EngineCell::Duration() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return duration_;
}

void EngineCell::SetProgress(std::chrono::milliseconds position,
                             std::optional<std::chrono::milliseconds> duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  position_ = position;
  duration_ = duration;
}

bool EngineCell::Publish(EngineEvent event) {
  // Unbounded stream: Send only fails once every receiver is gone.
  return events_.Send(std::move(event));
}

// =============================================================================
// EngineHandle
// =============================================================================

EngineHandle::Core::Core(std::shared_ptr<WorkerPool> pool_in, EngineId id_in,
                         std::filesystem::path path_in, std::shared_ptr<EngineCell> cell_in,
                         util::Receiver<EngineEvent> events_in)
    : pool(std::move(pool_in)),
      id(id_in),
      path(std::move(path_in)),
      cell(std::move(cell_in)),
      events(std::move(events_in)) {}

EngineHandle::Core::~Core() {
  pool->Remove(id);
}

EngineId EngineHandle::Id() const {
  return core_->id;
}

const std::filesystem::path& EngineHandle::Path() const {
  return core_->path;
}

LifecycleState EngineHandle::State() const {
  return core_->cell->State();
}

std::future<EngineResult> EngineHandle::SetState(LifecycleState target) const {
  return core_->pool->SetState(core_->id, target);
}

std::future<EngineResult> EngineHandle::Seek(std::chrono::milliseconds position,
                                             std::optional<double> rate) const {
  return core_->pool->Seek(core_->id, position, rate);
}

void EngineHandle::Resize(int width, int height) const {
  core_->pool->Resize(core_->id, width, height);
}

util::Receiver<EngineEvent>& EngineHandle::Events() const {
  return core_->events;
}

std::shared_ptr<const VideoFrame> EngineHandle::CurrentFrame() const {
  return core_->cell->Frame();
}

std::chrono::milliseconds EngineHandle::Position() const {
  return core_->cell->Position();
}

std::optional<std::chrono::milliseconds> EngineHandle::Duration() const {
  return core_->cell->Duration();
}

}  // namespace zplay::engine
