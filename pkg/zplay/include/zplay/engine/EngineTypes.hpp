// Repository: Z-Play-supply
// Component: Engine Types
// Purpose: Lifecycle states, bus messages, events and results shared by the
//          media engines and the worker pool.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_ENGINE_ENGINE_TYPES_HPP_
#define ZPLAY_ENGINE_ENGINE_TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zplay::engine {

using EngineId = uint64_t;

enum class LifecycleState {
  kNull = 0,
  kReady = 1,
  kPaused = 2,
  kPlaying = 3,
};

const char* LifecycleStateToString(LifecycleState state);

// Result of a command executed on an engine's owning worker.
struct EngineResult {
  bool success;
  std::string message;

  static EngineResult Ok() { return EngineResult{true, ""}; }
  static EngineResult Fail(std::string msg) { return EngineResult{false, std::move(msg)}; }
};

// Decoded RGBA picture exposed for synchronous reads by the front.
struct VideoFrame {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;
  std::chrono::milliseconds pts{0};
};

// EngineMessage is what an engine posts on its internal bus. Only messages
// whose source is the pipeline itself become public EngineEvents; element
// messages (samples, per-element state) stay internal to the worker.
struct EngineMessage {
  enum class Source { kPipeline, kElement };
  enum class Type { kStateChanged, kEndOfStream, kError, kNewSample };

  Source source = Source::kPipeline;
  Type type = Type::kStateChanged;
  std::string element;  // originating element name for kElement
  LifecycleState from = LifecycleState::kNull;
  LifecycleState to = LifecycleState::kNull;
  std::string text;     // kError: primary message
  std::string debug;    // kError: debug detail
  std::shared_ptr<const VideoFrame> frame;  // kNewSample
};

// Public event stream item of an EngineHandle.
struct EngineEvent {
  enum class Kind { kEndOfStream, kError, kStateChanged };

  Kind kind = Kind::kEndOfStream;
  std::string error;
  LifecycleState from = LifecycleState::kNull;
  LifecycleState to = LifecycleState::kNull;

  static EngineEvent EndOfStream() { return EngineEvent{Kind::kEndOfStream, "", {}, {}}; }
  static EngineEvent Error(std::string msg) {
    return EngineEvent{Kind::kError, std::move(msg), {}, {}};
  }
  static EngineEvent StateChanged(LifecycleState from, LifecycleState to) {
    return EngineEvent{Kind::kStateChanged, "", from, to};
  }
};

// Per-engine configuration supplied by the pool.
struct EngineConfig {
  int target_width = 1280;
  int target_height = 720;
  // Wall-clock playing time for still images before end-of-stream.
  std::chrono::milliseconds image_duration{10000};
};

}  // namespace zplay::engine

#endif  // ZPLAY_ENGINE_ENGINE_TYPES_HPP_
