// Repository: Z-Play-supply
// Component: Fake Media Engine
// Purpose: Deterministic IMediaEngine for worker pool, pipeline and front tests.
// Records every call; no decode, no threads.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_TESTS_FIXTURES_FAKE_MEDIA_ENGINE_HPP_
#define ZPLAY_TESTS_FIXTURES_FAKE_MEDIA_ENGINE_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "zplay/engine/IMediaEngine.hpp"

namespace zplay::tests::fixtures {

struct FakeEngineOptions {
  // Null -> Ready fails for paths matching this predicate.
  std::function<bool(const std::filesystem::path&)> fail_on_open;
  // The factory returns nullptr for paths matching this predicate.
  std::function<bool(const std::filesystem::path&)> fail_construct;
  // Post end-of-stream after this many pumps in Playing. < 0 never.
  int eos_after_pumps = -1;
  // Post an element-source error before every state step.
  bool element_noise = false;
  std::chrono::milliseconds duration{60000};
};

// Shared, thread-safe record of what every fake engine saw.
class FakeEngineLog {
 public:
  struct SeekCall {
    std::filesystem::path path;
    std::chrono::milliseconds position{0};
    std::optional<double> rate;
  };

  void OnCreate(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    created_.push_back(path);
    ++live_;
  }
  void OnDestroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    --live_;
    ++destroyed_;
  }
  void OnCall(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    threads_[path.string()].insert(std::this_thread::get_id());
  }
  void OnSeek(SeekCall call) {
    std::lock_guard<std::mutex> lock(mutex_);
    seeks_.push_back(std::move(call));
  }
  void OnResize(int width, int height) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_resize_ = {width, height};
  }

  std::vector<std::filesystem::path> Created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
  }
  int Live() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
  }
  int Destroyed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
  }
  std::vector<SeekCall> Seeks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seeks_;
  }
  std::pair<int, int> LastResize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_resize_;
  }
  // Distinct threads that called into the engine for `path`.
  size_t ThreadsFor(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(path.string());
    return it == threads_.end() ? 0 : it->second.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::filesystem::path> created_;
  int live_ = 0;
  int destroyed_ = 0;
  std::vector<SeekCall> seeks_;
  std::pair<int, int> last_resize_{0, 0};
  std::map<std::string, std::set<std::thread::id>> threads_;
};

class FakeMediaEngine : public zplay::engine::IMediaEngine {
 public:
  using LifecycleState = zplay::engine::LifecycleState;
  using EngineMessage = zplay::engine::EngineMessage;
  using EngineResult = zplay::engine::EngineResult;

  FakeMediaEngine(std::filesystem::path path, FakeEngineOptions options,
                  std::shared_ptr<FakeEngineLog> log)
      : path_(std::move(path)), options_(std::move(options)), log_(std::move(log)) {
    log_->OnCreate(path_);
  }

  ~FakeMediaEngine() override { log_->OnDestroy(); }

  void SetObserver(MessageObserver observer) override {
    log_->OnCall(path_);
    observer_ = std::move(observer);
  }

  EngineResult SetState(LifecycleState target) override {
    log_->OnCall(path_);
    while (state_ != target) {
      const LifecycleState from = state_;
      const bool up = static_cast<int>(target) > static_cast<int>(from);
      if (up && from == LifecycleState::kNull && options_.fail_on_open &&
          options_.fail_on_open(path_)) {
        PostError("could not open resource", path_.string());
        return EngineResult::Fail("open failed: " + path_.string());
      }
      if (options_.element_noise) {
        EngineMessage noise;
        noise.source = EngineMessage::Source::kElement;
        noise.type = EngineMessage::Type::kError;
        noise.element = "fakesink";
        noise.text = "element warning";
        Post(noise);
      }
      state_ = static_cast<LifecycleState>(static_cast<int>(from) + (up ? 1 : -1));
      if (state_ == LifecycleState::kNull) {
        position_ = std::chrono::milliseconds(0);
        pumps_ = 0;
        eos_posted_ = false;
      }
      EngineMessage msg;
      msg.source = EngineMessage::Source::kPipeline;
      msg.type = EngineMessage::Type::kStateChanged;
      msg.from = from;
      msg.to = state_;
      Post(msg);
    }
    return EngineResult::Ok();
  }

  LifecycleState CurrentState() const override { return state_; }

  EngineResult Seek(std::chrono::milliseconds position, std::optional<double> rate) override {
    log_->OnCall(path_);
    if (state_ == LifecycleState::kNull) {
      return EngineResult::Fail("seek in Null");
    }
    if (rate && *rate <= 0.0) {
      return EngineResult::Fail("rate must be positive");
    }
    if (rate) rate_ = *rate;
    position_ = std::min(position, options_.duration);
    log_->OnSeek(FakeEngineLog::SeekCall{path_, position, rate});
    return EngineResult::Ok();
  }

  void Resize(int width, int height) override {
    log_->OnCall(path_);
    log_->OnResize(width, height);
  }

  void Pump() override {
    if (state_ != LifecycleState::kPlaying || eos_posted_) {
      return;
    }
    ++pumps_;
    position_ += std::chrono::milliseconds(static_cast<int64_t>(10 * rate_));

    auto frame = std::make_shared<zplay::engine::VideoFrame>();
    frame->width = 2;
    frame->height = 2;
    frame->rgba.assign(2 * 2 * 4, static_cast<uint8_t>(pumps_));
    frame->pts = position_;
    EngineMessage sample;
    sample.source = EngineMessage::Source::kElement;
    sample.type = EngineMessage::Type::kNewSample;
    sample.frame = std::move(frame);
    Post(sample);
    if (options_.eos_after_pumps >= 0 && pumps_ >= options_.eos_after_pumps) {
      eos_posted_ = true;
      EngineMessage msg;
      msg.source = EngineMessage::Source::kPipeline;
      msg.type = EngineMessage::Type::kEndOfStream;
      Post(msg);
    }
  }

  std::optional<std::chrono::milliseconds> Duration() const override {
    return options_.duration;
  }
  std::chrono::milliseconds Position() const override { return position_; }

 private:
  void Post(const EngineMessage& msg) {
    if (observer_) observer_(msg);
  }

  void PostError(const std::string& text, const std::string& debug) {
    EngineMessage msg;
    msg.source = EngineMessage::Source::kPipeline;
    msg.type = EngineMessage::Type::kError;
    msg.text = text;
    msg.debug = debug;
    Post(msg);
  }

  const std::filesystem::path path_;
  const FakeEngineOptions options_;
  std::shared_ptr<FakeEngineLog> log_;
  MessageObserver observer_;
  LifecycleState state_ = LifecycleState::kNull;
  std::chrono::milliseconds position_{0};
  double rate_ = 1.0;
  int pumps_ = 0;
  bool eos_posted_ = false;
};

inline zplay::engine::EngineFactory MakeFakeEngineFactory(
    std::shared_ptr<FakeEngineLog> log, FakeEngineOptions options = FakeEngineOptions{}) {
  return [log, options](const std::filesystem::path& path, const zplay::engine::EngineConfig&)
             -> std::unique_ptr<zplay::engine::IMediaEngine> {
    if (options.fail_construct && options.fail_construct(path)) {
      return nullptr;
    }
    return std::make_unique<FakeMediaEngine>(path, options, log);
  };
}

}  // namespace zplay::tests::fixtures

#endif  // ZPLAY_TESTS_FIXTURES_FAKE_MEDIA_ENGINE_HPP_
