// Repository: Z-Play-supply
// Component: FFmpeg Media Engine
// Purpose: IMediaEngine backed by libavformat/libavcodec/libswscale.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_ENGINE_FFMPEG_MEDIA_ENGINE_HPP_
#define ZPLAY_ENGINE_FFMPEG_MEDIA_ENGINE_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "zplay/engine/EngineTypes.hpp"
#include "zplay/engine/IMediaEngine.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace zplay::engine {

// FFmpegMediaEngine maps the lifecycle onto FFmpeg resources:
//
//   Null -> Ready    open input, read stream info, open the decoder
//   Ready -> Paused  decode the first picture (preroll)
//   Paused -> Playing  start the media clock; Pump() presents due frames
//   any -> Null      release every FFmpeg resource
//
// Still images present their single picture for config.image_duration of
// media time, then end-of-stream. Audio-only files advance the media clock
// without pictures; audio output is not rendered here.
class FFmpegMediaEngine : public IMediaEngine {
 public:
  FFmpegMediaEngine(std::filesystem::path path, EngineConfig config);
  ~FFmpegMediaEngine() override;

  FFmpegMediaEngine(const FFmpegMediaEngine&) = delete;
  FFmpegMediaEngine& operator=(const FFmpegMediaEngine&) = delete;

  void SetObserver(MessageObserver observer) override;
  EngineResult SetState(LifecycleState target) override;
  LifecycleState CurrentState() const override { return state_; }
  EngineResult Seek(std::chrono::milliseconds position, std::optional<double> rate) override;
  void Resize(int width, int height) override;
  void Pump() override;
  std::optional<std::chrono::milliseconds> Duration() const override;
  std::chrono::milliseconds Position() const override { return position_; }

  double Rate() const { return rate_; }
  bool IsStillImage() const { return still_image_; }

 private:
  using Clock = std::chrono::steady_clock;

  // One lifecycle step in either direction. Posts StateChanged on success.
  EngineResult StepUp(LifecycleState from);
  EngineResult StepDown(LifecycleState from);

  bool Open(std::string& err);
  bool Preroll(std::string& err);
  void Close();

  // Decodes the next picture into frame_. Returns false at EOF or on error;
  // err is empty at a clean EOF.
  bool DecodeNextFrame(std::string& err);
  bool PresentFrame(std::string& err);
  bool EnsureScaler(std::string& err);
  std::chrono::milliseconds FramePts() const;
  std::chrono::milliseconds MediaNow() const;
  void Reanchor(std::chrono::milliseconds position);

  void Post(const EngineMessage& msg);
  void PostStateChanged(LifecycleState from, LifecycleState to);
  void PostError(const std::string& text, const std::string& debug);

  const std::filesystem::path path_;
  EngineConfig config_;
  MessageObserver observer_;

  LifecycleState state_ = LifecycleState::kNull;
  double rate_ = 1.0;
  std::chrono::milliseconds position_{0};
  bool eos_posted_ = false;
  bool still_image_ = false;
  bool frame_pending_ = false;   // frame_ holds a decoded, not yet presented picture
  bool decoder_drained_ = false;

  Clock::time_point anchor_wall_{};
  std::chrono::milliseconds anchor_media_{0};

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  int video_stream_index_ = -1;
  int audio_stream_index_ = -1;
  double time_base_ = 0.0;
  int64_t start_time_ = 0;
  int scaled_width_ = 0;
  int scaled_height_ = 0;
};

EngineFactory MakeFFmpegEngineFactory();

}  // namespace zplay::engine

#endif  // ZPLAY_ENGINE_FFMPEG_MEDIA_ENGINE_HPP_
