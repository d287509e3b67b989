// Repository: Z-Play-supply
// Component: FFmpeg Media Engine
// Purpose: IMediaEngine backed by libavformat/libavcodec/libswscale.
// Copyright (c) 2025 Z-Play

#include "zplay/engine/FFmpegMediaEngine.hpp"

#include <algorithm>
#include <sstream>

#include "zplay/scan/MediaKind.hpp"
#include "zplay/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

using zplay::util::Logger;

namespace zplay::engine {

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  std::ostringstream oss;
  oss << errbuf << " (ret=" << ret << ")";
  return oss.str();
}

// Upper bound on frames decoded forward after an accurate seek.
constexpr int kMaxSeekDecodeFrames = 600;
// Upper bound on frames presented by a single Pump() when catching up.
constexpr int kMaxFramesPerPump = 4;

}  // namespace

FFmpegMediaEngine::FFmpegMediaEngine(std::filesystem::path path, EngineConfig config)
    : path_(std::move(path)), config_(config) {}

FFmpegMediaEngine::~FFmpegMediaEngine() {
  Close();
}

void FFmpegMediaEngine::SetObserver(MessageObserver observer) {
  observer_ = std::move(observer);
}

// =============================================================================
// Lifecycle
// =============================================================================

EngineResult FFmpegMediaEngine::SetState(LifecycleState target) {
  while (state_ != target) {
    EngineResult step = (state_ < target) ? StepUp(state_) : StepDown(state_);
    if (!step.success) {
      return step;
    }
  }
  return EngineResult::Ok();
}

EngineResult FFmpegMediaEngine::StepUp(LifecycleState from) {
  std::string err;
  switch (from) {
    case LifecycleState::kNull:
      if (!Open(err)) {
        PostError("Could not open resource for reading", err);
        return EngineResult::Fail("open failed: " + err);
      }
      state_ = LifecycleState::kReady;
      break;
    case LifecycleState::kReady:
      if (!Preroll(err)) {
        PostError("Preroll failed", err);
        return EngineResult::Fail("preroll failed: " + err);
      }
      state_ = LifecycleState::kPaused;
      break;
    case LifecycleState::kPaused:
      Reanchor(position_);
      state_ = LifecycleState::kPlaying;
      break;
    case LifecycleState::kPlaying:
      return EngineResult::Ok();
  }
  PostStateChanged(from, state_);
  return EngineResult::Ok();
}

EngineResult FFmpegMediaEngine::StepDown(LifecycleState from) {
  switch (from) {
    case LifecycleState::kPlaying:
      if (video_stream_index_ < 0 || still_image_) {
        position_ = MediaNow();
      }
      state_ = LifecycleState::kPaused;
      break;
    case LifecycleState::kPaused: {
      // Ready has no buffered picture; the next preroll starts from the top.
      position_ = std::chrono::milliseconds(0);
      frame_pending_ = false;
      eos_posted_ = false;
      if (format_ctx_ && video_stream_index_ >= 0 && !still_image_) {
        int ret = av_seek_frame(format_ctx_, video_stream_index_, start_time_,
                                AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
          std::ostringstream oss;
          oss << "[FFmpegMediaEngine] REWIND_FAILED path=" << path_.string()
              << " err=" << AvError(ret);
          Logger::Warn(oss.str());
        }
        avcodec_flush_buffers(codec_ctx_);
        decoder_drained_ = false;
      }
      state_ = LifecycleState::kReady;
      break;
    }
    case LifecycleState::kReady:
      Close();
      state_ = LifecycleState::kNull;
      break;
    case LifecycleState::kNull:
      return EngineResult::Ok();
  }
  PostStateChanged(from, state_);
  return EngineResult::Ok();
}

bool FFmpegMediaEngine::Open(std::string& err) {
  av_log_set_level(AV_LOG_ERROR);

  const std::string uri = path_.string();
  int ret = avformat_open_input(&format_ctx_, uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    err = "avformat_open_input: " + AvError(ret);
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    err = "avformat_find_stream_info: " + AvError(ret);
    Close();
    return false;
  }

  ret = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (ret >= 0 &&
      (format_ctx_->streams[ret]->disposition & AV_DISPOSITION_ATTACHED_PIC) == 0) {
    video_stream_index_ = ret;
  }
  ret = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (ret >= 0) {
    audio_stream_index_ = ret;
  }

  if (video_stream_index_ < 0 && audio_stream_index_ < 0) {
    err = "no audio or video stream";
    Close();
    return false;
  }

  if (video_stream_index_ >= 0) {
    AVStream* stream = format_ctx_->streams[video_stream_index_];
    time_base_ = av_q2d(stream->time_base);
    start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
      err = "decoder not found";
      Close();
      return false;
    }
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
      err = "avcodec_alloc_context3 failed";
      Close();
      return false;
    }
    if (avcodec_parameters_to_context(codec_ctx_, stream->codecpar) < 0) {
      err = "avcodec_parameters_to_context failed";
      Close();
      return false;
    }
    codec_ctx_->thread_type = FF_THREAD_FRAME;
    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
      err = "avcodec_open2: " + AvError(ret);
      Close();
      return false;
    }

    const char* format_name = format_ctx_->iformat ? format_ctx_->iformat->name : "";
    const std::string name = format_name ? format_name : "";
    const auto kind = scan::ClassifyPath(path_);
    still_image_ = (kind && *kind == scan::MediaKind::kImage) ||
                   name == "image2" ||
                   (name.size() > 5 && name.compare(name.size() - 5, 5, "_pipe") == 0);
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    err = "frame/packet allocation failed";
    Close();
    return false;
  }

  std::ostringstream oss;
  oss << "[FFmpegMediaEngine] OPENED path=" << path_.string()
      << " video=" << video_stream_index_ << " audio=" << audio_stream_index_
      << " still=" << (still_image_ ? 1 : 0);
  Logger::Debug(oss.str());
  return true;
}

bool FFmpegMediaEngine::Preroll(std::string& err) {
  eos_posted_ = false;
  if (video_stream_index_ < 0) {
    return true;
  }
  if (!frame_pending_) {
    if (!DecodeNextFrame(err)) {
      if (err.empty()) {
        err = "no decodable picture";
      }
      return false;
    }
    frame_pending_ = true;
  }
  return PresentFrame(err);
}

void FFmpegMediaEngine::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  video_stream_index_ = -1;
  audio_stream_index_ = -1;
  frame_pending_ = false;
  decoder_drained_ = false;
  still_image_ = false;
}

// =============================================================================
// Playback
// =============================================================================

std::optional<std::chrono::milliseconds> FFmpegMediaEngine::Duration() const {
  if (still_image_) {
    return config_.image_duration;
  }
  if (!format_ctx_ || format_ctx_->duration == AV_NOPTS_VALUE || format_ctx_->duration <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(format_ctx_->duration / (AV_TIME_BASE / 1000));
}

std::chrono::milliseconds FFmpegMediaEngine::MediaNow() const {
  if (state_ != LifecycleState::kPlaying) {
    return position_;
  }
  const auto wall = std::chrono::duration<double, std::milli>(Clock::now() - anchor_wall_);
  return anchor_media_ +
         std::chrono::milliseconds(static_cast<int64_t>(wall.count() * rate_));
}

void FFmpegMediaEngine::Reanchor(std::chrono::milliseconds position) {
  anchor_wall_ = Clock::now();
  anchor_media_ = position;
}

void FFmpegMediaEngine::Pump() {
  if (state_ != LifecycleState::kPlaying || eos_posted_) {
    return;
  }

  const auto now = MediaNow();

  if (video_stream_index_ < 0 || still_image_) {
    const auto duration = Duration();
    position_ = duration ? std::min(now, *duration) : now;
    if (duration && now >= *duration) {
      eos_posted_ = true;
      EngineMessage msg;
      msg.type = EngineMessage::Type::kEndOfStream;
      Post(msg);
    }
    return;
  }

  std::string err;
  for (int i = 0; i < kMaxFramesPerPump; ++i) {
    if (!frame_pending_) {
      if (!DecodeNextFrame(err)) {
        eos_posted_ = true;
        if (err.empty()) {
          EngineMessage msg;
          msg.type = EngineMessage::Type::kEndOfStream;
          Post(msg);
        } else {
          PostError("Internal data stream error", err);
        }
        return;
      }
      frame_pending_ = true;
    }
    if (FramePts() > now) {
      return;
    }
    if (!PresentFrame(err)) {
      eos_posted_ = true;
      PostError("Failed to present picture", err);
      return;
    }
  }
}

EngineResult FFmpegMediaEngine::Seek(std::chrono::milliseconds position,
                                     std::optional<double> rate) {
  if (rate && *rate <= 0.0) {
    return EngineResult::Fail("rate must be positive");
  }
  if (state_ == LifecycleState::kNull) {
    return EngineResult::Fail("seek on an engine in Null");
  }

  position = std::max(position, std::chrono::milliseconds(0));
  if (const auto duration = Duration()) {
    position = std::min(position, *duration);
  }
  if (rate) {
    rate_ = *rate;
  }

  if (video_stream_index_ >= 0 && !still_image_) {
    AVStream* stream = format_ctx_->streams[video_stream_index_];
    const int64_t timestamp =
        start_time_ + av_rescale_q(position.count() * 1000, AVRational{1, AV_TIME_BASE},
                                   stream->time_base);
    int ret = av_seek_frame(format_ctx_, video_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
      std::ostringstream oss;
      oss << "[FFmpegMediaEngine] SEEK_FAILED path=" << path_.string()
          << " position_ms=" << position.count() << " err=" << AvError(ret);
      Logger::Warn(oss.str());
      return EngineResult::Fail("seek failed: " + AvError(ret));
    }
    avcodec_flush_buffers(codec_ctx_);
    decoder_drained_ = false;
    frame_pending_ = false;

    // Accurate: decode forward from the keyframe to the first picture at or
    // after the target.
    std::string err;
    for (int i = 0; i < kMaxSeekDecodeFrames; ++i) {
      if (!DecodeNextFrame(err)) {
        break;
      }
      frame_pending_ = true;
      if (FramePts() >= position) {
        break;
      }
      frame_pending_ = false;
    }
    if (!err.empty()) {
      return EngineResult::Fail("decode after seek failed: " + err);
    }
    if (frame_pending_ && state_ == LifecycleState::kPaused) {
      if (!PresentFrame(err)) {
        return EngineResult::Fail("present after seek failed: " + err);
      }
    }
  }

  position_ = position;
  eos_posted_ = false;
  Reanchor(position);
  return EngineResult::Ok();
}

void FFmpegMediaEngine::Resize(int width, int height) {
  if (width <= 0 || height <= 0) {
    return;
  }
  config_.target_width = width;
  config_.target_height = height;
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

// =============================================================================
// Decode / present
// =============================================================================

bool FFmpegMediaEngine::DecodeNextFrame(std::string& err) {
  err.clear();
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      return true;
    }
    if (ret == AVERROR_EOF) {
      decoder_drained_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      err = "avcodec_receive_frame: " + AvError(ret);
      return false;
    }
    if (decoder_drained_) {
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      // Flush: the decoder returns its buffered pictures, then AVERROR_EOF.
      const int flush_ret = avcodec_send_packet(codec_ctx_, nullptr);
      if (flush_ret < 0 && flush_ret != AVERROR_EOF) {
        err = "avcodec_send_packet(flush): " + AvError(flush_ret);
        return false;
      }
      continue;
    }
    if (ret < 0) {
      err = "av_read_frame: " + AvError(ret);
      return false;
    }
    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      err = "avcodec_send_packet: " + AvError(ret);
      return false;
    }
  }
}

std::chrono::milliseconds FFmpegMediaEngine::FramePts() const {
  const int64_t pts = frame_->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) {
    return position_;
  }
  return std::chrono::milliseconds(
      static_cast<int64_t>(static_cast<double>(pts - start_time_) * time_base_ * 1000.0));
}

bool FFmpegMediaEngine::EnsureScaler(std::string& err) {
  const int src_w = frame_->width;
  const int src_h = frame_->height;
  if (src_w <= 0 || src_h <= 0) {
    err = "picture has no dimensions";
    return false;
  }

  // Fit inside the target box, preserving aspect ratio.
  const double scale = std::min(static_cast<double>(config_.target_width) / src_w,
                                static_cast<double>(config_.target_height) / src_h);
  scaled_width_ = std::max(2, static_cast<int>(src_w * scale) & ~1);
  scaled_height_ = std::max(2, static_cast<int>(src_h * scale) & ~1);

  sws_ctx_ = sws_getCachedContext(sws_ctx_, src_w, src_h,
                                  static_cast<AVPixelFormat>(frame_->format),
                                  scaled_width_, scaled_height_, AV_PIX_FMT_RGBA,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    err = "sws_getCachedContext failed";
    return false;
  }
  return true;
}

bool FFmpegMediaEngine::PresentFrame(std::string& err) {
  if (!EnsureScaler(err)) {
    return false;
  }

  auto picture = std::make_shared<VideoFrame>();
  picture->width = scaled_width_;
  picture->height = scaled_height_;
  picture->pts = FramePts();
  picture->rgba.resize(static_cast<size_t>(scaled_width_) * scaled_height_ * 4);

  uint8_t* dst_data[4] = {picture->rgba.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {scaled_width_ * 4, 0, 0, 0};
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, frame_->height,
            dst_data, dst_linesize);

  position_ = picture->pts;
  frame_pending_ = false;

  EngineMessage msg;
  msg.source = EngineMessage::Source::kElement;
  msg.type = EngineMessage::Type::kNewSample;
  msg.element = "videosink";
  msg.frame = std::move(picture);
  Post(msg);
  return true;
}

// =============================================================================
// Bus
// =============================================================================

void FFmpegMediaEngine::Post(const EngineMessage& msg) {
  if (observer_) {
    observer_(msg);
  }
}

void FFmpegMediaEngine::PostStateChanged(LifecycleState from, LifecycleState to) {
  EngineMessage msg;
  msg.type = EngineMessage::Type::kStateChanged;
  msg.from = from;
  msg.to = to;
  Post(msg);
}

void FFmpegMediaEngine::PostError(const std::string& text, const std::string& debug) {
  std::ostringstream oss;
  oss << "[FFmpegMediaEngine] ERROR path=" << path_.string() << " msg=" << text
      << " debug=" << debug;
  Logger::Warn(oss.str());

  EngineMessage msg;
  msg.type = EngineMessage::Type::kError;
  msg.text = text;
  msg.debug = path_.string() + ": " + debug;
  Post(msg);
}

EngineFactory MakeFFmpegEngineFactory() {
  return [](const std::filesystem::path& path,
            const EngineConfig& config) -> std::unique_ptr<IMediaEngine> {
    return std::make_unique<FFmpegMediaEngine>(path, config);
  };
}

}  // namespace zplay::engine
