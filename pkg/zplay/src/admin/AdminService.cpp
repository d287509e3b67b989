// Repository: Z-Play-supply
// Component: SupplyAdmin gRPC Service Implementation
// Purpose: Implements the SupplyAdmin service over the pipeline and playback front.
// Copyright (c) 2025 Z-Play

#include "AdminService.h"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

#include "zplay/scan/MediaKind.hpp"
#include "zplay/supply/PlaybackSpeed.hpp"
#include "zplay/telemetry/SupplyMetrics.hpp"
#include "zplay/util/Logger.hpp"

using zplay::util::Logger;

namespace zplay::admin {

namespace {

constexpr char kNoFront[] = "playback front not running";
constexpr std::chrono::milliseconds kDefaultTakeTimeout{1000};

// Copies a now-playing snapshot into its wire form.
void FillNowPlaying(const supply::NowPlayingInfo& info, NowPlayingResponse* response) {
  response->set_active(info.active);
  response->set_path(info.path.string());
  response->set_state(engine::LifecycleStateToString(info.state));
  response->set_position_ms(info.position.count());
  response->set_duration_ms(info.duration ? info.duration->count() : -1);
  response->set_speed(supply::PlaybackSpeedName(info.speed));
  response->set_items_played(info.items_played);
}

}  // namespace

AdminServiceImpl::AdminServiceImpl(std::shared_ptr<supply::AcquisitionPipeline> pipeline,
                                   std::shared_ptr<engine::WorkerPool> pool,
                                   std::shared_ptr<supply::PlaybackFront> front)
    : pipeline_(std::move(pipeline)), pool_(std::move(pool)), front_(std::move(front)) {}

void AdminServiceImpl::FillQueueInfo(QueueInfo* info) const {
  const auto stats = pipeline_->Stats();
  info->set_count(static_cast<uint32_t>(pipeline_->Ready().Size()));
  info->set_capacity(static_cast<uint32_t>(pipeline_->Ready().Capacity()));
  info->set_video(stats.video);
  info->set_image(stats.image);
  info->set_audio(stats.audio);
  info->set_preroll_in_flight(static_cast<uint32_t>(pipeline_->PrerollInFlight()));
}

grpc::Status AdminServiceImpl::GetRoots(grpc::ServerContext* /*context*/,
                                        const GetRootsRequest* /*request*/,
                                        GetRootsResponse* response) {
  for (const auto& entry : pipeline_->Roots().List()) {
    Root* root = response->add_roots();
    root->set_path(entry.path.string());
    root->set_enabled(entry.enabled);
  }
  FillQueueInfo(response->mutable_queue());
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::PatchRoots(grpc::ServerContext* /*context*/,
                                          const PatchRootsRequest* request,
                                          QueueInfo* response) {
  std::vector<supply::RootEntry> patch;
  patch.reserve(static_cast<size_t>(request->roots_size()));
  for (const auto& root : request->roots()) {
    if (root.path().empty()) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "root path must not be empty");
    }
    patch.push_back(supply::RootEntry{root.path(), root.enabled()});
  }

  const size_t moved = pipeline_->ApplyRootPatch(patch);

  std::ostringstream oss;
  oss << "[AdminService] PATCH_ROOTS entries=" << patch.size() << " moved=" << moved;
  Logger::Info(oss.str());

  FillQueueInfo(response);
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::GetQueueInfo(grpc::ServerContext* /*context*/,
                                            const QueueInfoRequest* /*request*/,
                                            QueueInfo* response) {
  FillQueueInfo(response);
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::ResetQueue(grpc::ServerContext* /*context*/,
                                          const ResetQueueRequest* /*request*/,
                                          QueueInfo* response) {
  const size_t cleared = pipeline_->ClearReady();

  std::ostringstream oss;
  oss << "[AdminService] RESET_QUEUE cleared=" << cleared;
  Logger::Info(oss.str());

  FillQueueInfo(response);
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::TakeRandom(grpc::ServerContext* /*context*/,
                                          const TakeRandomRequest* request,
                                          TakeRandomResponse* response) {
  supply::TakeFilter filter;
  for (const auto& name : request->kinds()) {
    const auto kind = scan::ParseMediaKind(name);
    if (!kind) {
      std::ostringstream oss;
      oss << "unknown media kind \"" << name << "\"";
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, oss.str());
    }
    filter.kinds.push_back(*kind);
  }
  for (const auto& root : request->roots()) {
    if (root.empty()) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "root path must not be empty");
    }
    filter.roots.emplace_back(root);
  }
  const auto timeout = request->timeout_ms() > 0
                           ? std::chrono::milliseconds(request->timeout_ms())
                           : kDefaultTakeTimeout;

  auto handle = pipeline_->TakeMatching(filter, timeout);
  if (handle) {
    // The caller only wants the path; the engine is torn down here.
    pipeline_->Release(*handle);
    response->set_found(true);
    response->set_path(handle->Path().string());
    const auto kind = scan::ClassifyPath(handle->Path());
    if (kind) {
      response->set_kind(scan::MediaKindToString(*kind));
    }
  }

  std::ostringstream oss;
  oss << "[AdminService] TAKE_RANDOM kinds=" << filter.kinds.size()
      << " roots=" << filter.roots.size() << " found=" << (handle ? "true" : "false");
  if (handle) {
    oss << " path=" << handle->Path().string();
  }
  Logger::Info(oss.str());

  FillQueueInfo(response->mutable_queue());
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::Next(grpc::ServerContext* /*context*/,
                                    const NextRequest* /*request*/,
                                    NowPlayingResponse* response) {
  if (!front_ || !front_->IsRunning()) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, kNoFront);
  }
  FillNowPlaying(front_->Next(), response);
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::SetPlaybackSpeed(grpc::ServerContext* /*context*/,
                                                const SetPlaybackSpeedRequest* request,
                                                NowPlayingResponse* response) {
  const auto speed = supply::ParsePlaybackSpeed(request->speed());
  if (!speed) {
    std::ostringstream oss;
    oss << "unknown playback speed \"" << request->speed() << "\"";
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, oss.str());
  }
  if (!front_) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, kNoFront);
  }
  front_->SetSpeed(*speed);
  FillNowPlaying(front_->NowPlaying(), response);
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::NowPlaying(grpc::ServerContext* /*context*/,
                                          const NowPlayingRequest* /*request*/,
                                          NowPlayingResponse* response) {
  if (!front_) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, kNoFront);
  }
  FillNowPlaying(front_->NowPlaying(), response);
  return grpc::Status::OK;
}

grpc::Status AdminServiceImpl::GetMetrics(grpc::ServerContext* /*context*/,
                                          const MetricsRequest* /*request*/,
                                          MetricsResponse* response) {
  const auto metrics = telemetry::SupplyMetrics::Capture(*pipeline_, *pool_, front_.get());
  response->set_text(metrics.GeneratePrometheusText());
  return grpc::Status::OK;
}

}  // namespace zplay::admin
