// Repository: Z-Play-supply
// Component: SupplyAdmin gRPC Service Implementation
// Purpose: Implements the SupplyAdmin service over the pipeline and playback front.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_ADMIN_SERVICE_H_
#define ZPLAY_ADMIN_SERVICE_H_

#include <memory>

#include <grpcpp/grpcpp.h>

#include "zplay_admin.grpc.pb.h"
#include "zplay_admin.pb.h"
#include "zplay/engine/WorkerPool.hpp"
#include "zplay/supply/AcquisitionPipeline.hpp"
#include "zplay/supply/PlaybackFront.hpp"

namespace zplay::admin {

// AdminServiceImpl implements the gRPC service defined in zplay_admin.proto.
// This is a thin adapter; all state lives in the pipeline and the front.
class AdminServiceImpl final : public SupplyAdmin::Service {
 public:
  // `front` may be null, in which case the playback RPCs fail with
  // FAILED_PRECONDITION.
  AdminServiceImpl(std::shared_ptr<supply::AcquisitionPipeline> pipeline,
                   std::shared_ptr<engine::WorkerPool> pool,
                   std::shared_ptr<supply::PlaybackFront> front);
  ~AdminServiceImpl() override = default;

  AdminServiceImpl(const AdminServiceImpl&) = delete;
  AdminServiceImpl& operator=(const AdminServiceImpl&) = delete;

  grpc::Status GetRoots(grpc::ServerContext* context, const GetRootsRequest* request,
                        GetRootsResponse* response) override;

  grpc::Status PatchRoots(grpc::ServerContext* context, const PatchRootsRequest* request,
                          QueueInfo* response) override;

  grpc::Status GetQueueInfo(grpc::ServerContext* context, const QueueInfoRequest* request,
                            QueueInfo* response) override;

  grpc::Status ResetQueue(grpc::ServerContext* context, const ResetQueueRequest* request,
                          QueueInfo* response) override;

  grpc::Status TakeRandom(grpc::ServerContext* context, const TakeRandomRequest* request,
                          TakeRandomResponse* response) override;

  grpc::Status Next(grpc::ServerContext* context, const NextRequest* request,
                    NowPlayingResponse* response) override;

  grpc::Status SetPlaybackSpeed(grpc::ServerContext* context,
                                const SetPlaybackSpeedRequest* request,
                                NowPlayingResponse* response) override;

  grpc::Status NowPlaying(grpc::ServerContext* context, const NowPlayingRequest* request,
                          NowPlayingResponse* response) override;

  grpc::Status GetMetrics(grpc::ServerContext* context, const MetricsRequest* request,
                          MetricsResponse* response) override;

 private:
  void FillQueueInfo(QueueInfo* info) const;

  std::shared_ptr<supply::AcquisitionPipeline> pipeline_;
  std::shared_ptr<engine::WorkerPool> pool_;
  std::shared_ptr<supply::PlaybackFront> front_;
};

}  // namespace zplay::admin

#endif  // ZPLAY_ADMIN_SERVICE_H_
