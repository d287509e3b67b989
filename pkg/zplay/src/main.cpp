// Repository: Z-Play-supply
// Component: SupplyAdmin gRPC Server
// Purpose: Main entry point for the zplay media supply daemon.
// Copyright (c) 2025 Z-Play

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "admin/AdminService.h"
#include "zplay/engine/FFmpegMediaEngine.hpp"
#include "zplay/engine/WorkerPool.hpp"
#include "zplay/scan/DedupCache.hpp"
#include "zplay/supply/AcquisitionPipeline.hpp"
#include "zplay/supply/PlaybackFront.hpp"
#include "zplay/supply/RootSet.hpp"

namespace {

// Parse command-line arguments
struct ServerConfig {
  std::string server_address = "0.0.0.0:50061";
  bool enable_reflection = true;
  int workers = 3;
  size_t ready_capacity = 20;
  size_t preroll_capacity = 10;
  std::vector<std::filesystem::path> roots;
};

void PrintUsage() {
  std::cout << "zplay media supply daemon\n\n"
            << "Usage: zplayd [OPTIONS] ROOT...\n\n"
            << "Options:\n"
            << "  -p, --port PORT            Listen port (default: 50061)\n"
            << "  -a, --address ADDRESS      Full listen address (default: 0.0.0.0:50061)\n"
            << "  -w, --workers N            Engine worker threads (default: 3)\n"
            << "      --ready-capacity N     Ready queue capacity (default: 20)\n"
            << "      --preroll-capacity N   Preroll working set size (default: 10)\n"
            << "      --no-reflection        Disable gRPC server reflection\n"
            << "  -h, --help                 Show this help message\n"
            << "\nSet ZPLAY_DEBUG=1 for debug logging.\n"
            << std::endl;
}

ServerConfig ParseArgs(int argc, char** argv) {
  ServerConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
      config.server_address = std::string("0.0.0.0:") + argv[++i];
    } else if ((arg == "--address" || arg == "-a") && i + 1 < argc) {
      config.server_address = argv[++i];
    } else if ((arg == "--workers" || arg == "-w") && i + 1 < argc) {
      config.workers = std::stoi(argv[++i]);
    } else if (arg == "--ready-capacity" && i + 1 < argc) {
      config.ready_capacity = static_cast<size_t>(std::stoul(argv[++i]));
    } else if (arg == "--preroll-capacity" && i + 1 < argc) {
      config.preroll_capacity = static_cast<size_t>(std::stoul(argv[++i]));
    } else if (arg == "--no-reflection") {
      config.enable_reflection = false;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n" << std::endl;
      PrintUsage();
      std::exit(2);
    } else {
      config.roots.emplace_back(arg);
    }
  }

  return config;
}

void RunServer(const ServerConfig& config) {
  // Roots are resolved once; invalid ones are dropped with a log line.
  auto roots = std::make_shared<zplay::supply::RootSet>(
      zplay::supply::RootSet::Canonicalize(config.roots));

  zplay::engine::WorkerPoolConfig pool_config;
  pool_config.workers = config.workers;
  auto pool = zplay::engine::WorkerPool::Make(pool_config,
                                              zplay::engine::MakeFFmpegEngineFactory());

  auto dedup = std::make_shared<zplay::scan::DedupCache>();

  zplay::supply::PipelineConfig pipeline_config;
  pipeline_config.ready_capacity = config.ready_capacity;
  pipeline_config.preroll_capacity = config.preroll_capacity;
  auto pipeline = std::make_shared<zplay::supply::AcquisitionPipeline>(pipeline_config, pool,
                                                                        roots, dedup);
  auto front = std::make_shared<zplay::supply::PlaybackFront>(pipeline);

  if (!pipeline->Start()) {
    std::cerr << "Failed to start acquisition pipeline" << std::endl;
    return;
  }
  if (!front->Start()) {
    std::cerr << "Failed to start playback front" << std::endl;
    pipeline->Stop();
    return;
  }

  // Create the gRPC service (thin adapter over the pipeline and front)
  zplay::admin::AdminServiceImpl service(pipeline, pool, front);

  // Enable health checking and reflection
  grpc::EnableDefaultHealthCheckService(true);
  if (config.enable_reflection) {
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  }

  // Build the server
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Failed to listen on " << config.server_address << std::endl;
    front->Stop();
    pipeline->Stop();
    return;
  }

  std::cout << "==============================================================" << std::endl;
  std::cout << "zplay media supply" << std::endl;
  std::cout << "==============================================================" << std::endl;
  std::cout << "gRPC Server: " << config.server_address << std::endl;
  std::cout << "gRPC Health Check: Enabled" << std::endl;
  std::cout << "gRPC Reflection: " << (config.enable_reflection ? "Enabled" : "Disabled") << std::endl;
  std::cout << "Workers: " << pool->WorkerCount() << std::endl;
  std::cout << "Ready capacity: " << pipeline_config.ready_capacity << std::endl;
  std::cout << "Enabled roots: " << roots->Enabled().size() << std::endl;
  std::cout << "==============================================================" << std::endl;
  std::cout << "\nPress Ctrl+C to shutdown...\n" << std::endl;

  // Wait for the server to shutdown
  server->Wait();

  front->Stop();
  pipeline->Stop();
}

}  // namespace

int main(int argc, char** argv) {
  try {
    ServerConfig config = ParseArgs(argc, argv);
    RunServer(config);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
