// Repository: Z-Play-supply
// Component: Engine Worker Pool
// Purpose: Fixed set of worker threads that own live media engines and execute
//          every command for an engine on that engine's worker.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_ENGINE_WORKER_POOL_HPP_
#define ZPLAY_ENGINE_WORKER_POOL_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

#include "zplay/engine/EngineHandle.hpp"
#include "zplay/engine/EngineTypes.hpp"
#include "zplay/engine/IMediaEngine.hpp"
#include "zplay/util/Channel.hpp"

namespace zplay::engine {

struct WorkerPoolConfig {
  int workers = 3;
  EngineConfig engine;
  // Receive timeout of a worker's command loop; engines are pumped at least
  // this often.
  std::chrono::milliseconds pump_interval{10};
};

// WorkerPool is a shared service object. Threads start on the first Create()
// and run until the pool is destroyed; handles keep the pool alive.
//
// Routing: Create() assigns the next worker round-robin and records
// EngineId -> worker in the routing table. Every later command for that id is
// sent to the same worker, so no engine is ever touched by two threads.
//
// A command for an id missing from the routing table is a broken invariant
// and aborts the process.
class WorkerPool : public std::enable_shared_from_this<WorkerPool> {
 public:
  static std::shared_ptr<WorkerPool> Make(WorkerPoolConfig config, EngineFactory factory);

  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Registers a new engine for `path` on the next worker. Construction runs on
  // the worker; a failed construction arrives as an Error event.
  EngineHandle Create(const std::filesystem::path& path);

  bool Started() const { return started_.load(std::memory_order_acquire); }
  int WorkerCount() const { return static_cast<int>(config_.workers); }

  // Engines currently in the routing table.
  size_t EngineCount() const;

  // Routing-table entries per worker index.
  std::vector<size_t> EnginesPerWorker() const;

  // Id-addressed commands. EngineHandle is the usual caller; an id that is
  // not in the routing table is fatal.
  std::future<EngineResult> SetState(EngineId id, LifecycleState target);
  std::future<EngineResult> Seek(EngineId id, std::chrono::milliseconds position,
                                 std::optional<double> rate);
  void Resize(EngineId id, int width, int height);
  // Drops the routing entry and tears the engine down on its worker.
  void Remove(EngineId id);

 private:
  friend class EngineHandle;

  struct AddCmd {
    EngineId id;
    std::filesystem::path path;
    std::shared_ptr<EngineCell> cell;
  };
  struct RemoveCmd {
    EngineId id;
  };
  struct SetStateCmd {
    EngineId id;
    LifecycleState target;
    std::shared_ptr<std::promise<EngineResult>> reply;
  };
  struct SeekCmd {
    EngineId id;
    std::chrono::milliseconds position;
    std::optional<double> rate;
    std::shared_ptr<std::promise<EngineResult>> reply;
  };
  struct ResizeCmd {
    EngineId id;
    int width;
    int height;
  };
  struct ShutdownCmd {};

  using Command = std::variant<AddCmd, RemoveCmd, SetStateCmd, SeekCmd, ResizeCmd, ShutdownCmd>;

  struct Worker {
    Worker(util::Sender<Command> tx, util::Receiver<Command> rx)
        : commands(std::move(tx)), inbox(std::move(rx)) {}

    util::Sender<Command> commands;
    util::Receiver<Command> inbox;
    std::thread thread;
  };

  // What a worker keeps for each engine it owns.
  struct Owned {
    std::unique_ptr<IMediaEngine> engine;
    std::shared_ptr<EngineCell> cell;
  };

  WorkerPool(WorkerPoolConfig config, EngineFactory factory);

  void StartWorkers();
  void WorkerLoop(size_t index);

  // Looks up the owning worker (fatal if unknown) and sends `cmd` to it.
  // erase=true also drops the routing entry under the same lock.
  void Dispatch(EngineId id, Command cmd, bool erase = false);

  // Worker-side command execution.
  void HandleAdd(size_t index, std::unordered_map<EngineId, Owned>& owned, AddCmd& cmd);
  void HandleRemove(size_t index, std::unordered_map<EngineId, Owned>& owned, const RemoveCmd& cmd);
  void HandleSetState(size_t index, std::unordered_map<EngineId, Owned>& owned, SetStateCmd& cmd);
  void HandleSeek(size_t index, std::unordered_map<EngineId, Owned>& owned, SeekCmd& cmd);
  void HandleResize(size_t index, std::unordered_map<EngineId, Owned>& owned, const ResizeCmd& cmd);

  static void InstallObserver(EngineId id, IMediaEngine& engine,
                              const std::shared_ptr<EngineCell>& cell);

  [[noreturn]] static void FatalUnknownEngine(const char* where, EngineId id);

  const WorkerPoolConfig config_;
  const EngineFactory factory_;

  std::once_flag start_once_;
  std::atomic<bool> started_{false};
  std::vector<std::unique_ptr<Worker>> workers_;

  std::atomic<EngineId> next_id_{1};
  std::atomic<size_t> next_index_{0};

  mutable std::mutex routing_mutex_;
  std::unordered_map<EngineId, size_t> routing_;
};

}  // namespace zplay::engine

#endif  // ZPLAY_ENGINE_WORKER_POOL_HPP_
