// Repository: Z-Play-supply
// Component: Engine Worker Pool
// Purpose: Fixed set of worker threads that own live media engines and execute
//          every command for an engine on that engine's worker.
// Copyright (c) 2025 Z-Play

#include "zplay/engine/WorkerPool.hpp"

#include <cstdlib>
#include <sstream>
#include <type_traits>

#include "zplay/util/Logger.hpp"

using zplay::util::Logger;

namespace zplay::engine {

std::shared_ptr<WorkerPool> WorkerPool::Make(WorkerPoolConfig config, EngineFactory factory) {
  return std::shared_ptr<WorkerPool>(new WorkerPool(std::move(config), std::move(factory)));
}

WorkerPool::WorkerPool(WorkerPoolConfig config, EngineFactory factory)
    : config_([&config] {
        if (config.workers < 1) config.workers = 1;
        return config;
      }()),
      factory_(std::move(factory)) {
  workers_.reserve(static_cast<size_t>(config_.workers));
  for (int i = 0; i < config_.workers; ++i) {
    auto [tx, rx] = util::MakeChannel<Command>(util::kUnbounded);
    workers_.push_back(std::make_unique<Worker>(std::move(tx), std::move(rx)));
  }
}

WorkerPool::~WorkerPool() {
  if (!started_.load(std::memory_order_acquire)) {
    return;
  }
  for (auto& worker : workers_) {
    worker->commands.Send(ShutdownCmd{});
  }
  for (auto& worker : workers_) {
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
  }
}

void WorkerPool::StartWorkers() {
  for (size_t i = 0; i < workers_.size(); ++i) {
    workers_[i]->thread = std::thread(&WorkerPool::WorkerLoop, this, i);
  }
  started_.store(true, std::memory_order_release);

  std::ostringstream oss;
  oss << "[WorkerPool] STARTED workers=" << workers_.size();
  Logger::Info(oss.str());
}

EngineHandle WorkerPool::Create(const std::filesystem::path& path) {
  std::call_once(start_once_, [this] { StartWorkers(); });

  const EngineId id = next_id_.fetch_add(1, std::memory_order_relaxed);
  const size_t index = next_index_.fetch_add(1, std::memory_order_relaxed) % workers_.size();

  auto [events_tx, events_rx] = util::MakeChannel<EngineEvent>(util::kUnbounded);
  auto cell = std::make_shared<EngineCell>(std::move(events_tx));

  {
    std::lock_guard<std::mutex> lock(routing_mutex_);
    routing_[id] = index;
  }
  workers_[index]->commands.Send(AddCmd{id, path, cell});

  {
    std::ostringstream oss;
    oss << "[WorkerPool] ENGINE_CREATED id=" << id << " worker=" << index
        << " path=" << path.string();
    Logger::Debug(oss.str());
  }

  return EngineHandle(std::make_shared<EngineHandle::Core>(
      shared_from_this(), id, path, std::move(cell), std::move(events_rx)));
}

size_t WorkerPool::EngineCount() const {
  std::lock_guard<std::mutex> lock(routing_mutex_);
  return routing_.size();
}

std::vector<size_t> WorkerPool::EnginesPerWorker() const {
  std::vector<size_t> counts(workers_.size(), 0);
  std::lock_guard<std::mutex> lock(routing_mutex_);
  for (const auto& [id, index] : routing_) {
    ++counts[index];
  }
  return counts;
}

void WorkerPool::FatalUnknownEngine(const char* where, EngineId id) {
  std::ostringstream oss;
  oss << "[WorkerPool] FATAL " << where << ": engine not found id=" << id
      << " (routing table and engine lifetime out of sync)";
  Logger::Error(oss.str());
  std::abort();
}

void WorkerPool::Dispatch(EngineId id, Command cmd, bool erase) {
  size_t index = 0;
  {
    std::lock_guard<std::mutex> lock(routing_mutex_);
    auto it = routing_.find(id);
    if (it == routing_.end()) {
      FatalUnknownEngine("Dispatch", id);
    }
    index = it->second;
    if (erase) {
      routing_.erase(it);
    }
  }
  workers_[index]->commands.Send(std::move(cmd));
}

std::future<EngineResult> WorkerPool::SetState(EngineId id, LifecycleState target) {
  auto reply = std::make_shared<std::promise<EngineResult>>();
  auto future = reply->get_future();
  Dispatch(id, SetStateCmd{id, target, std::move(reply)});
  return future;
}

std::future<EngineResult> WorkerPool::Seek(EngineId id, std::chrono::milliseconds position,
                                           std::optional<double> rate) {
  auto reply = std::make_shared<std::promise<EngineResult>>();
  auto future = reply->get_future();
  Dispatch(id, SeekCmd{id, position, rate, std::move(reply)});
  return future;
}

void WorkerPool::Resize(EngineId id, int width, int height) {
  Dispatch(id, ResizeCmd{id, width, height});
}

void WorkerPool::Remove(EngineId id) {
  Dispatch(id, RemoveCmd{id}, /*erase=*/true);
}

// =============================================================================
// Worker side
// =============================================================================

void WorkerPool::WorkerLoop(size_t index) {
  std::unordered_map<EngineId, Owned> owned;
  auto& inbox = workers_[index]->inbox;

  while (true) {
    Command cmd{ShutdownCmd{}};
    const util::RecvStatus status = inbox.RecvTimeout(config_.pump_interval, cmd);
    if (status == util::RecvStatus::kDisconnected) {
      break;
    }

    if (status == util::RecvStatus::kOk) {
      if (std::holds_alternative<ShutdownCmd>(cmd)) {
        break;
      }
      std::visit(
          [this, index, &owned](auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, AddCmd>) {
              HandleAdd(index, owned, c);
            } else if constexpr (std::is_same_v<T, RemoveCmd>) {
              HandleRemove(index, owned, c);
            } else if constexpr (std::is_same_v<T, SetStateCmd>) {
              HandleSetState(index, owned, c);
            } else if constexpr (std::is_same_v<T, SeekCmd>) {
              HandleSeek(index, owned, c);
            } else if constexpr (std::is_same_v<T, ResizeCmd>) {
              HandleResize(index, owned, c);
            }
          },
          cmd);
    }

    for (auto& [id, entry] : owned) {
      if (entry.engine) {
        entry.engine->Pump();
        entry.cell->SetProgress(entry.engine->Position(), entry.engine->Duration());
      }
    }
  }

  // Pool teardown: engines still owned here have no handles left that could
  // observe them.
  for (auto& [id, entry] : owned) {
    if (entry.engine) {
      entry.engine->SetObserver(nullptr);
      const EngineResult result = entry.engine->SetState(LifecycleState::kNull);
      if (!result.success) {
        std::ostringstream oss;
        oss << "[WorkerPool] ENGINE_TEARDOWN_FAILED id=" << id << " msg=" << result.message;
        Logger::Warn(oss.str());
      }
    }
  }

  std::ostringstream oss;
  oss << "[WorkerPool] WORKER_EXIT index=" << index << " engines_left=" << owned.size();
  Logger::Debug(oss.str());
}

void WorkerPool::InstallObserver(EngineId id, IMediaEngine& engine,
                                 const std::shared_ptr<EngineCell>& cell) {
  // The watch holds the cell weakly so a torn-down engine never keeps it alive.
  std::weak_ptr<EngineCell> weak_cell = cell;
  auto watching = std::make_shared<bool>(true);

  engine.SetObserver([id, weak_cell, watching](const EngineMessage& msg) {
    if (!*watching) return;
    auto cell = weak_cell.lock();
    if (!cell) return;

    if (msg.type == EngineMessage::Type::kNewSample) {
      cell->SetFrame(msg.frame);
      return;
    }
    if (msg.source != EngineMessage::Source::kPipeline) {
      return;
    }

    bool delivered = true;
    switch (msg.type) {
      case EngineMessage::Type::kStateChanged:
        cell->SetState(msg.to);
        delivered = cell->Publish(EngineEvent::StateChanged(msg.from, msg.to));
        break;
      case EngineMessage::Type::kEndOfStream:
        delivered = cell->Publish(EngineEvent::EndOfStream());
        break;
      case EngineMessage::Type::kError: {
        std::ostringstream err;
        err << "Error on pipeline: " << msg.text << " (debug: " << msg.debug << ")";
        delivered = cell->Publish(EngineEvent::Error(err.str()));
        break;
      }
      case EngineMessage::Type::kNewSample:
        break;
    }

    if (!delivered) {
      *watching = false;
      std::ostringstream oss;
      oss << "[WorkerPool] WATCH_REMOVED id=" << id << " reason=no_subscribers";
      Logger::Debug(oss.str());
    }
  });
}

void WorkerPool::HandleAdd(size_t index, std::unordered_map<EngineId, Owned>& owned,
                           AddCmd& cmd) {
  Owned entry;
  entry.cell = cmd.cell;
  entry.engine = factory_ ? factory_(cmd.path, config_.engine) : nullptr;

  if (!entry.engine) {
    std::ostringstream oss;
    oss << "[WorkerPool] ENGINE_CONSTRUCT_FAILED id=" << cmd.id << " worker=" << index
        << " path=" << cmd.path.string();
    Logger::Warn(oss.str());
    entry.cell->Publish(EngineEvent::Error(
        "Error on pipeline: failed to construct engine (debug: " + cmd.path.string() + ")"));
  } else {
    InstallObserver(cmd.id, *entry.engine, entry.cell);
    entry.cell->SetState(entry.engine->CurrentState());
  }

  owned.emplace(cmd.id, std::move(entry));
}

void WorkerPool::HandleRemove(size_t index, std::unordered_map<EngineId, Owned>& owned,
                              const RemoveCmd& cmd) {
  auto it = owned.find(cmd.id);
  if (it == owned.end()) {
    FatalUnknownEngine("Remove", cmd.id);
  }
  if (it->second.engine) {
    const EngineResult result = it->second.engine->SetState(LifecycleState::kNull);
    if (!result.success) {
      std::ostringstream oss;
      oss << "[WorkerPool] ENGINE_TEARDOWN_FAILED id=" << cmd.id << " msg=" << result.message;
      Logger::Warn(oss.str());
    }
    it->second.engine->SetObserver(nullptr);
  }
  owned.erase(it);

  std::ostringstream oss;
  oss << "[WorkerPool] ENGINE_REMOVED id=" << cmd.id << " worker=" << index;
  Logger::Debug(oss.str());
}

void WorkerPool::HandleSetState(size_t /*index*/, std::unordered_map<EngineId, Owned>& owned,
                                SetStateCmd& cmd) {
  auto it = owned.find(cmd.id);
  if (it == owned.end()) {
    FatalUnknownEngine("SetState", cmd.id);
  }
  if (!it->second.engine) {
    cmd.reply->set_value(EngineResult::Fail("engine unavailable"));
    return;
  }
  EngineResult result = it->second.engine->SetState(cmd.target);
  it->second.cell->SetState(it->second.engine->CurrentState());
  it->second.cell->SetProgress(it->second.engine->Position(), it->second.engine->Duration());
  cmd.reply->set_value(std::move(result));
}

void WorkerPool::HandleSeek(size_t /*index*/, std::unordered_map<EngineId, Owned>& owned,
                            SeekCmd& cmd) {
  auto it = owned.find(cmd.id);
  if (it == owned.end()) {
    FatalUnknownEngine("Seek", cmd.id);
  }
  if (!it->second.engine) {
    cmd.reply->set_value(EngineResult::Fail("engine unavailable"));
    return;
  }
  EngineResult result = it->second.engine->Seek(cmd.position, cmd.rate);
  it->second.cell->SetProgress(it->second.engine->Position(), it->second.engine->Duration());
  cmd.reply->set_value(std::move(result));
}

void WorkerPool::HandleResize(size_t /*index*/, std::unordered_map<EngineId, Owned>& owned,
                              const ResizeCmd& cmd) {
  auto it = owned.find(cmd.id);
  if (it == owned.end()) {
    FatalUnknownEngine("Resize", cmd.id);
  }
  if (it->second.engine) {
    it->second.engine->Resize(cmd.width, cmd.height);
  }
}

}  // namespace zplay::engine
