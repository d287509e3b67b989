// Repository: Z-Play-supply
// Component: Random File Sampler
// Purpose: Uniform random leaf-file selection over directory trees within a
//          time budget.
// Copyright (c) 2025 Z-Play

#include "zplay/scan/RandomFileSampler.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

#include "zplay/util/Logger.hpp"

namespace fs = std::filesystem;
using zplay::util::Logger;

namespace zplay::scan {

namespace {

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

// Directory work shared by the traversal threads of one root.
struct DirWork {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<fs::path> pending;
  int active = 0;
};

}  // namespace

ScanResult Combine(ScanResult a, ScanResult b, std::mt19937_64& rng) {
  if (a.count == 0 && b.count == 0) {
    return ScanResult{};
  }
  if (a.count == 0) {
    return b;
  }
  if (b.count == 0) {
    return a;
  }

  const uint64_t max = std::numeric_limits<uint64_t>::max();
  const uint64_t total = (a.count > max - b.count) ? max : a.count + b.count;

  std::uniform_int_distribution<uint64_t> dist(0, total - 1);
  if (dist(rng) < a.count) {
    a.count = total;
    return a;
  }
  b.count = total;
  return b;
}

ScanResult Combine(ScanResult a, ScanResult b) {
  return Combine(std::move(a), std::move(b), ThreadRng());
}

RandomFileSampler::RandomFileSampler(SamplerConfig config) : config_(config) {}

bool RandomFileSampler::ScanControl::Expired() {
  if (cancel.load(std::memory_order_relaxed)) {
    return true;
  }
  if ((abort && abort->load(std::memory_order_relaxed)) || Clock::now() >= deadline) {
    cancel.store(true, std::memory_order_relaxed);
    return true;
  }
  return false;
}

int RandomFileSampler::WalkerCount() const {
  if (config_.walkers_per_root > 0) {
    return config_.walkers_per_root;
  }
  const int hw = static_cast<int>(std::thread::hardware_concurrency());
  return std::clamp(hw, 2, 8);
}

std::optional<fs::path> RandomFileSampler::Sample(
    const std::vector<fs::path>& roots) const {
  return Sample(roots, std::chrono::seconds(2), std::chrono::seconds(1));
}

std::optional<fs::path> RandomFileSampler::Sample(
    const std::vector<fs::path>& roots,
    std::chrono::milliseconds scan_timeout,
    std::chrono::milliseconds busy_timeout,
    const std::atomic<bool>* abort) const {
  if (roots.empty()) {
    return std::nullopt;
  }

  ScanControl control;
  control.deadline = Clock::now() + scan_timeout;
  control.busy_timeout = busy_timeout;
  control.abort = abort;

  std::vector<ScanResult> partials(roots.size());
  std::vector<std::thread> threads;
  threads.reserve(roots.size());

  for (size_t i = 0; i < roots.size(); ++i) {
    if (control.Expired()) {
      break;
    }
    threads.emplace_back([this, &roots, &partials, &control, i] {
      partials[i] = ScanRoot(roots[i], control);
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  ScanResult result;
  for (auto& partial : partials) {
    result = Combine(std::move(result), std::move(partial));
  }

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[Sampler] SCAN_DONE roots=" << roots.size()
        << " leaves=" << result.count
        << " cancelled=" << (control.cancel.load() ? 1 : 0)
        << " selected=" << (result.selected ? result.selected->string() : "none");
    Logger::Debug(oss.str());
  }

  return result.selected;
}

ScanResult RandomFileSampler::ScanRoot(const fs::path& root, ScanControl& control) const {
  if (control.Expired()) {
    return ScanResult{};
  }

  std::error_code ec;
  const fs::file_status status = fs::status(root, ec);
  if (ec || !fs::exists(status)) {
    std::ostringstream oss;
    oss << "[Sampler] ROOT_SKIPPED root=" << root.string()
        << " err=" << (ec ? ec.message() : "missing");
    Logger::Debug(oss.str());
    return ScanResult{};
  }
  if (!fs::is_directory(status)) {
    return ScanResult{root, 1};
  }

  DirWork work;
  work.pending.push_back(root);

  const int walkers = WalkerCount();
  std::vector<ScanResult> locals(static_cast<size_t>(walkers));
  std::vector<std::thread> threads;
  threads.reserve(locals.size());

  auto walk = [&work, &control](ScanResult& local) {
    std::mt19937_64& rng = ThreadRng();
    while (true) {
      fs::path dir;
      {
        std::unique_lock<std::mutex> lock(work.mutex);
        const auto idle_until = std::min(Clock::now() + control.busy_timeout, control.deadline);
        const bool has_work = work.cv.wait_until(lock, idle_until, [&work, &control] {
          return !work.pending.empty() || work.active == 0 ||
                 control.cancel.load(std::memory_order_relaxed);
        });
        if (!has_work || work.pending.empty() || control.Expired()) {
          work.cv.notify_all();
          return;
        }
        dir = std::move(work.pending.front());
        work.pending.pop_front();
        ++work.active;
      }

      std::error_code iter_ec;
      fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, iter_ec);
      if (iter_ec) {
        std::ostringstream oss;
        oss << "[Sampler] DIR_SKIPPED dir=" << dir.string() << " err=" << iter_ec.message();
        Logger::Debug(oss.str());
      }
      for (; !iter_ec && it != fs::directory_iterator(); it.increment(iter_ec)) {
        if (control.Expired()) {
          break;
        }
        std::error_code entry_ec;
        const bool is_dir = it->is_directory(entry_ec) && !it->is_symlink(entry_ec);
        if (entry_ec) {
          continue;
        }
        if (is_dir) {
          {
            std::lock_guard<std::mutex> lock(work.mutex);
            work.pending.push_back(it->path());
          }
          work.cv.notify_one();
        } else {
          local = Combine(std::move(local), ScanResult{it->path(), 1}, rng);
        }
      }

      {
        std::lock_guard<std::mutex> lock(work.mutex);
        --work.active;
      }
      work.cv.notify_all();
    }
  };

  for (auto& local : locals) {
    threads.emplace_back(walk, std::ref(local));
  }
  for (auto& t : threads) {
    t.join();
  }

  ScanResult result;
  for (auto& local : locals) {
    result = Combine(std::move(result), std::move(local));
  }
  return result;
}

}  // namespace zplay::scan
