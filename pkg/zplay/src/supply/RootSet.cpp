// Repository: Z-Play-supply
// Component: Root Set
// Purpose: Enabled/disabled media roots, mutable at runtime.
// Copyright (c) 2025 Z-Play

#include "zplay/supply/RootSet.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <system_error>

#include "zplay/scan/MediaKind.hpp"
#include "zplay/util/Logger.hpp"

namespace fs = std::filesystem;
using zplay::util::Logger;

namespace zplay::supply {

RootSet::RootSet(std::vector<fs::path> enabled) : enabled_(std::move(enabled)) {
  disabled_.reserve(enabled_.size());
}

std::vector<fs::path> RootSet::Canonicalize(const std::vector<fs::path>& roots) {
  std::vector<fs::path> out;
  out.reserve(roots.size());
  for (const auto& root : roots) {
    std::error_code ec;
    fs::path canonical = fs::canonical(root, ec);
    if (ec) {
      std::ostringstream oss;
      oss << "[RootSet] ROOT_REMOVED path=\"" << root.string() << "\" err=" << ec.message();
      Logger::Warn(oss.str());
      continue;
    }
    if (std::find(out.begin(), out.end(), canonical) != out.end()) {
      continue;
    }
    std::ostringstream oss;
    oss << "[RootSet] ROOT_ADDED path=" << canonical.string();
    Logger::Info(oss.str());
    out.push_back(std::move(canonical));
  }
  return out;
}

std::vector<fs::path> RootSet::Enabled() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return enabled_;
}

std::vector<fs::path> RootSet::Disabled() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return disabled_;
}

std::vector<RootEntry> RootSet::List() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<RootEntry> out;
  out.reserve(enabled_.size() + disabled_.size());
  for (const auto& p : enabled_) out.push_back(RootEntry{p, true});
  for (const auto& p : disabled_) out.push_back(RootEntry{p, false});
  return out;
}

bool RootSet::HasEnabled() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return !enabled_.empty();
}

bool RootSet::IsUnderEnabled(const fs::path& path) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return std::any_of(enabled_.begin(), enabled_.end(),
                     [&path](const fs::path& root) { return scan::PathIsUnder(path, root); });
}

size_t RootSet::ApplyPatch(const std::vector<RootEntry>& patch) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  size_t moved = 0;
  for (const auto& entry : patch) {
    auto& from = entry.enabled ? disabled_ : enabled_;
    auto& to = entry.enabled ? enabled_ : disabled_;
    auto it = std::find(from.begin(), from.end(), entry.path);
    if (it == from.end()) {
      continue;
    }
    to.push_back(std::move(*it));
    from.erase(it);
    ++moved;
  }
  if (moved > 0) {
    ++generation_;
  }
  return moved;
}

uint64_t RootSet::Generation() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return generation_;
}

}  // namespace zplay::supply
