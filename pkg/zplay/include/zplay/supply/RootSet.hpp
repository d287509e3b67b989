// Repository: Z-Play-supply
// Component: Root Set
// Purpose: Enabled/disabled media roots, mutable at runtime.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SUPPLY_ROOT_SET_HPP_
#define ZPLAY_SUPPLY_ROOT_SET_HPP_

#include <cstdint>
#include <filesystem>
#include <shared_mutex>
#include <vector>

namespace zplay::supply {

struct RootEntry {
  std::filesystem::path path;
  bool enabled = true;
};

// RootSet partitions the configured roots into enabled and disabled lists.
// Readers (Discover, Preroll, eviction) take a shared lock; patches take an
// exclusive lock. Order within each list is insertion order.
class RootSet {
 public:
  explicit RootSet(std::vector<std::filesystem::path> enabled = {});

  RootSet(const RootSet&) = delete;
  RootSet& operator=(const RootSet&) = delete;

  // Canonicalizes each root. Roots that cannot be resolved are dropped with a
  // log line; duplicates after resolution are dropped silently.
  static std::vector<std::filesystem::path> Canonicalize(
      const std::vector<std::filesystem::path>& roots);

  std::vector<std::filesystem::path> Enabled() const;
  std::vector<std::filesystem::path> Disabled() const;

  // Enabled entries first, then disabled.
  std::vector<RootEntry> List() const;

  bool HasEnabled() const;

  // True if `path` lies under at least one enabled root.
  bool IsUnderEnabled(const std::filesystem::path& path) const;

  // Moves each named path to the list its `enabled` flag selects. Paths not
  // present in the opposite list are ignored. Returns the number moved.
  size_t ApplyPatch(const std::vector<RootEntry>& patch);

  // Bumped on every patch that moved at least one root.
  uint64_t Generation() const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<std::filesystem::path> enabled_;
  std::vector<std::filesystem::path> disabled_;
  uint64_t generation_ = 0;
};

}  // namespace zplay::supply

#endif  // ZPLAY_SUPPLY_ROOT_SET_HPP_
