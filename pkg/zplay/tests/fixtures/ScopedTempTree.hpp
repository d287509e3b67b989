// Repository: Z-Play-supply
// Component: Scoped Temp Tree
// Purpose: Builds a throwaway directory tree of empty files for scan tests.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_TESTS_FIXTURES_SCOPED_TEMP_TREE_HPP_
#define ZPLAY_TESTS_FIXTURES_SCOPED_TEMP_TREE_HPP_

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace zplay::tests::fixtures {

// Creates a unique directory under the system temp dir and removes it (with
// everything below) on destruction. Paths passed in are relative to Root().
class ScopedTempTree {
 public:
  ScopedTempTree() {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("zplay_test_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(root_);
    // Canonical so that paths compare equal to canonicalized roots.
    root_ = std::filesystem::canonical(root_);
  }

  ~ScopedTempTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  ScopedTempTree(const ScopedTempTree&) = delete;
  ScopedTempTree& operator=(const ScopedTempTree&) = delete;

  const std::filesystem::path& Root() const { return root_; }

  std::filesystem::path AddDir(const std::filesystem::path& rel) {
    const auto path = root_ / rel;
    std::filesystem::create_directories(path);
    return path;
  }

  std::filesystem::path AddFile(const std::filesystem::path& rel) {
    const auto path = root_ / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out) {
      throw std::runtime_error("cannot create " + path.string());
    }
    return path;
  }

  // Adds `count` files named <prefix><i><ext> under `dir`.
  std::vector<std::filesystem::path> AddFiles(const std::filesystem::path& dir, int count,
                                              const std::string& prefix = "file",
                                              const std::string& ext = ".mp4") {
    std::vector<std::filesystem::path> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
      out.push_back(AddFile(dir / (prefix + std::to_string(i) + ext)));
    }
    return out;
  }

 private:
  std::filesystem::path root_;
};

}  // namespace zplay::tests::fixtures

#endif  // ZPLAY_TESTS_FIXTURES_SCOPED_TEMP_TREE_HPP_
