// Repository: Z-Play-supply
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by stage loops and engine workers.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_UTIL_LOGGER_HPP_
#define ZPLAY_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace zplay::util {

// Logger writes whole lines under a single static mutex so that lines from the
// Discover/Preroll/Ready threads, the engine workers and gRPC handlers never
// interleave.
//
// Info  -> stdout
// Debug -> stdout only when ZPLAY_DEBUG is set
// Warn  -> stderr (discarded candidates, skipped entries)
// Error -> stderr (broken invariants, hard faults)
//
// Test-only: SetInfoSink / SetErrorSink install a callback invoked for every
// Info() / Error() line in addition to the stream. Pass nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace zplay::util

#endif  // ZPLAY_UTIL_LOGGER_HPP_
