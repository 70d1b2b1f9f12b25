// Repository: Stagegate
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission. Prevents multi-thread interleave.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_UTIL_LOGGER_HPP_
#define STAGEGATE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace stagegate::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, guaranteeing no interleave between concurrent threads
// (reviewer RPC handlers, storage workers, prune timer).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when STAGEGATE_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable conditions: retries, open circuit,
//          privileged fallback execution)
// Error → stderr (exhausted retries, failed worker tasks)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Used by tests to assert on warnings.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only: call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace stagegate::util

#endif  // STAGEGATE_UTIL_LOGGER_HPP_
