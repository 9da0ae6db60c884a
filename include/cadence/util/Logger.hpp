// Repository: Cadence
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission: prevents tick-thread and console
//          output from interleaving mid-line.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_UTIL_LOGGER_HPP_
#define CADENCE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace cadence::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines never interleave between the console thread and the
// TickScheduler worker.
//
// Info  → stdout (console output, emitted blocks)
// Debug → stdout only when CADENCE_DEBUG env is set (transitions, rejections)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (engine failures on the tick thread, bugs)
//
// Test-only: SetInfoSink / SetErrorSink install a callback invoked for every
// Info() / Error() line (in addition to the stream).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Writes without the trailing newline (console prompt).
  static void Prompt(const std::string& text);

  // Test-only: capture lines. Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace cadence::util

#endif  // CADENCE_UTIL_LOGGER_HPP_
