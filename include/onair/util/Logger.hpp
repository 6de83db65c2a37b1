// Repository: OnAir-relay
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the supervisor, its
//          monitor threads and the gRPC handlers.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_UTIL_LOGGER_HPP_
#define ONAIR_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace onair::util {

// Logger writes one complete line per call under a single static mutex, so
// lines from monitor threads, the adaptation loop and gRPC handlers never
// interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when ONAIR_DEBUG env is set
// Warn  → stderr (degraded but recoverable: crash-restart, notifier failure)
// Error → stderr (session lost, spawn failure, invariant breach)
//
// When a log file is set, every emitted line is also appended there.
//
// Callers must never pass an unmasked stream key; use util::RedactArguments
// or util::MaskSecret first.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Opens (append) a mirror file. Returns false if it cannot be opened; the
  // console streams keep working either way. Empty path closes the mirror.
  static bool SetLogFile(const std::string& path);

  // Test-only: capture Info()/Warn()/Error() lines. nullptr clears.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static void WriteFileLocked(const char* level, const std::string& line);

  static std::mutex mutex_;
  static std::ofstream file_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace onair::util

#endif  // ONAIR_UTIL_LOGGER_HPP_
