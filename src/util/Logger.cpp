// Repository: OnAir-relay
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the supervisor, its
//          monitor threads and the gRPC handlers.
// Copyright (c) 2026 OnAir

#include "onair/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace onair::util {

std::mutex Logger::mutex_;
std::ofstream Logger::file_;
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

namespace {

std::string TimestampUtc() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count();
  const time_t s = static_cast<time_t>(ms / 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[32];
  const int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                              tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                              tm.tm_hour, tm.tm_min, tm.tm_sec,
                              static_cast<int>(ms % 1000));
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  if (path.empty()) {
    return true;
  }
  file_.open(path, std::ios::out | std::ios::app);
  return file_.is_open();
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::WriteFileLocked(const char* level, const std::string& line) {
  if (!file_.is_open()) return;
  file_ << TimestampUtc() << " | " << level << " | " << line << '\n';
  file_.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
  WriteFileLocked("INFO", line);
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("ONAIR_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
  WriteFileLocked("DEBUG", line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
  WriteFileLocked("WARN", line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
  WriteFileLocked("ERROR", line);
}

}  // namespace onair::util
