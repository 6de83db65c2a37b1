// Repository: OnAir-relay
// Component: Fake Process Launcher
// Purpose: Test adapter for the encoder launcher in supervisor contract tests.
// Copyright (c) 2026 OnAir
//
// Scriptable stand-in for the POSIX launcher. Handles never run anything:
// a test "kills" one from outside to simulate an encoder crash, and can make
// spawns fail or suspend unsupported.

#ifndef ONAIR_TESTS_FIXTURES_FAKE_PROCESS_LAUNCHER_HPP_
#define ONAIR_TESTS_FIXTURES_FAKE_PROCESS_LAUNCHER_HPP_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "onair/process/IProcessHandle.hpp"

namespace onair::tests::fixtures {

// Shared between the handle the supervisor owns and the test.
class FakeProcess {
 public:
  FakeProcess(int pid, bool suspend_supported)
      : pid_(pid), suspend_supported_(suspend_supported) {}

  int Pid() const { return pid_; }

  // Simulates the encoder dying on its own (crash, external kill -9).
  void KillExternally(int sig = 9) { Exit(true, sig, -1); }
  void ExitWithCode(int code) { Exit(false, 0, code); }

  bool HasExited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
  }
  bool WasTerminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_;
  }
  bool IsSuspended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suspended_;
  }

  std::optional<process::ExitStatus> Wait(const util::CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!exited_) {
      if (token.IsCancellationRequested()) return std::nullopt;
      cv_.wait_for(lock, std::chrono::milliseconds(2));
    }
    return status_;
  }

  void Terminate() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (exited_) return;
      terminated_ = true;
    }
    Exit(true, 15, -1);
  }

  process::SignalStatus Signal(bool suspend) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!suspend_supported_) return process::SignalStatus::kUnsupported;
    if (exited_) return process::SignalStatus::kNotRunning;
    suspended_ = suspend;
    return process::SignalStatus::kOk;
  }

 private:
  void Exit(bool signaled, int sig, int code) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (exited_) return;
      exited_ = true;
      status_.signaled = signaled;
      status_.term_signal = sig;
      status_.exit_code = code;
    }
    cv_.notify_all();
  }

  const int pid_;
  const bool suspend_supported_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool exited_ = false;
  bool terminated_ = false;
  bool suspended_ = false;
  process::ExitStatus status_;
};

class FakeProcessHandle : public process::IProcessHandle {
 public:
  explicit FakeProcessHandle(std::shared_ptr<FakeProcess> p) : p_(std::move(p)) {}

  std::optional<process::ExitStatus> Wait(const util::CancellationToken& token) override {
    return p_->Wait(token);
  }
  void Terminate(std::chrono::milliseconds) override { p_->Terminate(); }
  process::SignalStatus Suspend() override { return p_->Signal(true); }
  process::SignalStatus Continue() override { return p_->Signal(false); }
  bool HasExited() const override { return p_->HasExited(); }
  int Pid() const override { return p_->Pid(); }

 private:
  std::shared_ptr<FakeProcess> p_;
};

class FakeProcessLauncher : public process::IProcessLauncher {
 public:
  using Args = std::vector<std::string>;

  process::SpawnResult Spawn(const Args& args, const std::string& log_path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.push_back(args);
    if (fail_all_ || (fail_when_ && fail_when_(args))) {
      return process::SpawnResult::Failure("cannot execute '" + args.at(0) +
                                           "': No such file or directory");
    }
    auto p = std::make_shared<FakeProcess>(next_pid_++, suspend_supported_);
    processes_.push_back(p);
    spawned_args_.push_back(args);
    log_paths_.push_back(log_path);
    return process::SpawnResult::Success(std::make_unique<FakeProcessHandle>(p));
  }

  void SetFailAll(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_all_ = fail;
  }
  void SetFailWhen(std::function<bool(const Args&)> pred) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_when_ = std::move(pred);
  }
  void SetSuspendSupported(bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    suspend_supported_ = supported;
  }

  size_t SpawnAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_.size();
  }
  size_t SpawnCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
  }
  std::shared_ptr<FakeProcess> Process(size_t i) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.at(i);
  }
  std::shared_ptr<FakeProcess> Latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.empty() ? nullptr : processes_.back();
  }
  Args ArgsAt(size_t i) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spawned_args_.at(i);
  }
  Args LastArgs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spawned_args_.empty() ? Args{} : spawned_args_.back();
  }
  std::string LastLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_paths_.empty() ? "" : log_paths_.back();
  }

  // Value following `flag` in `args`, or "" when absent.
  static std::string ValueAfter(const Args& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || std::next(it) == args.end()) return "";
    return *std::next(it);
  }

  static bool Contains(const Args& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Args> attempts_;
  std::vector<Args> spawned_args_;
  std::vector<std::string> log_paths_;
  std::vector<std::shared_ptr<FakeProcess>> processes_;
  std::function<bool(const Args&)> fail_when_;
  bool fail_all_ = false;
  bool suspend_supported_ = true;
  int next_pid_ = 40001;
};

}  // namespace onair::tests::fixtures

#endif  // ONAIR_TESTS_FIXTURES_FAKE_PROCESS_LAUNCHER_HPP_
