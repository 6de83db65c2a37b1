// Repository: OnAir-relay
// Component: POSIX Process Handle
// Purpose: fork/exec an encoder in its own session and process group, reap
//          it on a dedicated thread, signal the group as a unit.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_PROCESS_POSIX_PROCESS_HPP_
#define ONAIR_PROCESS_POSIX_PROCESS_HPP_

#include <sys/types.h>

#include <condition_variable>
#include <mutex>
#include <thread>

#include "onair/process/IProcessHandle.hpp"

namespace onair::process {

class PosixProcessHandle : public IProcessHandle {
 public:
  // Takes ownership of an already-forked child that called setsid().
  explicit PosixProcessHandle(pid_t pid);
  ~PosixProcessHandle() override;

  PosixProcessHandle(const PosixProcessHandle&) = delete;
  PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

  std::optional<ExitStatus> Wait(const util::CancellationToken& token) override;
  void Terminate(std::chrono::milliseconds timeout) override;
  SignalStatus Suspend() override;
  SignalStatus Continue() override;
  bool HasExited() const override;
  int Pid() const override { return static_cast<int>(pid_); }

  // Upper bound on how long Wait() takes to notice a cancellation.
  static constexpr std::chrono::milliseconds kWaitPollInterval{25};

  // Used by the destructor when the owner never terminated the process.
  static constexpr std::chrono::milliseconds kDestructorTerminateTimeout{2000};

 private:
  void ReaperLoop();
  SignalStatus SignalGroup(int sig);

  const pid_t pid_;
  mutable std::mutex mutex_;
  std::condition_variable exited_cv_;
  bool exited_ = false;
  ExitStatus exit_status_;
  std::thread reaper_;
};

class PosixProcessLauncher : public IProcessLauncher {
 public:
  SpawnResult Spawn(const std::vector<std::string>& args,
                    const std::string& log_path) override;
};

}  // namespace onair::process

#endif  // ONAIR_PROCESS_POSIX_PROCESS_HPP_
