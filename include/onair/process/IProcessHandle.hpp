// Repository: OnAir-relay
// Component: Process Handle Interface
// Purpose: Spawn / wait / terminate / suspend contract for one external
//          encoder process and everything it spawned.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_PROCESS_IPROCESS_HANDLE_HPP_
#define ONAIR_PROCESS_IPROCESS_HANDLE_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "onair/util/Cancellation.hpp"

namespace onair::process {

struct ExitStatus {
  int exit_code = -1;    // Valid when !signaled
  int term_signal = 0;   // Valid when signaled
  bool signaled = false;

  std::string ToString() const {
    if (signaled) return "signal " + std::to_string(term_signal);
    return "exit " + std::to_string(exit_code);
  }
};

enum class SignalStatus {
  kOk,
  kUnsupported,  // Platform has no suspend/continue semantics
  kNotRunning,   // Process already exited
  kFailed,       // kill(2) failed
};

const char* SignalStatusToString(SignalStatus s);

// Owns one running process group. Implementations are thread-safe: the
// monitor thread may sit in Wait() while an operator thread calls
// Terminate() or Suspend().
class IProcessHandle {
 public:
  virtual ~IProcessHandle() = default;

  // Blocks until the process exits or `token` is cancelled. Returns nullopt
  // on cancellation; cancelling never signals the process.
  virtual std::optional<ExitStatus> Wait(const util::CancellationToken& token) = 0;

  // Graceful stop of the whole group, forceful after `timeout`. Returns once
  // the process has been reaped. No-op on an exited handle.
  virtual void Terminate(std::chrono::milliseconds timeout) = 0;

  virtual SignalStatus Suspend() = 0;
  virtual SignalStatus Continue() = 0;

  virtual bool HasExited() const = 0;
  virtual int Pid() const = 0;
};

enum class SpawnStatus {
  kOk,
  kSpawnError,  // Binary missing or could not be launched
};

struct SpawnResult {
  SpawnStatus status;
  std::string message;
  std::unique_ptr<IProcessHandle> handle;

  static SpawnResult Success(std::unique_ptr<IProcessHandle> h) {
    return {SpawnStatus::kOk, "", std::move(h)};
  }
  static SpawnResult Failure(std::string msg) {
    return {SpawnStatus::kSpawnError, std::move(msg), nullptr};
  }
};

// Seam between the supervisor and the OS. Production uses PosixProcessLauncher;
// tests inject a scripted fake.
class IProcessLauncher {
 public:
  virtual ~IProcessLauncher() = default;

  // args[0] is the program (looked up in PATH). Output goes to `log_path`
  // (appended) or is discarded when empty.
  virtual SpawnResult Spawn(const std::vector<std::string>& args,
                            const std::string& log_path) = 0;
};

}  // namespace onair::process

#endif  // ONAIR_PROCESS_IPROCESS_HANDLE_HPP_
