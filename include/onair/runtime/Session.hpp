// Repository: OnAir-relay
// Component: Session
// Purpose: Stateful record of one supervised broadcast.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_RUNTIME_SESSION_HPP_
#define ONAIR_RUNTIME_SESSION_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "onair/command/SourceDescriptor.hpp"
#include "onair/process/IProcessHandle.hpp"
#include "onair/profile/Profile.hpp"
#include "onair/runtime/SessionTypes.hpp"
#include "onair/util/Cancellation.hpp"

namespace onair::runtime {

// Owned by SessionSupervisor; never handed out. Callers see SessionView.
//
// Locking:
//   op_mutex     serializes operator operations (stop, pause, resume,
//                profile swap) on this session and is held across monitor
//                joins and process termination. The monitor never takes it.
//   state_mutex  guards the mutable fields below for short critical
//                sections only; never held across a join, a spawn or a
//                Terminate().
//
// Lock order: op_mutex -> state_mutex -> supervisor registry mutex.
struct Session {
  Session(std::string id, int64_t owner_id, command::SourceDescriptor source,
          command::DestinationDescriptor destination, bool loop,
          std::string manifest_path, std::string encoder_log_path,
          uint64_t start_seq, int64_t started_utc_ms);

  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Immutable for the session's lifetime.
  const std::string id;
  const int64_t owner_id;
  const command::SourceDescriptor source;
  const command::DestinationDescriptor destination;
  const bool loop;
  const std::string manifest_path;     // Playlist sources only
  const std::string encoder_log_path;  // Empty => output discarded
  const uint64_t start_seq;            // Registry insertion order
  const int64_t started_utc_ms;

  std::mutex op_mutex;
  mutable std::mutex state_mutex;

  // Guarded by state_mutex.
  SessionStatus status = SessionStatus::kRunning;
  profile::Profile profile;
  int32_t requested_tier = 0;  // Ceiling for upward adaptation
  int32_t restart_count = 0;
  std::unique_ptr<process::IProcessHandle> process;
  util::CancellationSource monitor_cancel;
  std::thread monitor;

  // Takes state_mutex.
  SessionView View() const;

  // Requires state_mutex held.
  SessionView ViewLocked() const;
};

}  // namespace onair::runtime

#endif  // ONAIR_RUNTIME_SESSION_HPP_
