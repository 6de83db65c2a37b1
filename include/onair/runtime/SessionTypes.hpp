// Repository: OnAir-relay
// Component: Session Types
// Purpose: Status, error taxonomy, request/result and read-only view types
//          shared by the supervisor and its callers.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_RUNTIME_SESSION_TYPES_HPP_
#define ONAIR_RUNTIME_SESSION_TYPES_HPP_

#include <cstdint>
#include <string>

#include "onair/command/SourceDescriptor.hpp"

namespace onair::runtime {

// running -> {paused, stopping, crashed}
// paused  -> {running, stopping}
// stopping -> stopped
// stopped and crashed are terminal and never held in the live registry.
enum class SessionStatus {
  kRunning,
  kPaused,
  kStopping,
  kStopped,
  kCrashed,
};

const char* SessionStatusToString(SessionStatus s);

// Throws std::invalid_argument for an unknown name.
SessionStatus SessionStatusFromString(const std::string& name);

bool IsTerminal(SessionStatus s);

enum class SupervisorError {
  kNone,
  kConfigurationMissing,     // No destination configured
  kSpawnError,               // Encoder binary missing or unlaunchable
  kUnsupportedSourceKind,    // Source variant not modelled by the builder
  kUnsupportedOperation,     // Suspend/continue unavailable on this platform
  kAlreadyRunning,           // Single-session-per-owner violated
  kEmptyQueue,               // Playlist has no unplayed items
  kRestartCeilingExceeded,   // Session crashed for good
  kNotFound,                 // Unknown session id (or already terminal)
  kInvalidState,             // Operation not valid from the current status
};

const char* SupervisorErrorToString(SupervisorError e);

enum class StartTrigger {
  kOperator,  // Command from the owner
  kInternal,  // Boot-time auto-start and other internal callers
};

struct StartRequest {
  int64_t owner_id = 0;
  command::SourceDescriptor source;
  command::DestinationDescriptor destination;  // Empty endpoint => configured default
  int32_t tier = 0;                           // 0 => configured default tier
  bool loop = false;
};

struct StartResult {
  bool success;
  SupervisorError error;
  std::string message;
  std::string session_id;

  static StartResult Success(std::string id) {
    return {true, SupervisorError::kNone, "", std::move(id)};
  }
  static StartResult Failure(SupervisorError e, std::string msg) {
    return {false, e, std::move(msg), ""};
  }
};

struct OperationResult {
  bool success;
  SupervisorError error;
  std::string message;

  static OperationResult Success() { return {true, SupervisorError::kNone, ""}; }
  static OperationResult Failure(SupervisorError e, std::string msg) {
    return {false, e, std::move(msg)};
  }
};

// Read-only projection of a live session. Never carries the raw stream key.
struct SessionView {
  std::string id;
  int64_t owner_id = 0;
  SessionStatus status = SessionStatus::kRunning;
  int32_t profile_tier = 0;
  int32_t requested_tier = 0;
  bool loop = false;
  int32_t restart_count = 0;
  command::SourceKind source_kind = command::SourceKind::kUnsupported;
  std::string destination_display;  // URL with masked key
  int64_t started_utc_ms = 0;
};

// Operator-facing status block, e.g.
//
//   Session 3f2a9c1e
//   Status: running
//   Quality: 720p (requested 1080p)
//   Source: single_file
//   Loop: on
//   Restarts: 1/5
//   Destination: rtmp://example/live/*****t123
std::string FormatStatus(const SessionView& view, int32_t restart_ceiling);

}  // namespace onair::runtime

#endif  // ONAIR_RUNTIME_SESSION_TYPES_HPP_
