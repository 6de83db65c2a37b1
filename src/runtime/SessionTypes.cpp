// Repository: OnAir-relay
// Component: Session Types
// Copyright (c) 2026 OnAir

#include "onair/runtime/SessionTypes.hpp"

#include <sstream>
#include <stdexcept>

namespace onair::runtime {

const char* SessionStatusToString(SessionStatus s) {
  switch (s) {
    case SessionStatus::kRunning:
      return "running";
    case SessionStatus::kPaused:
      return "paused";
    case SessionStatus::kStopping:
      return "stopping";
    case SessionStatus::kStopped:
      return "stopped";
    case SessionStatus::kCrashed:
      return "crashed";
  }
  return "unknown";
}

SessionStatus SessionStatusFromString(const std::string& name) {
  if (name == "running") return SessionStatus::kRunning;
  if (name == "paused") return SessionStatus::kPaused;
  if (name == "stopping") return SessionStatus::kStopping;
  if (name == "stopped") return SessionStatus::kStopped;
  if (name == "crashed") return SessionStatus::kCrashed;
  throw std::invalid_argument("unknown session status: " + name);
}

bool IsTerminal(SessionStatus s) {
  return s == SessionStatus::kStopped || s == SessionStatus::kCrashed;
}

const char* SupervisorErrorToString(SupervisorError e) {
  switch (e) {
    case SupervisorError::kNone:
      return "NONE";
    case SupervisorError::kConfigurationMissing:
      return "CONFIGURATION_MISSING";
    case SupervisorError::kSpawnError:
      return "SPAWN_ERROR";
    case SupervisorError::kUnsupportedSourceKind:
      return "UNSUPPORTED_SOURCE_KIND";
    case SupervisorError::kUnsupportedOperation:
      return "UNSUPPORTED_OPERATION";
    case SupervisorError::kAlreadyRunning:
      return "ALREADY_RUNNING";
    case SupervisorError::kEmptyQueue:
      return "EMPTY_QUEUE";
    case SupervisorError::kRestartCeilingExceeded:
      return "RESTART_CEILING_EXCEEDED";
    case SupervisorError::kNotFound:
      return "NOT_FOUND";
    case SupervisorError::kInvalidState:
      return "INVALID_STATE";
  }
  return "UNKNOWN";
}

std::string FormatStatus(const SessionView& view, int32_t restart_ceiling) {
  std::ostringstream out;
  out << "Session " << view.id.substr(0, 8) << "\n";
  out << "Status: " << SessionStatusToString(view.status) << "\n";
  out << "Quality: " << view.profile_tier << "p";
  if (view.requested_tier != 0 && view.requested_tier != view.profile_tier) {
    out << " (requested " << view.requested_tier << "p)";
  }
  out << "\n";
  out << "Source: " << command::SourceKindToString(view.source_kind) << "\n";
  out << "Loop: " << (view.loop ? "on" : "off") << "\n";
  out << "Restarts: " << view.restart_count << "/" << restart_ceiling << "\n";
  out << "Destination: " << view.destination_display;
  return out.str();
}

}  // namespace onair::runtime
