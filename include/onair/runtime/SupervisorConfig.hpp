// Repository: OnAir-relay
// Component: Supervisor Configuration
// Purpose: Restart policy, paths, profile table and adaptation thresholds.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_RUNTIME_SUPERVISOR_CONFIG_HPP_
#define ONAIR_RUNTIME_SUPERVISOR_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "onair/command/EncoderSettings.hpp"
#include "onair/command/SourceDescriptor.hpp"
#include "onair/profile/Profile.hpp"
#include "onair/profile/ProfileRegistry.hpp"

namespace onair::runtime {

struct AdaptationConfig {
  bool enabled = false;
  std::chrono::milliseconds interval{30000};
  double high_water_percent = 85.0;  // Step down one tier above this
  double low_water_percent = 40.0;   // Step up one tier below this
};

// POD struct - immutable after the supervisor is constructed
struct SupervisorConfig {
  command::EncoderSettings encoder;

  std::vector<profile::Profile> profiles = profile::ProfileRegistry::BuiltinProfiles();
  int32_t default_tier = profile::kDefaultTier;

  // Restart policy: the session crashes for good on exit number
  // restart_ceiling + 1.
  int32_t restart_ceiling = 5;
  std::chrono::milliseconds restart_backoff{5000};
  std::chrono::milliseconds terminate_timeout{5000};

  // When true, start fails with AlreadyRunning while the owner has any live
  // session. When false, owners may run several sessions and address them by
  // id prefix.
  bool single_session_per_owner = false;

  std::string manifest_dir = "./storage/manifests";
  std::string encoder_log_dir;  // Empty discards encoder output

  // Used when a start request carries no endpoint.
  command::DestinationDescriptor default_destination;

  AdaptationConfig adaptation;
};

// Defaults overlaid with ONAIR_* environment variables:
//
//   ONAIR_ENCODER_PATH, ONAIR_ENCODER_LOGLEVEL, ONAIR_DEFAULT_QUALITY,
//   ONAIR_DEFAULT_RTMP_URL, ONAIR_DEFAULT_STREAM_KEY,
//   ONAIR_RESTART_CEILING, ONAIR_RESTART_BACKOFF_MS, ONAIR_TERMINATE_TIMEOUT_MS,
//   ONAIR_SINGLE_SESSION_PER_OWNER, ONAIR_MANIFEST_DIR, ONAIR_ENCODER_LOG_DIR,
//   ONAIR_ADAPT, ONAIR_ADAPT_INTERVAL_MS, ONAIR_ADAPT_HIGH_WATER,
//   ONAIR_ADAPT_LOW_WATER, ONAIR_PROFILE_<tier>
//
// Unparseable values are logged and ignored.
SupervisorConfig LoadConfigFromEnvironment();

// Empty string when valid, otherwise the first problem found.
std::string ValidateConfig(const SupervisorConfig& config);

// "1", "true", "yes", "on" (any case) => true.
bool ParseBoolFlag(const std::string& value);

}  // namespace onair::runtime

#endif  // ONAIR_RUNTIME_SUPERVISOR_CONFIG_HPP_
