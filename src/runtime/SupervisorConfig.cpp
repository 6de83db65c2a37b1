// Repository: OnAir-relay
// Component: Supervisor Configuration
// Copyright (c) 2026 OnAir

#include "onair/runtime/SupervisorConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <stdexcept>

#include "onair/profile/ProfileOverrides.hpp"
#include "onair/util/Logger.hpp"

namespace onair::runtime {

namespace {

const char* Env(const char* name) {
  const char* v = std::getenv(name);
  return (v != nullptr && *v != '\0') ? v : nullptr;
}

void ReadString(const char* name, std::string& out) {
  if (const char* v = Env(name)) out = v;
}

template <typename T>
void ReadInt(const char* name, T& out) {
  const char* v = Env(name);
  if (v == nullptr) return;
  try {
    size_t consumed = 0;
    const long long parsed = std::stoll(v, &consumed);
    if (consumed != std::string(v).size()) throw std::invalid_argument(v);
    out = static_cast<T>(parsed);
  } catch (const std::exception&) {
    util::Logger::Warn(std::string("[Config] Ignoring ") + name + "='" + v +
                       "': not an integer");
  }
}

void ReadMillis(const char* name, std::chrono::milliseconds& out) {
  int64_t ms = out.count();
  ReadInt(name, ms);
  out = std::chrono::milliseconds(ms);
}

void ReadDouble(const char* name, double& out) {
  const char* v = Env(name);
  if (v == nullptr) return;
  try {
    size_t consumed = 0;
    const double parsed = std::stod(v, &consumed);
    if (consumed != std::string(v).size()) throw std::invalid_argument(v);
    out = parsed;
  } catch (const std::exception&) {
    util::Logger::Warn(std::string("[Config] Ignoring ") + name + "='" + v + "': not a number");
  }
}

void ReadBool(const char* name, bool& out) {
  if (const char* v = Env(name)) out = ParseBoolFlag(v);
}

}  // namespace

bool ParseBoolFlag(const std::string& value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

SupervisorConfig LoadConfigFromEnvironment() {
  SupervisorConfig config;

  ReadString("ONAIR_ENCODER_PATH", config.encoder.binary);
  ReadString("ONAIR_ENCODER_LOGLEVEL", config.encoder.log_level);
  ReadInt("ONAIR_DEFAULT_QUALITY", config.default_tier);
  ReadString("ONAIR_DEFAULT_RTMP_URL", config.default_destination.base_endpoint);
  ReadString("ONAIR_DEFAULT_STREAM_KEY", config.default_destination.stream_key);

  ReadInt("ONAIR_RESTART_CEILING", config.restart_ceiling);
  ReadMillis("ONAIR_RESTART_BACKOFF_MS", config.restart_backoff);
  ReadMillis("ONAIR_TERMINATE_TIMEOUT_MS", config.terminate_timeout);
  ReadBool("ONAIR_SINGLE_SESSION_PER_OWNER", config.single_session_per_owner);
  ReadString("ONAIR_MANIFEST_DIR", config.manifest_dir);
  ReadString("ONAIR_ENCODER_LOG_DIR", config.encoder_log_dir);

  ReadBool("ONAIR_ADAPT", config.adaptation.enabled);
  ReadMillis("ONAIR_ADAPT_INTERVAL_MS", config.adaptation.interval);
  ReadDouble("ONAIR_ADAPT_HIGH_WATER", config.adaptation.high_water_percent);
  ReadDouble("ONAIR_ADAPT_LOW_WATER", config.adaptation.low_water_percent);

  config.profiles = profile::ApplyEnvironmentOverrides(std::move(config.profiles));
  return config;
}

std::string ValidateConfig(const SupervisorConfig& config) {
  if (config.encoder.binary.empty()) return "encoder binary is empty";
  if (config.profiles.empty()) return "profile table is empty";

  std::set<int32_t> tiers;
  for (const auto& p : config.profiles) {
    if (!tiers.insert(p.tier).second) {
      return "duplicate profile tier " + std::to_string(p.tier);
    }
    if (p.width <= 0 || p.height <= 0 || !p.frame_rate.IsValid()) {
      return "profile tier " + std::to_string(p.tier) + " has invalid geometry";
    }
  }
  if (tiers.count(config.default_tier) == 0) {
    return "default tier " + std::to_string(config.default_tier) + " is not in the profile table";
  }
  if (config.restart_ceiling < 0) return "restart ceiling must be >= 0";
  if (config.restart_backoff.count() < 0) return "restart backoff must be >= 0";
  if (config.terminate_timeout.count() <= 0) return "terminate timeout must be > 0";
  if (config.manifest_dir.empty()) return "manifest directory is empty";
  if (config.adaptation.enabled) {
    if (config.adaptation.interval.count() <= 0) return "adaptation interval must be > 0";
    if (config.adaptation.low_water_percent >= config.adaptation.high_water_percent) {
      return "adaptation low-water must be below high-water";
    }
  }
  return "";
}

}  // namespace onair::runtime
