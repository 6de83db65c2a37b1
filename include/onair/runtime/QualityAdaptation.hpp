// Repository: OnAir-relay
// Component: Quality Adaptation
// Purpose: Resource-pressure sampling and the tier step policy used by the
//          supervisor's adaptation loop.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_RUNTIME_QUALITY_ADAPTATION_HPP_
#define ONAIR_RUNTIME_QUALITY_ADAPTATION_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "onair/profile/ProfileRegistry.hpp"
#include "onair/runtime/SupervisorConfig.hpp"

namespace onair::runtime {

// Source of the pressure signal, in percent (0-100).
class ILoadSampler {
 public:
  virtual ~ILoadSampler() = default;

  // nullopt when no reading is available (first call of a delta-based
  // sampler, unreadable source). The loop skips the cycle.
  virtual std::optional<double> SampleCpuPercent() = 0;
};

// Aggregate CPU utilisation from the "cpu" line of /proc/stat, as the busy
// share of the jiffies elapsed since the previous call.
class ProcStatCpuSampler : public ILoadSampler {
 public:
  explicit ProcStatCpuSampler(std::string stat_path = "/proc/stat");

  std::optional<double> SampleCpuPercent() override;

 private:
  std::string stat_path_;
  std::mutex mutex_;
  bool have_previous_ = false;
  uint64_t prev_total_ = 0;
  uint64_t prev_idle_ = 0;
};

// One step of the adaptation policy for a running session.
//
//   load > high_water  and a lower tier exists                    => lower tier
//   load < low_water   and a higher tier exists <= requested_tier => higher tier
//   otherwise                                                     => nullopt
//
// Steps are one tier at a time; the session never climbs above the tier it
// was started (or last explicitly changed) with.
std::optional<int32_t> DecideTier(int32_t current_tier,
                                  int32_t requested_tier,
                                  double load_percent,
                                  const profile::ProfileRegistry& registry,
                                  const AdaptationConfig& config);

}  // namespace onair::runtime

#endif  // ONAIR_RUNTIME_QUALITY_ADAPTATION_HPP_
