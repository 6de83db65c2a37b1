// Repository: OnAir-relay
// Component: Quality Adaptation
// Copyright (c) 2026 OnAir

#include "onair/runtime/QualityAdaptation.hpp"

#include <fstream>
#include <sstream>

#include "onair/util/Logger.hpp"

namespace onair::runtime {

ProcStatCpuSampler::ProcStatCpuSampler(std::string stat_path)
    : stat_path_(std::move(stat_path)) {}

std::optional<double> ProcStatCpuSampler::SampleCpuPercent() {
  std::ifstream in(stat_path_);
  std::string line;
  if (!in || !std::getline(in, line) || line.compare(0, 4, "cpu ") != 0) {
    util::Logger::Debug("[ProcStatCpuSampler] Cannot read " + stat_path_);
    return std::nullopt;
  }

  // cpu  user nice system idle iowait irq softirq steal guest guest_nice
  std::istringstream fields(line.substr(4));
  uint64_t value = 0;
  uint64_t total = 0;
  uint64_t idle = 0;
  int index = 0;
  while (fields >> value) {
    // guest and guest_nice are already counted in user and nice.
    if (index < 8) total += value;
    if (index == 3 || index == 4) idle += value;
    ++index;
  }
  if (index < 4) return std::nullopt;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!have_previous_) {
    have_previous_ = true;
    prev_total_ = total;
    prev_idle_ = idle;
    return std::nullopt;
  }
  const bool went_backwards = total < prev_total_ || idle < prev_idle_;
  const uint64_t d_total = total - prev_total_;
  const uint64_t d_idle = idle - prev_idle_;
  prev_total_ = total;
  prev_idle_ = idle;
  if (went_backwards || d_total == 0 || d_idle > d_total) return std::nullopt;
  return 100.0 * static_cast<double>(d_total - d_idle) / static_cast<double>(d_total);
}

std::optional<int32_t> DecideTier(int32_t current_tier,
                                  int32_t requested_tier,
                                  double load_percent,
                                  const profile::ProfileRegistry& registry,
                                  const AdaptationConfig& config) {
  if (load_percent > config.high_water_percent) {
    return registry.LowerTier(current_tier);
  }
  if (load_percent < config.low_water_percent) {
    auto higher = registry.HigherTier(current_tier);
    if (higher && *higher <= requested_tier) return higher;
  }
  return std::nullopt;
}

}  // namespace onair::runtime
