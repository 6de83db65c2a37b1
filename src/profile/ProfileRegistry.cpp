// Repository: OnAir-relay
// Component: Profile Registry
// Copyright (c) 2026 OnAir

#include "onair/profile/ProfileRegistry.hpp"

#include <iterator>
#include <stdexcept>
#include <string>

namespace onair::profile {

ProfileRegistry::ProfileRegistry(std::vector<Profile> profiles, int32_t default_tier)
    : default_tier_(default_tier) {
  if (profiles.empty()) {
    throw std::invalid_argument("ProfileRegistry: empty profile table");
  }
  for (auto& p : profiles) {
    const int32_t tier = p.tier;
    if (!table_.emplace(tier, std::move(p)).second) {
      throw std::invalid_argument("ProfileRegistry: duplicate tier " + std::to_string(tier));
    }
  }
  if (table_.count(default_tier_) == 0) {
    throw std::invalid_argument("ProfileRegistry: default tier " +
                                std::to_string(default_tier_) + " not in table");
  }
}

std::vector<Profile> ProfileRegistry::BuiltinProfiles() {
  return {
      {480, 854, 480, FrameRate{30, 1}, "1500k", "3000k", "128k"},
      {720, 1280, 720, FrameRate{30, 1}, "2500k", "5000k", "128k"},
      {1080, 1920, 1080, FrameRate{30, 1}, "4500k", "9000k", "128k"},
  };
}

Profile ProfileRegistry::Resolve(int32_t tier) const {
  auto it = table_.find(tier);
  if (it == table_.end()) {
    it = table_.find(default_tier_);
  }
  return it->second;
}

std::vector<int32_t> ProfileRegistry::Tiers() const {
  std::vector<int32_t> out;
  out.reserve(table_.size());
  for (const auto& [tier, _] : table_) {
    out.push_back(tier);
  }
  return out;
}

std::optional<int32_t> ProfileRegistry::LowerTier(int32_t tier) const {
  auto it = table_.find(tier);
  if (it == table_.end() || it == table_.begin()) {
    return std::nullopt;
  }
  return std::prev(it)->first;
}

std::optional<int32_t> ProfileRegistry::HigherTier(int32_t tier) const {
  auto it = table_.find(tier);
  if (it == table_.end()) {
    return std::nullopt;
  }
  ++it;
  if (it == table_.end()) {
    return std::nullopt;
  }
  return it->first;
}

}  // namespace onair::profile
