// Repository: OnAir-relay
// Component: Profile Registry
// Purpose: Fixed tier → Profile table with a default-tier fallback.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_PROFILE_PROFILE_REGISTRY_HPP_
#define ONAIR_PROFILE_PROFILE_REGISTRY_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "onair/profile/Profile.hpp"

namespace onair::profile {

inline constexpr int32_t kDefaultTier = 720;

// The table is fixed at construction. Resolve() is total: an unknown tier
// resolves to the default tier's profile.
class ProfileRegistry {
 public:
  // Throws std::invalid_argument if `profiles` is empty, contains a
  // duplicate tier, or does not contain `default_tier`.
  ProfileRegistry(std::vector<Profile> profiles, int32_t default_tier);

  // 480p / 720p / 1080p at 30 fps.
  static std::vector<Profile> BuiltinProfiles();

  Profile Resolve(int32_t tier) const;

  bool Contains(int32_t tier) const { return table_.count(tier) != 0; }
  int32_t DefaultTier() const { return default_tier_; }

  // Known tiers, ascending.
  std::vector<int32_t> Tiers() const;

  // Neighbouring tiers in ascending order; nullopt at either end or for an
  // unknown tier.
  std::optional<int32_t> LowerTier(int32_t tier) const;
  std::optional<int32_t> HigherTier(int32_t tier) const;

 private:
  std::map<int32_t, Profile> table_;
  int32_t default_tier_;
};

}  // namespace onair::profile

#endif  // ONAIR_PROFILE_PROFILE_REGISTRY_HPP_
