// Repository: OnAir-relay
// Component: Profile Overrides
// Purpose: Parse operator-supplied tier definitions from the environment.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_PROFILE_PROFILE_OVERRIDES_HPP_
#define ONAIR_PROFILE_PROFILE_OVERRIDES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "onair/profile/Profile.hpp"

namespace onair::profile {

inline constexpr const char* kProfileEnvPrefix = "ONAIR_PROFILE_";

// Parses "WxH@rate,vbitrate,bufsize,abitrate", e.g.
//   "1280x720@30,2500k,5000k,128k"
//   "hd720@30000/1001,2500k,5000k,128k"
// Size and rate accept every abbreviation libavutil understands.
// Returns nullopt (and fills *error when non-null) on malformed input.
std::optional<Profile> ParseProfileSpec(int32_t tier,
                                        const std::string& text,
                                        std::string* error = nullptr);

// Starts from `base` and applies every ONAIR_PROFILE_<tier> variable found
// in the process environment: existing tiers are replaced, new tiers added.
// Malformed entries are logged and skipped.
std::vector<Profile> ApplyEnvironmentOverrides(std::vector<Profile> base);

}  // namespace onair::profile

#endif  // ONAIR_PROFILE_PROFILE_OVERRIDES_HPP_
