// Repository: OnAir-relay
// Component: Profile Overrides
// Copyright (c) 2026 OnAir

#include "onair/profile/ProfileOverrides.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

extern "C" {
#include <libavutil/parseutils.h>
#include <libavutil/rational.h>
}

#include "onair/util/Logger.hpp"

extern char** environ;

namespace onair::profile {

namespace {

std::vector<std::string> SplitComma(const std::string& s) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(s);
  while (std::getline(in, item, ',')) {
    out.push_back(item);
  }
  return out;
}

void SetError(std::string* error, const std::string& msg) {
  if (error) *error = msg;
}

}  // namespace

std::optional<Profile> ParseProfileSpec(int32_t tier,
                                        const std::string& text,
                                        std::string* error) {
  const auto fields = SplitComma(text);
  if (fields.size() != 4) {
    SetError(error, "expected WxH@rate,vbitrate,bufsize,abitrate");
    return std::nullopt;
  }
  const std::string& geometry = fields[0];
  const size_t at = geometry.find('@');
  if (at == std::string::npos) {
    SetError(error, "missing '@rate' in '" + geometry + "'");
    return std::nullopt;
  }

  Profile p;
  p.tier = tier;
  const std::string size_str = geometry.substr(0, at);
  const std::string rate_str = geometry.substr(at + 1);
  int width = 0;
  int height = 0;
  if (av_parse_video_size(&width, &height, size_str.c_str()) < 0) {
    SetError(error, "invalid video size '" + size_str + "'");
    return std::nullopt;
  }
  AVRational rate{0, 1};
  if (av_parse_video_rate(&rate, rate_str.c_str()) < 0 || rate.num <= 0 || rate.den <= 0) {
    SetError(error, "invalid frame rate '" + rate_str + "'");
    return std::nullopt;
  }
  p.width = width;
  p.height = height;
  p.frame_rate = FrameRate{rate.num, rate.den};

  for (size_t i = 1; i < fields.size(); ++i) {
    if (fields[i].empty()) {
      SetError(error, "empty bitrate field");
      return std::nullopt;
    }
  }
  p.video_bitrate = fields[1];
  p.buffer_size = fields[2];
  p.audio_bitrate = fields[3];
  return p;
}

std::vector<Profile> ApplyEnvironmentOverrides(std::vector<Profile> base) {
  const size_t prefix_len = std::strlen(kProfileEnvPrefix);
  for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
    const std::string entry(*env);
    if (entry.compare(0, prefix_len, kProfileEnvPrefix) != 0) continue;
    const size_t eq = entry.find('=');
    if (eq == std::string::npos) continue;
    const std::string tier_str = entry.substr(prefix_len, eq - prefix_len);
    const std::string value = entry.substr(eq + 1);

    int32_t tier = 0;
    try {
      size_t consumed = 0;
      tier = static_cast<int32_t>(std::stoi(tier_str, &consumed));
      if (consumed != tier_str.size() || tier <= 0) {
        throw std::invalid_argument(tier_str);
      }
    } catch (const std::exception&) {
      util::Logger::Warn("[ProfileOverrides] Ignoring " + entry.substr(0, eq) +
                         ": tier must be a positive integer");
      continue;
    }

    std::string error;
    auto parsed = ParseProfileSpec(tier, value, &error);
    if (!parsed) {
      util::Logger::Warn("[ProfileOverrides] Ignoring " + entry.substr(0, eq) + ": " + error);
      continue;
    }

    auto it = std::find_if(base.begin(), base.end(),
                           [tier](const Profile& p) { return p.tier == tier; });
    if (it != base.end()) {
      *it = *parsed;
    } else {
      base.push_back(*parsed);
    }
    util::Logger::Info("[ProfileOverrides] Tier " + std::to_string(tier) + " = " +
                       std::to_string(parsed->width) + "x" + std::to_string(parsed->height) +
                       "@" + parsed->frame_rate.ToString() + " v=" + parsed->video_bitrate +
                       " buf=" + parsed->buffer_size + " a=" + parsed->audio_bitrate);
  }
  return base;
}

}  // namespace onair::profile
