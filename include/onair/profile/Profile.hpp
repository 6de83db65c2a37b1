// Repository: OnAir-relay
// Component: Encode Profile
// Purpose: Immutable bundle of encode parameters for one quality tier.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_PROFILE_PROFILE_HPP_
#define ONAIR_PROFILE_PROFILE_HPP_

#include <cstdint>
#include <string>

namespace onair::profile {

// Exact frame rate as a ratio (30/1, 30000/1001). Passed to the encoder's
// fps filter verbatim; never converted to floating point.
struct FrameRate {
  int32_t num = 30;
  int32_t den = 1;

  bool IsValid() const { return num > 0 && den > 0; }

  // "30" for integral rates, "30000/1001" otherwise.
  std::string ToString() const {
    if (den == 1) return std::to_string(num);
    return std::to_string(num) + "/" + std::to_string(den);
  }

  // Nearest whole frames per second, rounded up (GOP sizing).
  int32_t CeilFps() const { return IsValid() ? (num + den - 1) / den : 0; }

  bool operator==(const FrameRate& o) const { return num == o.num && den == o.den; }
  bool operator!=(const FrameRate& o) const { return !(*this == o); }
};

// Bitrate strings ("2500k", "128k") are kept exactly as configured; the
// encoder is the only component that interprets them.
struct Profile {
  int32_t tier = 0;  // Identifier, by convention the output height (720).
  int32_t width = 0;
  int32_t height = 0;
  FrameRate frame_rate;
  std::string video_bitrate;  // -b:v and -maxrate (ceiling)
  std::string buffer_size;    // -bufsize
  std::string audio_bitrate;  // -b:a

  bool operator==(const Profile& o) const {
    return tier == o.tier && width == o.width && height == o.height &&
           frame_rate == o.frame_rate && video_bitrate == o.video_bitrate &&
           buffer_size == o.buffer_size && audio_bitrate == o.audio_bitrate;
  }
  bool operator!=(const Profile& o) const { return !(*this == o); }
};

}  // namespace onair::profile

#endif  // ONAIR_PROFILE_PROFILE_HPP_
