// Repository: OnAir-relay
// Component: Encoder Settings
// Purpose: Fixed encoder parameters shared by every invocation shape.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_COMMAND_ENCODER_SETTINGS_HPP_
#define ONAIR_COMMAND_ENCODER_SETTINGS_HPP_

#include <cstdint>
#include <string>

namespace onair::command {

// Per-tier values (resolution, rate, bitrates) come from profile::Profile;
// everything here is the same for all tiers.
// POD struct - immutable after construction
struct EncoderSettings {
  std::string binary = "ffmpeg";       // Resolved through PATH by execvp
  std::string log_level = "warning";   // -loglevel
  std::string video_codec = "libx264";
  std::string preset = "veryfast";
  std::string audio_codec = "aac";
  std::string container = "flv";       // Forced output format for RTMP push
  int32_t keyframe_interval_sec = 2;   // -g = ceil(fps) * this; 0 omits -g
};

}  // namespace onair::command

#endif  // ONAIR_COMMAND_ENCODER_SETTINGS_HPP_
