// Repository: OnAir-relay
// Component: Command Builder
// Purpose: Translate {source, destination, profile, loop} into the exact
//          encoder argument vector.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_COMMAND_COMMAND_BUILDER_HPP_
#define ONAIR_COMMAND_COMMAND_BUILDER_HPP_

#include <string>
#include <vector>

#include "onair/command/EncoderSettings.hpp"
#include "onair/command/SourceDescriptor.hpp"
#include "onair/profile/Profile.hpp"

namespace onair::command {

enum class BuildError {
  kNone,
  kUnsupportedSourceKind,  // Variant the builder does not model
  kEmptyQueue,             // Playlist with no unplayed items
  kManifestWriteFailed,    // Concat manifest could not be written
};

const char* BuildErrorToString(BuildError e);

struct BuildResult {
  bool success;
  BuildError error;
  std::string message;
  // argv[0] is the encoder binary.
  std::vector<std::string> args;

  static BuildResult Success(std::vector<std::string> a) {
    return {true, BuildError::kNone, "", std::move(a)};
  }
  static BuildResult Failure(BuildError e, std::string msg) {
    return {false, e, std::move(msg), {}};
  }
};

// Invocation shapes:
//
//   single file:  [-stream_loop -1] -re -i <path>
//   composite:    -re -loop 1 -framerate <rate> -i <image>
//                 [-stream_loop -1] -i <audio>  ... -tune stillimage
//                 -pix_fmt yuv420p -shortest
//   playlist:     [-stream_loop -1] -re -f concat -safe 0 -i <manifest>
//
// followed by the common encode block
//
//   -c:v <codec> -preset <preset> -b:v <vb> -maxrate <vb> -bufsize <buf>
//   -vf scale=W:H,fps=<rate> -g <gop> -c:a <codec> -b:a <ab> -f <container> <url>
//
// Profile values are passed through verbatim. The only side effect is the
// playlist manifest, which is replaced atomically on every build.
class CommandBuilder {
 public:
  explicit CommandBuilder(EncoderSettings settings = {});

  // `manifest_path` is only used for playlist sources and should be unique
  // per session.
  BuildResult Build(const SourceDescriptor& source,
                    const DestinationDescriptor& destination,
                    const profile::Profile& profile,
                    bool loop,
                    const std::string& manifest_path) const;

  // Concat-demuxer manifest body: one "file '<path>'" line per entry, with
  // embedded single quotes written as '\''.
  static std::string RenderManifest(const std::vector<std::string>& paths);

  const EncoderSettings& Settings() const { return settings_; }

 private:
  void AppendPreamble(std::vector<std::string>& args) const;
  void AppendVideoEncode(std::vector<std::string>& args, const profile::Profile& profile) const;
  void AppendAudioEncode(std::vector<std::string>& args, const profile::Profile& profile) const;
  void AppendOutput(std::vector<std::string>& args,
                    const DestinationDescriptor& destination) const;

  EncoderSettings settings_;
};

}  // namespace onair::command

#endif  // ONAIR_COMMAND_COMMAND_BUILDER_HPP_
