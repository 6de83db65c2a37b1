// Repository: OnAir-relay
// Component: Command Builder
// Copyright (c) 2026 OnAir

#include "onair/command/CommandBuilder.hpp"

#include "onair/util/FileSystem.hpp"

namespace onair::command {

namespace {

void AppendLoopInput(std::vector<std::string>& args, bool loop) {
  if (loop) {
    args.push_back("-stream_loop");
    args.push_back("-1");
  }
}

std::string DirName(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) return "";
  return path.substr(0, slash);
}

}  // namespace

const char* BuildErrorToString(BuildError e) {
  switch (e) {
    case BuildError::kNone:
      return "NONE";
    case BuildError::kUnsupportedSourceKind:
      return "UNSUPPORTED_SOURCE_KIND";
    case BuildError::kEmptyQueue:
      return "EMPTY_QUEUE";
    case BuildError::kManifestWriteFailed:
      return "MANIFEST_WRITE_FAILED";
  }
  return "UNKNOWN";
}

CommandBuilder::CommandBuilder(EncoderSettings settings) : settings_(std::move(settings)) {}

std::string CommandBuilder::RenderManifest(const std::vector<std::string>& paths) {
  std::string out;
  for (const auto& path : paths) {
    out += "file '";
    for (char c : path) {
      if (c == '\'') {
        out += "'\\''";
      } else {
        out += c;
      }
    }
    out += "'\n";
  }
  return out;
}

BuildResult CommandBuilder::Build(const SourceDescriptor& source,
                                  const DestinationDescriptor& destination,
                                  const profile::Profile& profile,
                                  bool loop,
                                  const std::string& manifest_path) const {
  std::vector<std::string> args;
  AppendPreamble(args);

  switch (KindOf(source)) {
    case SourceKind::kSingleFile: {
      const auto& s = std::get<SingleFileSource>(source);
      AppendLoopInput(args, loop);
      args.insert(args.end(), {"-re", "-i", s.path});
      AppendVideoEncode(args, profile);
      AppendAudioEncode(args, profile);
      break;
    }

    case SourceKind::kCompositeAudio: {
      const auto& s = std::get<CompositeAudioSource>(source);
      args.insert(args.end(), {"-re", "-loop", "1", "-framerate",
                               profile.frame_rate.ToString(), "-i", s.image_path});
      AppendLoopInput(args, loop);
      args.insert(args.end(), {"-i", s.audio_path});
      AppendVideoEncode(args, profile);
      args.insert(args.end(), {"-tune", "stillimage", "-pix_fmt", "yuv420p"});
      AppendAudioEncode(args, profile);
      args.push_back("-shortest");
      break;
    }

    case SourceKind::kPlaylist: {
      const auto& s = std::get<PlaylistSource>(source);
      if (!s.queue) {
        return BuildResult::Failure(BuildError::kUnsupportedSourceKind,
                                    "playlist source has no queue");
      }
      const auto paths = s.queue->UnplayedPaths();
      if (paths.empty()) {
        return BuildResult::Failure(BuildError::kEmptyQueue, "playlist has no unplayed items");
      }
      const std::string dir = DirName(manifest_path);
      if (!dir.empty() && !util::MakeDirectories(dir)) {
        return BuildResult::Failure(BuildError::kManifestWriteFailed,
                                    "cannot create manifest directory " + dir);
      }
      std::string error;
      if (!util::WriteFileAtomically(manifest_path, RenderManifest(paths), &error)) {
        return BuildResult::Failure(BuildError::kManifestWriteFailed, error);
      }
      AppendLoopInput(args, loop);
      args.insert(args.end(), {"-re", "-f", "concat", "-safe", "0", "-i", manifest_path});
      AppendVideoEncode(args, profile);
      AppendAudioEncode(args, profile);
      break;
    }

    case SourceKind::kUnsupported:
      return BuildResult::Failure(BuildError::kUnsupportedSourceKind,
                                  "source kind is not supported");
  }

  AppendOutput(args, destination);
  return BuildResult::Success(std::move(args));
}

void CommandBuilder::AppendPreamble(std::vector<std::string>& args) const {
  args.insert(args.end(), {settings_.binary, "-hide_banner", "-loglevel", settings_.log_level});
}

void CommandBuilder::AppendVideoEncode(std::vector<std::string>& args,
                                       const profile::Profile& profile) const {
  args.insert(args.end(), {"-c:v", settings_.video_codec,
                           "-preset", settings_.preset,
                           "-b:v", profile.video_bitrate,
                           "-maxrate", profile.video_bitrate,
                           "-bufsize", profile.buffer_size,
                           "-vf",
                           "scale=" + std::to_string(profile.width) + ":" +
                               std::to_string(profile.height) +
                               ",fps=" + profile.frame_rate.ToString()});
  if (settings_.keyframe_interval_sec > 0) {
    const int32_t gop = profile.frame_rate.CeilFps() * settings_.keyframe_interval_sec;
    args.push_back("-g");
    args.push_back(std::to_string(gop));
  }
}

void CommandBuilder::AppendAudioEncode(std::vector<std::string>& args,
                                       const profile::Profile& profile) const {
  args.insert(args.end(), {"-c:a", settings_.audio_codec, "-b:a", profile.audio_bitrate});
}

void CommandBuilder::AppendOutput(std::vector<std::string>& args,
                                  const DestinationDescriptor& destination) const {
  args.insert(args.end(), {"-f", settings_.container, destination.Url()});
}

}  // namespace onair::command
