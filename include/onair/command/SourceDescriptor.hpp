// Repository: OnAir-relay
// Component: Source / Destination Descriptors
// Purpose: What a session broadcasts and where it pushes it.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_COMMAND_SOURCE_DESCRIPTOR_HPP_
#define ONAIR_COMMAND_SOURCE_DESCRIPTOR_HPP_

#include <memory>
#include <string>
#include <variant>

#include "onair/playlist/PlaylistQueue.hpp"

namespace onair::command {

// One local media file (or any input URL the encoder accepts).
struct SingleFileSource {
  std::string path;
};

// Audio track over a looped still image.
struct CompositeAudioSource {
  std::string audio_path;
  std::string image_path;
};

// Ordered playlist. The queue is shared with the operator surface so items
// can be added or marked played while the session runs; the encoder always
// receives the unplayed items at the time of the (re)build.
struct PlaylistSource {
  std::shared_ptr<playlist::PlaylistQueue> queue;
};

// std::monostate is a source kind the builder does not model (for example a
// request that named no source); building it fails with UnsupportedSourceKind.
using SourceDescriptor =
    std::variant<std::monostate, SingleFileSource, CompositeAudioSource, PlaylistSource>;

enum class SourceKind {
  kUnsupported,
  kSingleFile,
  kCompositeAudio,
  kPlaylist,
};

SourceKind KindOf(const SourceDescriptor& source);
const char* SourceKindToString(SourceKind kind);

// Streaming endpoint plus secret publishing key.
struct DestinationDescriptor {
  std::string base_endpoint;  // "rtmp://a.rtmp.youtube.com/live2"
  std::string stream_key;     // secret; never log unmasked

  bool IsConfigured() const { return !base_endpoint.empty(); }

  // base_endpoint with trailing '/' stripped, then "/<key>" when the key is
  // non-empty. This is the value handed to the encoder.
  std::string Url() const;

  // Same as Url() with the key masked to its last 4 characters.
  std::string DisplayUrl() const;
};

}  // namespace onair::command

#endif  // ONAIR_COMMAND_SOURCE_DESCRIPTOR_HPP_
