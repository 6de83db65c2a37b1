// Repository: OnAir-relay
// Component: Source / Destination Descriptors
// Copyright (c) 2026 OnAir

#include "onair/command/SourceDescriptor.hpp"

#include "onair/util/Redact.hpp"

namespace onair::command {

namespace {

std::string StripTrailingSlashes(const std::string& s) {
  size_t end = s.size();
  while (end > 0 && s[end - 1] == '/') --end;
  return s.substr(0, end);
}

}  // namespace

SourceKind KindOf(const SourceDescriptor& source) {
  switch (source.index()) {
    case 1:
      return SourceKind::kSingleFile;
    case 2:
      return SourceKind::kCompositeAudio;
    case 3:
      return SourceKind::kPlaylist;
    default:
      return SourceKind::kUnsupported;
  }
}

const char* SourceKindToString(SourceKind kind) {
  switch (kind) {
    case SourceKind::kSingleFile:
      return "single_file";
    case SourceKind::kCompositeAudio:
      return "composite_audio";
    case SourceKind::kPlaylist:
      return "playlist";
    case SourceKind::kUnsupported:
      return "unsupported";
  }
  return "unsupported";
}

std::string DestinationDescriptor::Url() const {
  std::string url = StripTrailingSlashes(base_endpoint);
  if (!stream_key.empty()) {
    url += "/" + stream_key;
  }
  return url;
}

std::string DestinationDescriptor::DisplayUrl() const {
  std::string url = StripTrailingSlashes(base_endpoint);
  if (!stream_key.empty()) {
    url += "/" + util::MaskSecret(stream_key);
  }
  return url;
}

}  // namespace onair::command
