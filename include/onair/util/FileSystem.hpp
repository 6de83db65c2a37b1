// Repository: OnAir-relay
// Component: File System Helpers
// Purpose: mkdir -p and atomic replace used by manifest and log writers.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_UTIL_FILE_SYSTEM_HPP_
#define ONAIR_UTIL_FILE_SYSTEM_HPP_

#include <string>

namespace onair::util {

// Creates `path` and any missing parents (mode 0755). Returns true if the
// directory exists afterwards.
bool MakeDirectories(const std::string& path);

// Writes `content` to "<path>.tmp.<pid>" and renames it over `path`, so
// readers see either the old or the new file, never a partial one.
// On failure *error (when non-null) carries strerror text.
bool WriteFileAtomically(const std::string& path, const std::string& content,
                         std::string* error = nullptr);

// "<dir>/<name>", tolerating a trailing '/' on dir and an empty dir.
std::string JoinPath(const std::string& dir, const std::string& name);

}  // namespace onair::util

#endif  // ONAIR_UTIL_FILE_SYSTEM_HPP_
