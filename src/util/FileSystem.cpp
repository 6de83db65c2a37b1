// Repository: OnAir-relay
// Component: File System Helpers
// Copyright (c) 2026 OnAir

#include "onair/util/FileSystem.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace onair::util {

namespace {

bool IsDirectory(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace

bool MakeDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (IsDirectory(path)) return true;

  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find('/', pos + 1);
    const std::string prefix = path.substr(0, pos);
    if (prefix.empty()) continue;
    if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
      return false;
    }
  }
  return IsDirectory(path);
}

bool WriteFileAtomically(const std::string& path, const std::string& content,
                         std::string* error) {
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!of) {
      if (error) *error = "cannot open " + tmp_path + ": " + std::strerror(errno);
      return false;
    }
    of << content;
    of.flush();
    if (!of) {
      if (error) *error = "short write to " + tmp_path;
      of.close();
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    if (error) *error = "cannot rename onto " + path + ": " + std::strerror(errno);
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

}  // namespace onair::util
