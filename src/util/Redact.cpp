// Repository: OnAir-relay
// Component: Secret Redaction
// Copyright (c) 2026 OnAir

#include "onair/util/Redact.hpp"

#include <sstream>

namespace onair::util {

std::string MaskSecret(const std::string& secret, std::size_t visible) {
  if (secret.size() <= visible) {
    return "****";
  }
  return std::string(secret.size() - visible, '*') +
         secret.substr(secret.size() - visible);
}

std::vector<std::string> RedactArguments(const std::vector<std::string>& args,
                                         const std::string& secret) {
  if (secret.empty()) {
    return args;
  }
  const std::string masked = MaskSecret(secret);
  std::vector<std::string> out;
  out.reserve(args.size());
  for (const auto& arg : args) {
    std::string copy = arg;
    size_t pos = 0;
    while ((pos = copy.find(secret, pos)) != std::string::npos) {
      copy.replace(pos, secret.size(), masked);
      pos += masked.size();
    }
    out.push_back(std::move(copy));
  }
  return out;
}

std::string JoinArguments(const std::vector<std::string>& args) {
  std::ostringstream o;
  bool first = true;
  for (const auto& arg : args) {
    if (!first) o << ' ';
    first = false;
    const bool needs_quotes =
        arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos;
    if (!needs_quotes) {
      o << arg;
      continue;
    }
    o << '\'';
    for (char c : arg) {
      if (c == '\'') o << "'\\''";
      else o << c;
    }
    o << '\'';
  }
  return o.str();
}

}  // namespace onair::util
