// Repository: OnAir-relay
// Component: Secret Redaction
// Purpose: Masking of stream keys before they reach logs or operators.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_UTIL_REDACT_HPP_
#define ONAIR_UTIL_REDACT_HPP_

#include <string>
#include <vector>

namespace onair::util {

inline constexpr std::size_t kDefaultVisibleSecretChars = 4;

// Replaces all but the last `visible` characters with '*'.
// Secrets not longer than `visible` render as "****" so their length is not
// disclosed either.
std::string MaskSecret(const std::string& secret,
                       std::size_t visible = kDefaultVisibleSecretChars);

// Returns a copy of `args` where every occurrence of `secret` inside an
// argument is replaced by its masked form. Empty secret returns args as-is.
std::vector<std::string> RedactArguments(const std::vector<std::string>& args,
                                         const std::string& secret);

// Shell-ish single line for log output ("ffmpeg -re -i 'a b.mp4' ...").
// Does not redact; pass RedactArguments() output.
std::string JoinArguments(const std::vector<std::string>& args);

}  // namespace onair::util

#endif  // ONAIR_UTIL_REDACT_HPP_
