// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#ifndef WATCHTOWER_VERSION_HPP
#define WATCHTOWER_VERSION_HPP

#include <string>

namespace watchtower {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Watchtower developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "watchtowerd version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// One-line startup banner, role is "tower" or "user"
inline std::string GetStartupBanner(const std::string &role) {
  return "watchtowerd " + GetVersionString() + " (" + role + " mode) - " +
         GetCopyrightString();
}

} // namespace watchtower

#endif // WATCHTOWER_VERSION_HPP
