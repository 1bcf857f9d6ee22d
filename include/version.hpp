// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace watchtower {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 1;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Watchtower developers";

inline std::string GetFullVersionString() {
  return "Watchtower version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // mainnet
constexpr const char *RED = "\033[1;31m";   // testnet, signet
constexpr const char *GREEN = "\033[1;32m"; // regtest
} // namespace colors

// Startup banner with the bitcoind network being watched
inline std::string GetStartupBanner(const std::string &network) {
  const char *color = colors::RESET;
  if (network == "mainnet") {
    color = colors::BLUE;
  } else if (network == "testnet" || network == "signet") {
    color = colors::RED;
  } else if (network == "regtest") {
    color = colors::GREEN;
  }

  const std::string rule(49, '-');
  auto line = [](const std::string &text) {
    std::string out = "| " + text;
    if (out.size() < 48) {
      out += std::string(48 - out.size(), ' ');
    }
    return out + "|\n";
  };

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "+" + rule.substr(1, 47) + "+\n";
  banner += line("");
  banner += line("   W A T C H T O W E R");
  banner += line("   Bitcoin chain-tip monitor");
  banner += line("");
  banner += "+" + rule.substr(1, 47) + "+\n";
  banner += line("Version: " + GetVersionString());
  banner += line("Network: " + network);
  banner += line(GetCopyrightString());
  banner += "+" + rule.substr(1, 47) + "+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace watchtower
