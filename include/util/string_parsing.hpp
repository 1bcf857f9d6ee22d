// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace watchtower {
namespace util {

/*
 Parsers for command-line flags and bitcoind/RPC fields.
 The whole input must be consumed; any error yields std::nullopt.
*/

// Decimal integer in [min, max]. No sign other than '-', no whitespace.
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// TCP port, 1-65535
std::optional<uint16_t> SafeParsePort(const std::string& str);

// Whole seconds in [1, max_seconds], e.g. --btcrpctimeout, --pollinginterval
std::optional<std::chrono::seconds> SafeParseSeconds(const std::string& str,
                                                     int max_seconds);

// Block hash as bitcoind prints it: exactly 64 hex digits, either case
std::optional<uint256> SafeParseHash(const std::string& str);

// {"error":"<message>"} plus newline, the control socket's error reply
std::string JsonError(const std::string& message);

} // namespace util
} // namespace watchtower
