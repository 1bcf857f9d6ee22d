// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <nlohmann/json.hpp>

namespace watchtower {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  // from_chars also rejects leading whitespace and '+'
  const char* first = str.data();
  const char* last = str.data() + str.size();
  int value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<std::chrono::seconds> SafeParseSeconds(const std::string& str,
                                                     int max_seconds) {
  auto value = SafeParseInt(str, 1, max_seconds);
  if (!value) {
    return std::nullopt;
  }
  return std::chrono::seconds(*value);
}

std::optional<uint256> SafeParseHash(const std::string& str) {
  if (str.size() != 2 * uint256::size()) {
    return std::nullopt;
  }
  bool all_hex = std::all_of(str.begin(), str.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  });
  if (!all_hex) {
    return std::nullopt;
  }
  return uint256S(str);
}

std::string JsonError(const std::string& message) {
  nlohmann::json reply;
  reply["error"] = message;
  return reply.dump() + "\n";
}

} // namespace util
} // namespace watchtower
