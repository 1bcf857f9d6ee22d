// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace watchtower {
namespace test {

// Deterministic, distinct block hash for n
inline uint256 TestHash(uint32_t n) {
  char hex[65];
  std::snprintf(hex, sizeof(hex), "%056x%08x", 0xabcdefu, n);
  return uint256S(hex);
}

// Pop everything currently queued, front first
template <typename Queue>
std::vector<uint256> Drain(Queue &queue) {
  std::vector<uint256> items;
  while (auto item = queue.WaitAndPop(std::chrono::milliseconds(0))) {
    items.push_back(*item);
  }
  return items;
}

// Poll pred until it holds or timeout expires
template <typename Pred>
bool WaitUntil(Pred pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace test
} // namespace watchtower
