// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/threadsafe_containers.hpp"
#include "util/uint.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace watchtower {
namespace chain {

/**
 * TipStateTracker - Decides which observed tips are novel
 *
 * Holds the current tip and a bounded window of recently superseded tips.
 * A hash is novel when it is neither the current tip nor in the window.
 * Novel hashes become the current tip and are appended to the pending
 * queue; the previous tip moves into the window.
 *
 * The novelty check, tip update and queue append happen under one lock, so
 * two producers reporting the same hash concurrently result in exactly one
 * append.
 */
class TipStateTracker {
public:
  TipStateTracker(util::ThreadSafeQueue<uint256> &pending, size_t window_size);

  // Returns true if the hash was novel and queued
  // Always false once Close() has been called
  bool Enqueue(const uint256 &hash);

  // Set the current tip without queueing anything
  void Seed(const uint256 &hash);

  // Reject all further enqueues
  void Close();

  bool IsClosed() const;
  std::optional<uint256> GetTip() const;

  // Superseded tips, oldest first
  std::vector<uint256> GetWindow() const;
  bool InWindow(const uint256 &hash) const;
  size_t WindowCapacity() const { return window_size_; }

private:
  bool IsKnownLocked(const uint256 &hash) const;
  void AdvanceLocked(const uint256 &hash);

  mutable std::mutex mutex_;
  util::ThreadSafeQueue<uint256> &pending_;
  const size_t window_size_;
  std::optional<uint256> current_;
  std::deque<uint256> window_;
  bool closed_{false};
};

} // namespace chain
} // namespace watchtower
