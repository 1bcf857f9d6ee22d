// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/threadsafe_containers.hpp"
#include "util/uint.hpp"
#include <chrono>
#include <optional>

namespace watchtower {
namespace chain {

// BlockSink - anything that accepts block hash notifications
// The chain monitor only ever appends; how and when the hashes are consumed
// is up to the downstream component. Implementations must be thread-safe.
class BlockSink {
public:
  virtual ~BlockSink() = default;

  virtual void Push(const uint256 &block_hash) = 0;
};

// BlockQueue - FIFO sink drained by a downstream worker thread
class BlockQueue : public BlockSink {
public:
  void Push(const uint256 &block_hash) override { queue_.Push(block_hash); }

  template <typename Rep, typename Period>
  std::optional<uint256> WaitAndPop(std::chrono::duration<Rep, Period> timeout) {
    return queue_.WaitAndPop(timeout);
  }

  size_t Size() const { return queue_.Size(); }
  bool Empty() const { return queue_.Empty(); }

private:
  util::ThreadSafeQueue<uint256> queue_;
};

} // namespace chain
} // namespace watchtower
