// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_sink.hpp"
#include "chain/tip_store.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

namespace watchtower {
namespace app {

// CheckpointConsumer - Downstream block consumer (watcher, responder)
// Drains its queue on a worker thread and records every processed hash as
// its last known tip in the TipStore.
class CheckpointConsumer {
public:
  CheckpointConsumer(std::string name, chain::TipStore &store);
  ~CheckpointConsumer();

  CheckpointConsumer(const CheckpointConsumer &) = delete;
  CheckpointConsumer &operator=(const CheckpointConsumer &) = delete;

  void Start();

  // Finish what is queued, then stop the worker
  void Stop();

  const std::string &name() const { return name_; }
  chain::BlockQueue &queue() { return queue_; }
  size_t processed() const { return processed_.load(); }
  bool IsRunning() const { return running_.load(); }

private:
  void Run();

  static constexpr std::chrono::milliseconds POP_TIMEOUT{100};

  std::string name_;
  chain::TipStore &store_;
  chain::BlockQueue queue_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> processed_{0};
  std::thread worker_;
};

} // namespace app
} // namespace watchtower
