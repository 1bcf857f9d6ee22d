// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_processor.hpp"
#include "chain/block_sink.hpp"
#include "chain/tip_state.hpp"
#include "network/tip_feed.hpp"
#include "util/threadsafe_containers.hpp"
#include "util/uint.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace watchtower {
namespace chain {

enum class MonitorPhase { IDLE, LISTENING, ACTIVE, TERMINATED };

const char *MonitorPhaseName(MonitorPhase phase);

// Thrown when a lifecycle method is called in the wrong phase
class LifecycleError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

struct ChainMonitorConfig {
  std::chrono::milliseconds polling_interval{std::chrono::seconds(60)};
  size_t window_size{10};
  // Upper bound on how long the notifier waits before re-checking the phase
  std::chrono::milliseconds notify_timeout{100};
  // Back-off after the feed reports an error
  std::chrono::milliseconds feed_retry_delay{std::chrono::seconds(1)};
};

/**
 * ChainMonitor - Detects new best tips and delivers them in order
 *
 * Two producers report tips:
 * - poller: asks the node for its best tip every polling_interval
 * - feed reader: receives hashblock notifications from the TipFeed
 *
 * Both go through one TipStateTracker, so each novel tip is queued exactly
 * once. The notifier pops the pending queue and appends every hash to all
 * sinks, in queue order.
 *
 * Lifecycle: IDLE -> LISTENING -> ACTIVE -> TERMINATED
 * - MonitorChain(): IDLE -> LISTENING, producers start, nothing delivered
 * - Activate(): LISTENING -> ACTIVE, notifier starts
 * - Terminate(): any -> TERMINATED, pending hashes are dropped
 */
class ChainMonitor {
public:
  // sinks must be non-empty and outlive the monitor
  ChainMonitor(std::vector<BlockSink *> sinks, BlockProcessor &block_processor,
               std::unique_ptr<network::TipFeed> feed,
               const ChainMonitorConfig &config = ChainMonitorConfig{});
  ~ChainMonitor();

  ChainMonitor(const ChainMonitor &) = delete;
  ChainMonitor &operator=(const ChainMonitor &) = delete;

  // Seeds the current tip from the node (unless already set) and starts
  // the poller and feed reader. Throws LifecycleError unless IDLE.
  void MonitorChain();

  // Starts delivering to sinks. Throws LifecycleError unless LISTENING.
  void Activate();

  // Stops everything. Idempotent. Once it returns, no sink receives
  // another hash and Enqueue() returns false.
  void Terminate() noexcept;

  // Wait for the worker threads to exit. Call after Terminate().
  void Join();

  // Submit a tip as if a producer had observed it
  // Returns true if it was novel and queued
  bool Enqueue(const uint256 &hash);

  // Set the current tip without queueing it. Throws LifecycleError unless
  // IDLE.
  void SeedTip(const uint256 &hash);

  // Make the poller query the node now instead of at the next interval
  void WakePoller();

  MonitorPhase GetPhase() const;
  std::optional<uint256> GetBestTip() const { return tracker_.GetTip(); }
  std::vector<uint256> GetLastTips() const { return tracker_.GetWindow(); }
  size_t WindowCapacity() const { return tracker_.WindowCapacity(); }
  size_t PendingCount() const { return pending_.Size(); }

private:
  void PollingLoop();
  void FeedLoop();
  void NotifyLoop();
  void NotifySubscribers(const uint256 &hash);
  bool IsTerminated() const;

  std::vector<BlockSink *> sinks_;
  BlockProcessor &block_processor_;
  std::unique_ptr<network::TipFeed> feed_;
  const ChainMonitorConfig config_;

  util::ThreadSafeQueue<uint256> pending_;
  TipStateTracker tracker_;

  // Guards phase_ and wake_requested_; held for the whole of each fan-out
  mutable std::mutex phase_mutex_;
  std::condition_variable phase_cv_;
  MonitorPhase phase_{MonitorPhase::IDLE};
  bool wake_requested_{false};

  std::thread poll_thread_;
  std::thread feed_thread_;
  std::thread notify_thread_;
};

} // namespace chain
} // namespace watchtower
