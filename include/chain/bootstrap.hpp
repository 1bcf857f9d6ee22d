// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_processor.hpp"
#include "chain/block_sink.hpp"
#include "chain/chain_monitor.hpp"
#include "util/uint.hpp"
#include <optional>
#include <string>
#include <vector>

namespace watchtower {
namespace chain {

// Last tip a consumer processed before the previous shutdown
struct ConsumerCheckpoint {
  std::string name;
  std::optional<uint256> last_known_tip; // Absent on first run
  BlockSink *sink{nullptr};
};

struct ReconcileResult {
  std::string name;
  bool reconciled{false}; // False if the consumer had no checkpoint
  uint256 last_common_ancestor;
  // Blocks to replay, oldest first
  std::vector<uint256> missed_blocks;
  std::vector<std::string> dropped_txids;
};

/**
 * BootstrapReconciler - Catches consumers up after downtime
 *
 * For every consumer with a checkpoint, finds the last common ancestor of
 * its last known tip and the node's best chain, and the blocks mined since.
 * Consumers with the same checkpoint share one computation.
 *
 * Replay must happen before ChainMonitor::MonitorChain():
 * - identical missed lists are replayed through the monitor (Enqueue)
 * - otherwise each list is pushed straight into its consumer's sink, and the
 *   monitor is seeded with the tip the walks ended at
 */
class BootstrapReconciler {
public:
  BootstrapReconciler(BlockProcessor &block_processor, ChainMonitor &monitor);

  // Compute only. Throws ReconcileError, NODE_UNAVAILABLE also when the
  // node reorged while the walks ran.
  std::vector<ReconcileResult>
  Reconcile(const std::vector<ConsumerCheckpoint> &checkpoints);

  // Compute and replay. Throws ReconcileError or LifecycleError.
  std::vector<ReconcileResult>
  Run(const std::vector<ConsumerCheckpoint> &checkpoints);

  // Node tip the last Reconcile() walked to, if any consumer had a
  // checkpoint
  std::optional<uint256> GetTarget() const { return target_; }

private:
  void Replay(const std::vector<ConsumerCheckpoint> &checkpoints,
              const std::vector<ReconcileResult> &results);

  BlockProcessor &block_processor_;
  ChainMonitor &monitor_;
  std::optional<uint256> target_;
};

} // namespace chain
} // namespace watchtower
