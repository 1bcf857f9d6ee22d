// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/bootstrap.hpp"
#include "util/logging.hpp"
#include <map>

namespace watchtower {
namespace chain {

BootstrapReconciler::BootstrapReconciler(BlockProcessor &block_processor,
                                         ChainMonitor &monitor)
    : block_processor_(block_processor), monitor_(monitor) {}

std::vector<ReconcileResult>
BootstrapReconciler::Reconcile(const std::vector<ConsumerCheckpoint> &checkpoints) {
  std::vector<ReconcileResult> results;
  target_.reset();

  // One ancestor walk per distinct checkpoint
  std::map<uint256, ReconcileResult> by_tip;
  for (const auto &checkpoint : checkpoints) {
    if (checkpoint.last_known_tip && !by_tip.count(*checkpoint.last_known_tip)) {
      CommonAncestor common =
          block_processor_.FindLastCommonAncestor(*checkpoint.last_known_tip);
      ReconcileResult computed;
      computed.reconciled = true;
      computed.last_common_ancestor = common.ancestor;
      computed.dropped_txids = std::move(common.dropped_txids);
      by_tip.emplace(*checkpoint.last_known_tip, std::move(computed));
    }
  }

  if (by_tip.empty()) {
    for (const auto &checkpoint : checkpoints) {
      LOG_CHAIN_INFO("{}: no checkpoint, nothing to reconcile",
                     checkpoint.name);
      ReconcileResult result;
      result.name = checkpoint.name;
      results.push_back(std::move(result));
    }
    return results;
  }

  // Read after the walks so a reorg during them is caught below
  auto best = block_processor_.GetBestBlockHash();
  if (!best) {
    throw ReconcileError(ReconcileErrorKind::NODE_UNAVAILABLE,
                         "could not get the best block hash");
  }

  for (auto &[tip, computed] : by_tip) {
    computed.missed_blocks =
        block_processor_.GetMissedBlocks(computed.last_common_ancestor, *best);
  }

  // Every ancestor lies below best, so this also covers a reorg after the
  // best block hash was read
  if (!block_processor_.IsOnBestChain(*best)) {
    throw ReconcileError(ReconcileErrorKind::NODE_UNAVAILABLE,
                         "best chain changed during reconciliation");
  }
  target_ = *best;

  for (const auto &checkpoint : checkpoints) {
    ReconcileResult result;
    result.name = checkpoint.name;

    if (!checkpoint.last_known_tip) {
      LOG_CHAIN_INFO("{}: no checkpoint, nothing to reconcile",
                     checkpoint.name);
      results.push_back(std::move(result));
      continue;
    }

    const uint256 &tip = *checkpoint.last_known_tip;
    result = by_tip.at(tip);
    result.name = checkpoint.name;

    LOG_CHAIN_INFO("{}: last known tip {}, common ancestor {}, {} missed "
                   "blocks, {} dropped txs",
                   checkpoint.name, tip.GetHex(),
                   result.last_common_ancestor.GetHex(),
                   result.missed_blocks.size(), result.dropped_txids.size());
    results.push_back(std::move(result));
  }

  return results;
}

std::vector<ReconcileResult>
BootstrapReconciler::Run(const std::vector<ConsumerCheckpoint> &checkpoints) {
  if (monitor_.GetPhase() != MonitorPhase::IDLE) {
    throw LifecycleError(
        std::string("Bootstrap reconciliation called in phase ") +
        MonitorPhaseName(monitor_.GetPhase()));
  }
  for (const auto &checkpoint : checkpoints) {
    if (!checkpoint.sink) {
      throw std::invalid_argument("consumer '" + checkpoint.name +
                                  "' has no sink");
    }
  }

  auto results = Reconcile(checkpoints);
  Replay(checkpoints, results);
  return results;
}

void BootstrapReconciler::Replay(const std::vector<ConsumerCheckpoint> &checkpoints,
                                 const std::vector<ReconcileResult> &results) {
  if (!target_) {
    return;
  }

  bool identical = !results.empty();
  for (const auto &result : results) {
    if (!result.reconciled ||
        result.missed_blocks != results.front().missed_blocks) {
      identical = false;
      break;
    }
  }

  if (identical && !results.front().missed_blocks.empty()) {
    LOG_CHAIN_INFO("Replaying {} missed blocks to all consumers",
                   results.front().missed_blocks.size());
    for (const auto &hash : results.front().missed_blocks) {
      if (!monitor_.Enqueue(hash)) {
        LOG_CHAIN_WARN("Missed block {} was already queued", hash.GetHex());
      }
    }
  } else {
    for (size_t i = 0; i < results.size(); ++i) {
      const auto &result = results[i];
      if (result.missed_blocks.empty()) {
        continue;
      }
      LOG_CHAIN_INFO("{}: replaying {} missed blocks", result.name,
                     result.missed_blocks.size());
      for (const auto &hash : result.missed_blocks) {
        checkpoints[i].sink->Push(hash);
      }
    }
  }

  // Later tips are then detected live
  if (!monitor_.GetBestTip()) {
    monitor_.SeedTip(*target_);
  }
}

} // namespace chain
} // namespace watchtower
