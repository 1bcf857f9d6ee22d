// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#include "chain/block_processor.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace watchtower {
namespace chain {

const char *ReconcileErrorKindName(ReconcileErrorKind kind) {
  switch (kind) {
  case ReconcileErrorKind::NO_COMMON_ANCESTOR:
    return "no-common-ancestor";
  case ReconcileErrorKind::NODE_UNAVAILABLE:
    return "node-unavailable";
  }
  return "unknown";
}

BlockProcessor::BlockProcessor(BlockSource &source) : source_(source) {}

std::optional<uint256> BlockProcessor::GetBestBlockHash() {
  try {
    return source_.GetBestBlockHash();
  } catch (const NodeQueryError &e) {
    LOG_CHAIN_WARN("Could not get the best block hash: {}", e.what());
    return std::nullopt;
  }
}

std::optional<BlockInfo> BlockProcessor::GetBlock(const uint256 &hash) {
  try {
    return source_.GetBlock(hash);
  } catch (const NodeQueryError &e) {
    LOG_CHAIN_WARN("Could not get block {}: {}", hash.GetHex(), e.what());
    return std::nullopt;
  }
}

BlockInfo BlockProcessor::FetchBlock(const uint256 &hash) {
  std::optional<BlockInfo> block;
  try {
    block = source_.GetBlock(hash);
  } catch (const NodeQueryError &e) {
    throw ReconcileError(ReconcileErrorKind::NODE_UNAVAILABLE,
                         "could not get block " + hash.GetHex() + ": " +
                             e.what());
  }
  if (!block) {
    throw ReconcileError(ReconcileErrorKind::NO_COMMON_ANCESTOR,
                         "block " + hash.GetHex() + " is unknown to the node");
  }
  return *block;
}

CommonAncestor BlockProcessor::FindLastCommonAncestor(const uint256 &last_known) {
  CommonAncestor result;
  BlockInfo block = FetchBlock(last_known);

  while (!block.InBestChain()) {
    result.dropped_txids.insert(result.dropped_txids.end(), block.txids.begin(),
                                block.txids.end());
    if (!block.prev_hash) {
      throw ReconcileError(ReconcileErrorKind::NO_COMMON_ANCESTOR,
                           "reached genesis walking back from " +
                               last_known.GetHex());
    }
    block = FetchBlock(*block.prev_hash);
  }

  result.ancestor = block.hash;
  LOG_CHAIN_DEBUG("Last common ancestor of {} is {} ({} dropped txs)",
                  last_known.GetHex(), result.ancestor.GetHex(),
                  result.dropped_txids.size());
  return result;
}

std::vector<uint256> BlockProcessor::GetMissedBlocks(const uint256 &ancestor) {
  uint256 best;
  try {
    best = source_.GetBestBlockHash();
  } catch (const NodeQueryError &e) {
    throw ReconcileError(ReconcileErrorKind::NODE_UNAVAILABLE,
                         std::string("could not get the best block hash: ") +
                             e.what());
  }
  return GetMissedBlocks(ancestor, best);
}

std::vector<uint256> BlockProcessor::GetMissedBlocks(const uint256 &ancestor,
                                                     const uint256 &target) {
  std::vector<uint256> missed;
  if (target == ancestor) {
    return missed;
  }

  const int ancestor_height = FetchBlock(ancestor).height;
  uint256 current = target;

  while (current != ancestor) {
    BlockInfo block = FetchBlock(current);
    // Passed the ancestor's height without meeting it: the best chain
    // moved since the ancestor was found
    if (block.height <= ancestor_height || !block.prev_hash) {
      throw ReconcileError(ReconcileErrorKind::NODE_UNAVAILABLE,
                           "block " + ancestor.GetHex() +
                               " is not an ancestor of " + target.GetHex() +
                               ", best chain changed");
    }
    missed.push_back(current);
    current = *block.prev_hash;
  }

  std::reverse(missed.begin(), missed.end());
  return missed;
}

bool BlockProcessor::IsOnBestChain(const uint256 &hash) {
  return FetchBlock(hash).InBestChain();
}

} // namespace chain
} // namespace watchtower
