// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_source.hpp"
#include "util/uint.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace watchtower {
namespace chain {

enum class ReconcileErrorKind {
  NO_COMMON_ANCESTOR, // Walk reached genesis or an unknown block
  NODE_UNAVAILABLE    // The node could not be queried
};

const char *ReconcileErrorKindName(ReconcileErrorKind kind);

class ReconcileError : public std::runtime_error {
public:
  ReconcileError(ReconcileErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ReconcileErrorKind kind() const { return kind_; }

private:
  ReconcileErrorKind kind_;
};

struct CommonAncestor {
  uint256 ancestor;
  // Transactions of the stale blocks walked over, newest block first
  std::vector<std::string> dropped_txids;
};

// BlockProcessor - Chain queries on top of a BlockSource
// GetBestBlockHash() never throws, the reconciliation walks throw
// ReconcileError.
class BlockProcessor {
public:
  explicit BlockProcessor(BlockSource &source);

  // Current best tip, std::nullopt if the node could not be queried
  std::optional<uint256> GetBestBlockHash();

  // Block by hash, std::nullopt if unknown or the node could not be queried
  std::optional<BlockInfo> GetBlock(const uint256 &hash);

  // Walk back from last_known until a block on the node's best chain
  CommonAncestor FindLastCommonAncestor(const uint256 &last_known);

  // Blocks after ancestor up to the node's current best tip, oldest first
  std::vector<uint256> GetMissedBlocks(const uint256 &ancestor);

  // Blocks after ancestor up to target, oldest first. Throws
  // NODE_UNAVAILABLE if target does not descend from ancestor.
  std::vector<uint256> GetMissedBlocks(const uint256 &ancestor,
                                       const uint256 &target);

  // Throws ReconcileError if the node cannot answer
  bool IsOnBestChain(const uint256 &hash);

private:
  BlockInfo FetchBlock(const uint256 &hash);

  BlockSource &source_;
};

} // namespace chain
} // namespace watchtower
