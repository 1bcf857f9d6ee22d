// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace watchtower {
namespace chain {

// Thrown by a BlockSource when the node cannot be queried (connection
// refused, timeout, malformed reply, RPC-level error).
class NodeQueryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Block data as reported by the full node
struct BlockInfo {
  uint256 hash;
  std::optional<uint256> prev_hash; // Absent for genesis
  int height{0};
  // Confirmations on the node's best chain, -1 if the block is stale
  int confirmations{0};
  std::vector<std::string> txids;

  bool InBestChain() const { return confirmations != -1; }
};

// BlockSource - Abstract interface to the full node
// Allows dependency injection of different implementations:
// - rpc::BitcoindClient: bitcoind JSON-RPC over HTTP
// - FakeBlockSource: in-memory chain for testing (in test/)
class BlockSource {
public:
  virtual ~BlockSource() = default;

  // Hash of the node's current best tip
  // Throws NodeQueryError if the node cannot be queried
  virtual uint256 GetBestBlockHash() = 0;

  // Block by hash, std::nullopt if the node does not know it
  // Throws NodeQueryError if the node cannot be queried
  virtual std::optional<BlockInfo> GetBlock(const uint256 &hash) = 0;
};

} // namespace chain
} // namespace watchtower
